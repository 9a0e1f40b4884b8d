#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "stagefmt/formatters/stagefmt_formatter_command.hpp"
#include "stagefmt/stagefmt_app.hpp"
#include "stagefmt/stagefmt_config.hpp"
#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/stagefmt_options.hpp"
#include "stagefmt/stagefmt_version.hpp"
#include "stagefmt/vcs/stagefmt_vcs_git.hpp"

namespace stagefmt::detail
{
    namespace metavars
    {
        constexpr auto file = "FILE";
        constexpr auto directory = "DIR";
        constexpr auto suffix = "SUFFIX";
        constexpr auto command = "COMMAND";
        constexpr auto program = "PROGRAM";
    }
}

int main(const int argc, const char* argv[])
{
    using namespace stagefmt;

    spdlog::set_default_logger(spdlog::stderr_color_mt(STAGEFMT_NAME));
    spdlog::set_pattern("%l: %v");

    argparse::ArgumentParser arg_parser {
        STAGEFMT_NAME,
        STAGEFMT_VERSION,
    };

    constexpr auto description =
        "Pre-commit hook checking the formatting of staged files, reformatting them and blocking the commit when needed";

    constexpr auto epilog =
        "The token {files} in a command expands to the files to operate on, e.g.\n"
        "  --check \"rustfmt --check {files}\"\n"
        "  --fix \"rustfmt {files}\"";

    arg_parser.add_description(description);
    arg_parser.add_epilog(epilog);

    arg_parser
        .add_argument("-c", "--config")
        .help("Configuration file to use, defaults to .stagefmt.yml in the working directory when it exists")
        .metavar(detail::metavars::file)
        .default_value(std::string {});

    arg_parser
        .add_argument("-C", "--directory")
        .help("Directory to run in instead of the current directory")
        .metavar(detail::metavars::directory)
        .default_value(std::string {});

    arg_parser
        .add_argument("-s", "--suffix")
        .help("Suffix of staged files to check")
        .metavar(detail::metavars::suffix)
        .default_value(std::vector<std::string> {})
        .append();

    arg_parser
        .add_argument("--check")
        .help("Command checking the formatting of one file")
        .metavar(detail::metavars::command);

    arg_parser
        .add_argument("--fix")
        .help("Command reformatting files in place")
        .metavar(detail::metavars::command);

    arg_parser
        .add_argument("--git")
        .help("Git program to query staged files with")
        .metavar(detail::metavars::program);

    arg_parser
        .add_argument("-n", "--no-fix")
        .help("Report unformatted files without reformatting them")
        .default_value(false)
        .implicit_value(true);

    arg_parser
        .add_argument("-d", "--debug")
        .help("Enable debug output")
        .default_value(false)
        .implicit_value(true);

    try
    {
        arg_parser.parse_args(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        std::cout << arg_parser;
        return to_exit_code(stagefmt_error_code::invalid);
    }

    stagefmt_options options {
        .config = arg_parser.get<std::string>("--config"),
        .directory = arg_parser.get<std::string>("--directory"),
        .suffixes = arg_parser.get<std::vector<std::string>>("--suffix"),
        .check = arg_parser.present<std::string>("--check"),
        .fix = arg_parser.present<std::string>("--fix"),
        .git = arg_parser.present<std::string>("--git"),
        .no_fix = arg_parser.get<bool>("--no-fix"),
        .debug = arg_parser.get<bool>("--debug"),
    };

    if (options.debug)
    {
        spdlog::set_level(spdlog::level::debug);
    }

    try
    {
        stagefmt_config config = make_config(options);

        auto vcs = std::make_unique<stagefmt_vcs_git>(config.git);
        auto formatter = std::make_unique<stagefmt_formatter_command>(config);

        stagefmt_app app {
            options.directory,
            std::move(config),
            std::move(vcs),
            std::move(formatter),
        };

        return to_exit_code(to_error_code(app.run()));
    }
    catch (const stagefmt_error& e)
    {
        SPDLOG_ERROR("{}", e.what());
        return to_exit_code(e.error_code);
    }
    catch (const std::exception& e)
    {
        SPDLOG_ERROR("failed to run stagefmt: {}", e.what());
        return to_exit_code(stagefmt_error_code::unknown);
    }
}

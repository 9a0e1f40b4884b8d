#include "stagefmt/formatters/stagefmt_formatter_command.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

#include "spdlog/spdlog.h"

#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/utils/processes.hpp"
#include "stagefmt/utils/strings.hpp"

namespace stagefmt
{
    namespace detail
    {
        std::vector<std::string> resolve_command(std::vector<std::string> command)
        {
            if (command.empty())
            {
                throw stagefmt_error(stagefmt_error_code::configuring, "formatter command is empty");
            }

            const std::optional<std::filesystem::path> program = processes::find_program(command.front());
            if (!program.has_value())
            {
                throw stagefmt_error(stagefmt_error_code::formatter_not_found, "formatter not found, program={}", command.front());
            }

            command.front() = program->string();
            return command;
        }
    }

    stagefmt_formatter_command::stagefmt_formatter_command(const stagefmt_config& config)
        : suffixes(config.suffixes),
          check_command(strings::split_words(config.check)),
          fix_command(strings::split_words(config.fix)),
          unformatted_exit_codes(config.unformatted_exit_codes)
    {
    }

    bool stagefmt_formatter_command::can_format_file(const std::string_view file) const
    {
        return strings::ends_with_any(file, suffixes);
    }

    bool stagefmt_formatter_command::check_file(const std::string_view file, stagefmt_check_status& status)
    {
        const std::vector<std::string> files {std::string(file)};
        const std::vector<std::string> command = detail::resolve_command(expand_command(check_command, files));

        processes::process_result result;
        if (!processes::run(command, result))
        {
            SPDLOG_DEBUG("formatter check could not be spawned, path={}", file);
            return false;
        }

        if (result.exit_status == 0)
        {
            status = stagefmt_check_status::conforming;
            return true;
        }

        if (std::ranges::find(unformatted_exit_codes, result.exit_status) != unformatted_exit_codes.end())
        {
            SPDLOG_DEBUG("formatter check reported differences, path={} output={}", file, result.out);
            status = stagefmt_check_status::unformatted;
            return true;
        }

        strings::trim(result.err);
        SPDLOG_ERROR("formatter check failed, path={} status={} error={}", file, result.exit_status, result.err);
        return false;
    }

    bool stagefmt_formatter_command::format_files(const std::vector<std::string>& files)
    {
        if (files.empty())
        {
            return true;
        }

        const std::vector<std::string> command = detail::resolve_command(expand_command(fix_command, files));

        processes::process_result result;
        if (!processes::run(command, result))
        {
            SPDLOG_DEBUG("formatter could not be spawned, files={}", strings::join(",", files));
            return false;
        }

        if (result.exit_status != 0)
        {
            strings::trim(result.err);
            SPDLOG_ERROR("formatter failed, files={} status={} error={}", strings::join(",", files), result.exit_status, result.err);
            return false;
        }

        return true;
    }

    std::vector<std::string> stagefmt_formatter_command::expand_command(const std::vector<std::string>& command, const std::vector<std::string>& files)
    {
        std::vector<std::string> arguments;
        arguments.reserve(command.size() + files.size());

        bool has_files_token = false;
        for (const std::string& argument : command)
        {
            if (argument == files_token)
            {
                arguments.insert(arguments.end(), files.begin(), files.end());
                has_files_token = true;
            }
            else
            {
                arguments.emplace_back(argument);
            }
        }

        if (!has_files_token)
        {
            arguments.insert(arguments.end(), files.begin(), files.end());
        }

        return arguments;
    }
}

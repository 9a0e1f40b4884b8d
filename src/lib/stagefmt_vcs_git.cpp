#include "stagefmt/vcs/stagefmt_vcs_git.hpp"

#include <filesystem>
#include <optional>
#include <utility>

#include "spdlog/spdlog.h"

#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/utils/processes.hpp"
#include "stagefmt/utils/strings.hpp"

namespace stagefmt
{
    stagefmt_vcs_git::stagefmt_vcs_git(std::string program)
        : program(std::move(program))
    {
    }

    bool stagefmt_vcs_git::root_directory(std::string& directory)
    {
        std::string output;
        if (!run_git({"rev-parse", "--show-toplevel"}, output))
        {
            return false;
        }

        strings::trim(output);
        directory = std::move(output);
        return !directory.empty();
    }

    bool stagefmt_vcs_git::list_staged_files(std::vector<std::string>& files)
    {
        // lowercase filter excludes staged deletions
        std::string output;
        if (!run_git({"diff", "--cached", "--name-only", "--diff-filter=d", "-z"}, output))
        {
            return false;
        }

        files = strings::split(output, '\0');
        return true;
    }

    bool stagefmt_vcs_git::run_git(const std::vector<std::string>& arguments, std::string& output) const
    {
        const std::optional<std::filesystem::path> git = processes::find_program(program);
        if (!git.has_value())
        {
            throw stagefmt_error(stagefmt_error_code::vcs_not_found, "git not found, program={}", program);
        }

        std::vector<std::string> command {git->string()};
        command.insert(command.end(), arguments.begin(), arguments.end());

        processes::process_result result;
        if (!processes::run(command, result))
        {
            SPDLOG_DEBUG("git could not be spawned, program={}", program);
            return false;
        }

        if (result.exit_status != 0)
        {
            strings::trim(result.err);
            SPDLOG_ERROR("git failed, command={} status={} error={}", strings::join(" ", arguments), result.exit_status, result.err);
            return false;
        }

        output = std::move(result.out);
        return true;
    }
}

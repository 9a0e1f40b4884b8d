#pragma once

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "process.hpp"
#include "spdlog/spdlog.h"

#include "stagefmt/utils/strings.hpp"

namespace stagefmt::processes
{
    struct process_result
    {
        int exit_status = 0;
        std::string out;
        std::string err;
    };

    namespace detail
    {
        inline bool is_executable(const std::filesystem::path& path)
        {
            std::error_code error;
            const std::filesystem::file_status status = std::filesystem::status(path, error);

            if (error || !std::filesystem::is_regular_file(status))
            {
                return false;
            }

            constexpr auto exec_perms = std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec;
            return (status.permissions() & exec_perms) != std::filesystem::perms::none;
        }
    }

    /**
     * Resolves a program the way a shell would. Names containing a separator are taken relative to the
     * current directory, bare names are searched through the PATH environment variable.
     */
    inline std::optional<std::filesystem::path> find_program(const std::string_view program)
    {
        if (program.empty())
        {
            return std::nullopt;
        }

        if (program.find('/') != std::string_view::npos)
        {
            std::filesystem::path path = std::filesystem::absolute(program).lexically_normal();
            return detail::is_executable(path) ? std::optional(std::move(path)) : std::nullopt;
        }

        const char* env_path = std::getenv("PATH");
        if (env_path == nullptr)
        {
            return std::nullopt;
        }

        std::string_view directories = env_path;
        while (true)
        {
            const std::size_t separator = directories.find(':');
            const std::string_view directory = directories.substr(0, separator);

            // an empty entry is the current directory
            std::filesystem::path path = directory.empty() ? std::filesystem::current_path() / program : std::filesystem::path(directory) / program;
            if (detail::is_executable(path))
            {
                return path.lexically_normal();
            }

            if (separator == std::string_view::npos)
            {
                break;
            }

            directories.remove_prefix(separator + 1);
        }

        return std::nullopt;
    }

    /**
     * Runs the given arguments to completion in the current directory, capturing both output streams.
     * Returns false if the process could not be spawned.
     */
    inline bool run(const std::vector<std::string>& arguments, process_result& result)
    {
        result = process_result {};

        if (arguments.empty())
        {
            return false;
        }

        SPDLOG_DEBUG("running process, command={}", strings::join(" ", arguments));

        const auto read_stdout = [&](const char* bytes, const std::size_t size) { result.out.append(bytes, size); };
        const auto read_stderr = [&](const char* bytes, const std::size_t size) { result.err.append(bytes, size); };

        TinyProcessLib::Process process {arguments, std::string(), read_stdout, read_stderr};

        if (process.get_id() <= 0)
        {
            SPDLOG_DEBUG("failed to spawn process, program={}", arguments.front());
            return false;
        }

        result.exit_status = process.get_exit_status();

        SPDLOG_DEBUG("process exited, program={} status={}", arguments.front(), result.exit_status);
        return true;
    }
}

#pragma once

#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "stagefmt/formatters/stagefmt_formatter.hpp"
#include "stagefmt/misc/current_path_scope.hpp"
#include "stagefmt/misc/defer.hpp"
#include "stagefmt/stagefmt_config.hpp"
#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/utils/strings.hpp"
#include "stagefmt/vcs/stagefmt_vcs.hpp"

namespace stagefmt
{
    enum class stagefmt_result
    {
        clean,
        reformatted,
        unformatted,
    };

    // reformatted and unformatted both block the commit
    constexpr stagefmt_error_code to_error_code(const stagefmt_result result)
    {
        return result == stagefmt_result::clean ? stagefmt_error_code::none : stagefmt_error_code::blocked;
    }

    namespace detail
    {
        template <typename func_t, typename end_func_t>
        void run_timed(func_t&& func, end_func_t&& end_func)
        {
            const auto then = std::chrono::steady_clock::now();
            const auto finally = [&] {
                const auto now = std::chrono::steady_clock::now();
                const std::chrono::duration<std::float_t> duration = now - then;
                end_func(duration.count());
            };

            defer defer = finally;
            func();
        }
    }

    struct stagefmt_app
    {
        std::string directory;
        stagefmt_config config;
        std::unique_ptr<stagefmt_vcs> vcs;
        std::unique_ptr<stagefmt_formatter> formatter;

        stagefmt_app(const std::string& in_directory, stagefmt_config in_config, std::unique_ptr<stagefmt_vcs> in_vcs, std::unique_ptr<stagefmt_formatter> in_formatter)
            : directory(in_directory.empty() ? std::string() : std::filesystem::absolute(in_directory).string()),
              config(std::move(in_config)),
              vcs(std::move(in_vcs)),
              formatter(std::move(in_formatter))
        {
        }

        stagefmt_result run()
        {
            try
            {
                current_path_scope directory_scope {directory};
                return run_in_directory();
            }
            catch (const std::filesystem::filesystem_error& e)
            {
                throw stagefmt_error(stagefmt_error_code::io, "failed to enter directory, directory={} error={}", directory, e.code().message());
            }
        }

        stagefmt_result run_in_directory()
        {

            std::string root;
            if (!vcs->root_directory(root))
            {
                throw stagefmt_error(stagefmt_error_code::vcs, "failed to resolve repository root, directory={}", std::filesystem::current_path().string());
            }

            current_path_scope root_scope {root};

            const std::vector<std::string> files = list_files();
            if (files.empty())
            {
                SPDLOG_DEBUG("no staged files to check, suffixes={}", strings::join(",", config.suffixes));
                return stagefmt_result::clean;
            }

            const std::vector<std::string> unformatted_files = check_files(files);
            if (unformatted_files.empty())
            {
                SPDLOG_DEBUG("staged files are formatted, count={}", files.size());
                return stagefmt_result::clean;
            }

            if (!config.fix_files)
            {
                SPDLOG_WARN("staged files are not formatted, files={}", strings::join(" ", unformatted_files));
                return stagefmt_result::unformatted;
            }

            SPDLOG_WARN("reformatting staged files, stage them again and commit, files={}", strings::join(" ", unformatted_files));
            format_files(unformatted_files);
            return stagefmt_result::reformatted;
        }

        std::vector<std::string> list_files() const
        {
            std::vector<std::string> staged_files;
            if (!vcs->list_staged_files(staged_files))
            {
                throw stagefmt_error(stagefmt_error_code::vcs, "failed to list staged files");
            }

            std::vector<std::string> files;
            files.reserve(staged_files.size());

            for (std::string& staged_file : staged_files)
            {
                if (formatter->can_format_file(staged_file))
                {
                    files.emplace_back(std::move(staged_file));
                }
            }

            SPDLOG_DEBUG("staged files listed, staged={} matching={}", staged_files.size(), files.size());
            return files;
        }

        std::vector<std::string> check_files(const std::vector<std::string>& files) const
        {
            std::vector<std::string> unformatted_files;

            const auto action = [&] {
                for (const std::string& file : files)
                {
                    stagefmt_check_status status = stagefmt_check_status::conforming;
                    if (!formatter->check_file(file, status))
                    {
                        throw stagefmt_error(stagefmt_error_code::formatter_failed, "failed to check file, file={}", file);
                    }

                    if (status == stagefmt_check_status::unformatted)
                    {
                        unformatted_files.emplace_back(file);
                    }
                }
            };

            const auto finally = [&](std::float_t duration) {
                SPDLOG_DEBUG("check completed, count={} unformatted={} duration={:.3f}s", files.size(), unformatted_files.size(), duration);
            };

            detail::run_timed(action, finally);
            return unformatted_files;
        }

        void format_files(const std::vector<std::string>& files) const
        {
            const auto action = [&] {
                if (!formatter->format_files(files))
                {
                    throw stagefmt_error(stagefmt_error_code::formatter_failed, "failed to reformat files, files={}", files);
                }
            };

            const auto finally = [&](std::float_t duration) {
                SPDLOG_DEBUG("reformat completed, count={} duration={:.3f}s", files.size(), duration);
            };

            detail::run_timed(action, finally);
        }
    };
}

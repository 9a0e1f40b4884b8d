#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "stagefmt/stagefmt_error.hpp"
#include "stagefmt/stagefmt_options.hpp"
#include "stagefmt/utils/files.hpp"
#include "stagefmt/utils/json.hpp"

namespace stagefmt
{
    namespace defaults
    {
        constexpr auto config = ".stagefmt.yml";
        constexpr auto suffix = ".rs";
        constexpr auto check = "cargo fmt --check -- {files} --config skip_children=true";
        constexpr auto fix = "cargo fmt -- {files}";
        constexpr auto git = "git";
        constexpr int unformatted_exit_code = 1;
    }

    struct stagefmt_config
    {
        std::vector<std::string> suffixes {defaults::suffix};
        std::string check {defaults::check};
        std::string fix {defaults::fix};
        std::string git {defaults::git};
        std::vector<int> unformatted_exit_codes {defaults::unformatted_exit_code};
        bool fix_files = true;
    };

    inline void from_json(const nlohmann::json& json, stagefmt_config& value)
    {
        if (json.is_null())
        {
            return;
        }

        if (!json.is_object())
        {
            throw stagefmt_error(stagefmt_error_code::configuring, "configuration must be a map, type={}", json.type_name());
        }

        std::int32_t version = 1;
        json::get(json, "version", version);

        switch (version)
        {
            case 1: {
                if (json.contains("suffixes"))
                {
                    const nlohmann::json& suffixes = json["suffixes"];
                    if (suffixes.is_string())
                    {
                        value.suffixes = {suffixes.get<std::string>()};
                    }
                    else
                    {
                        suffixes.get_to(value.suffixes);
                    }
                }

                json::get(json, "check", value.check);
                json::get(json, "fix", value.fix);
                json::get(json, "git", value.git);
                json::get(json, "unformatted_exit_codes", value.unformatted_exit_codes);
                json::get(json, "fix_files", value.fix_files);
                break;
            }

            default: {
                throw stagefmt_error(stagefmt_error_code::configuring, "unknown configuration version {}", version);
            }
        }
    }

    /**
     * Builds the effective configuration: built-in defaults, then the configuration file if any, then the
     * command line. A missing default configuration file is not an error, a missing explicit one is.
     */
    inline stagefmt_config make_config(const stagefmt_options& options)
    {
        stagefmt_config config;

        const std::filesystem::path config_path = options.config.empty() ? std::filesystem::path(options.directory) / defaults::config : std::filesystem::path(options.config);
        const std::string config_file = config_path.string();

        if (std::filesystem::exists(config_path))
        {
            nlohmann::json config_json;
            if (!files::read_file(config_file, config_json))
            {
                throw stagefmt_error(stagefmt_error_code::configuring, "invalid config, file={}", config_file);
            }

            try
            {
                config = config_json;
            }
            catch (const nlohmann::json::exception& e)
            {
                throw stagefmt_error(stagefmt_error_code::configuring, "invalid config, file={} error={}", config_file, e.what());
            }

            SPDLOG_DEBUG("configuration loaded, file={}", config_file);
        }
        else if (!options.config.empty())
        {
            throw stagefmt_error(stagefmt_error_code::io, "config not found, file={}", config_file);
        }

        if (!options.suffixes.empty())
        {
            config.suffixes = options.suffixes;
        }

        if (options.check.has_value())
        {
            config.check = options.check.value();
        }

        if (options.fix.has_value())
        {
            config.fix = options.fix.value();
        }

        if (options.git.has_value())
        {
            config.git = options.git.value();
        }

        if (options.no_fix)
        {
            config.fix_files = false;
        }

        if (config.suffixes.empty())
        {
            throw stagefmt_error(stagefmt_error_code::configuring, "at least one suffix is required");
        }

        return config;
    }
}

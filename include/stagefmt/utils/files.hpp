#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

#include "stagefmt/utils/yaml.hpp"

namespace stagefmt::files
{
    namespace detail
    {
        enum class json_file_type
        {
            none,
            json,
            yaml,
        };

        inline json_file_type get_json_type(std::string_view path)
        {
            constexpr std::string_view json_exts[] {".json"};
            constexpr std::string_view yaml_exts[] {".yml", ".yaml"};

            std::string ext = std::filesystem::path(path).extension().string();
            const auto predicate = [&](std::string_view json_ext) { return json_ext == ext; };

            if (std::any_of(std::begin(json_exts), std::end(json_exts), predicate))
            {
                return json_file_type::json;
            }

            if (std::any_of(std::begin(yaml_exts), std::end(yaml_exts), predicate))
            {
                return json_file_type::yaml;
            }

            return json_file_type::none;
        }

        inline bool create_directories(std::string_view path)
        {
            std::filesystem::path parent = std::filesystem::path(path).parent_path();

            if (!parent.empty() && !std::filesystem::exists(parent) && !std::filesystem::create_directories(parent))
            {
                return false;
            }

            return true;
        }
    }

    inline bool write_file(std::string_view path, const std::string& content)
    {
        if (!detail::create_directories(path))
        {
            return false;
        }

        std::ofstream stream {std::string(path)};
        stream << content;
        stream.close();
        return !stream.bad();
    }

    inline bool read_file(std::string_view path, std::string& content)
    {
        std::ifstream stream {std::string(path)};
        if (!stream.is_open())
        {
            return false;
        }

        std::stringstream string;
        string << stream.rdbuf();
        content = string.str();
        return !stream.bad();
    }

    inline bool read_file(std::string_view path, nlohmann::json& json)
    {
        json = nlohmann::json(nlohmann::json::value_t::discarded);
        switch (detail::get_json_type(path))
        {
            case detail::json_file_type::json: {
                std::string value;
                if (read_file(path, value))
                {
                    json = nlohmann::json::parse(value, nullptr, false, false);
                }

                break;
            }

            case detail::json_file_type::yaml: {
                std::string value;
                if (read_file(path, value))
                {
                    json = yaml::from_yaml(value);
                }

                break;
            }

            default: {
                break;
            }
        }

        return !json.is_discarded();
    }
}

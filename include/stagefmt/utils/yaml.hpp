#pragma once

#include <cmath>
#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "yaml-cpp/yaml.h"

namespace stagefmt::yaml
{
    namespace detail
    {
        inline nlohmann::json parse_scalar(const YAML::Node& node)
        {
            // quoted scalars are tagged "!" and always stay strings
            if (node.Tag() == "!")
                return node.Scalar();

            bool b;
            if (YAML::convert<bool>::decode(node, b))
                return b;

            std::int64_t i;
            if (YAML::convert<std::int64_t>::decode(node, i))
                return i;

            std::double_t d;
            if (YAML::convert<std::double_t>::decode(node, d))
                return d;

            std::string s;
            if (YAML::convert<std::string>::decode(node, s))
                return s;

            return nullptr;
        }

        inline nlohmann::json from_yaml(const YAML::Node& yaml)
        {
            switch (yaml.Type())
            {
                case YAML::NodeType::Null: {
                    return nlohmann::json(nlohmann::json::value_t::null);
                }

                case YAML::NodeType::Scalar: {
                    return parse_scalar(yaml);
                }

                case YAML::NodeType::Sequence: {
                    nlohmann::json json = nlohmann::json::array();
                    for (auto&& node : yaml)
                    {
                        json.emplace_back(from_yaml(node));
                    }

                    return json;
                }

                case YAML::NodeType::Map: {
                    nlohmann::json json = nlohmann::json::object();
                    for (auto&& pair : yaml)
                    {
                        json[pair.first.as<std::string>()] = from_yaml(pair.second);
                    }

                    return json;
                }

                default: {
                    return nlohmann::json(nlohmann::json::value_t::discarded);
                }
            }
        }
    }

    inline nlohmann::json from_yaml(const std::string& value)
    {
        try
        {
            const YAML::Node yaml = YAML::Load(value);
            return detail::from_yaml(yaml);
        }
        catch (const YAML::Exception& e)
        {
            SPDLOG_DEBUG("invalid YAML, error={}", e.what());
            return nlohmann::json(nlohmann::json::value_t::discarded);
        }
    }
}

#pragma once

#include <string_view>

#include "nlohmann/json.hpp"

namespace stagefmt::json
{
    template <typename value_t>
    bool get(const nlohmann::json& json, const std::string_view key, value_t& value)
    {
        if (json.is_object() && json.contains(key))
        {
            json[key].get_to(value);
            return true;
        }

        return false;
    }
}

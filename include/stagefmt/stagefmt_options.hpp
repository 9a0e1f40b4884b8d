#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stagefmt
{
    struct stagefmt_options
    {
        std::string config;
        std::string directory;
        std::vector<std::string> suffixes;
        std::optional<std::string> check;
        std::optional<std::string> fix;
        std::optional<std::string> git;
        bool no_fix : 1 = false;
        bool debug : 1 = false;
    };
}

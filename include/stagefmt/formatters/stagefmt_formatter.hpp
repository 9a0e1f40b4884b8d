#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace stagefmt
{
    enum class stagefmt_check_status
    {
        conforming,
        unformatted,
    };

    struct stagefmt_formatter
    {
        virtual ~stagefmt_formatter() = default;
        [[nodiscard]] virtual bool can_format_file(const std::string_view file) const = 0;
        [[nodiscard]] virtual bool check_file(const std::string_view file, stagefmt_check_status& status) = 0;
        [[nodiscard]] virtual bool format_files(const std::vector<std::string>& files) = 0;
    };
}

#pragma once

#include <format>
#include <stdexcept>

namespace stagefmt
{
    enum class stagefmt_error_code
    {
        none,
        blocked,
        unknown,
        invalid,
        io,
        configuring,
        vcs,
        vcs_not_found,
        formatter_not_found,
        formatter_failed,
    };

    struct stagefmt_error final : std::runtime_error
    {
        stagefmt_error_code error_code;

        template <typename... args_t>
        constexpr stagefmt_error(const stagefmt_error_code error_code, const std::format_string<args_t...> format, args_t&&... args)
            : std::runtime_error(std::format(format, std::forward<args_t>(args)...)),
              error_code(error_code)
        {
        }
    };

    constexpr int to_exit_code(const stagefmt_error_code error_code)
    {
        return static_cast<int>(error_code);
    }
}

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "stagefmt/formatters/stagefmt_formatter.hpp"
#include "stagefmt/stagefmt_config.hpp"

namespace stagefmt
{
    /**
     * Formatter backed by an external program. Commands are argument lists in which the "{files}" token
     * expands to the files to operate on; files are appended when the token is absent.
     */
    struct stagefmt_formatter_command final : stagefmt_formatter
    {
        static constexpr std::string_view files_token = "{files}";

        std::vector<std::string> suffixes;
        std::vector<std::string> check_command;
        std::vector<std::string> fix_command;
        std::vector<int> unformatted_exit_codes;

        explicit stagefmt_formatter_command(const stagefmt_config& config);

        bool can_format_file(const std::string_view file) const override;
        bool check_file(const std::string_view file, stagefmt_check_status& status) override;
        bool format_files(const std::vector<std::string>& files) override;

        static std::vector<std::string> expand_command(const std::vector<std::string>& command, const std::vector<std::string>& files);
    };
}

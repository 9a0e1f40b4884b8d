#pragma once

#include <algorithm>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace stagefmt::strings
{
    constexpr std::string_view whitespaces = " \t\r\n";

    template <typename container_t, typename projection_t = std::identity>
    std::string join(const std::string_view separator, const container_t& values, const projection_t& projection = {})
    {
        std::string string;
        for (const auto& value : values)
        {
            string += projection(value);
            string += separator;
        }

        if (string.size() >= separator.size())
        {
            string.resize(string.size() - separator.size());
        }

        return string;
    }

    template <typename string_t>
    void trim_start(string_t& value, const std::string_view chars = whitespaces)
    {
        const std::size_t index = value.find_first_not_of(chars);
        value = value.substr(std::min(index, value.size()));
    }

    template <typename string_t>
    void trim_end(string_t& value, const std::string_view chars = whitespaces)
    {
        const std::size_t index = value.find_last_not_of(chars);
        value = value.substr(0, index != string_t::npos ? index + 1 : 0);
    }

    template <typename string_t>
    void trim(string_t& value, const std::string_view chars = whitespaces)
    {
        trim_start(value, chars);
        trim_end(value, chars);
    }

    /**
     * Splits the input on every occurrence of the delimiter, skipping empty tokens.
     */
    inline std::vector<std::string> split(const std::string_view input, const char delimiter)
    {
        std::vector<std::string> tokens;
        std::size_t begin = 0;

        while (begin < input.size())
        {
            std::size_t end = input.find(delimiter, begin);
            if (end == std::string_view::npos)
            {
                end = input.size();
            }

            if (end > begin)
            {
                tokens.emplace_back(input.substr(begin, end - begin));
            }

            begin = end + 1;
        }

        return tokens;
    }

    /**
     * Splits the input on runs of whitespaces, skipping empty tokens.
     */
    inline std::vector<std::string> split_words(const std::string_view input)
    {
        std::vector<std::string> tokens;
        std::size_t begin = input.find_first_not_of(whitespaces);

        while (begin != std::string_view::npos)
        {
            const std::size_t end = input.find_first_of(whitespaces, begin);
            tokens.emplace_back(input.substr(begin, end != std::string_view::npos ? end - begin : std::string_view::npos));
            begin = end != std::string_view::npos ? input.find_first_not_of(whitespaces, end) : end;
        }

        return tokens;
    }

    inline bool ends_with_any(const std::string_view value, const std::vector<std::string>& suffixes)
    {
        const auto predicate = [&](const std::string& suffix) {
            return !suffix.empty() && value.ends_with(suffix);
        };

        return std::ranges::any_of(suffixes, predicate);
    }
}

template <typename string_t>
struct std::formatter<std::vector<string_t>> : formatter<std::string>
{
    auto format(const std::vector<string_t>& values, format_context& ctx) const
    {
        using namespace stagefmt;
        std::string result = "[" + strings::join(",", values) + "]";
        return formatter<std::string>::format(std::move(result), ctx);
    }
};

#pragma once

#include <functional>
#include <optional>
#include <utility>

namespace stagefmt
{
    template <typename func_t>
    struct defer
    {
        defer(defer&&) noexcept = delete;
        defer& operator=(defer&&) noexcept = delete;

        defer(const defer&) noexcept = delete;
        defer& operator=(const defer&) noexcept = delete;

        defer(func_t func)
            : _func(std::move(func))
        {
        }

        ~defer() noexcept
        {
            reset();
        }

        void reset()
        {
            if (_func.has_value())
            {
                std::invoke(_func.value());
            }

            _func.reset();
        }

      private:
        std::optional<func_t> _func;
    };
}

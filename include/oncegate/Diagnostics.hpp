// -----------------------------------------------------------------------------
//  Copyright (c) 2024 Tamas Kovacs
//  Licensed under the MIT License – see LICENSE.txt for details.
// -----------------------------------------------------------------------------

#ifndef ONCE_GATE_DIAGNOSTICS_HPP
#define ONCE_GATE_DIAGNOSTICS_HPP

#ifdef ONCEGATE_DIAGNOSTICS

#include <source_location>
#include <cstdio>
#include <cstdlib>
#include <concepts>
#include <format>
#include <type_traits>
#include <utility>

namespace oncegate { namespace detail {

    namespace impl {
        [[noreturn]] inline void panicImpl(const char* msg) noexcept
        {
            std::fputs(msg, stderr);
            std::fflush(stderr);
            std::abort();
        }
    } // namespace impl

    // Captures the call site together with the
    // compile time checked format string.
    template <typename... Args>
    struct FormatStringLog
    {
        template <typename StringT>
            requires std::constructible_from<std::format_string<Args...>, StringT>
        consteval FormatStringLog(StringT string, std::source_location loc = std::source_location::current())
        : formatString{string}
        , location{loc}
        {
        }

        std::format_string<Args...> formatString;
        std::source_location        location;
    };

    // Use std::type_identity_t to prevent type deduction
    // based on the FormatStringLog class.
    template <typename... Args>
    [[noreturn]] inline void panic(FormatStringLog<std::type_identity_t<Args>...> fmt, Args&&... args) noexcept
    {
        auto buffer = std::format("oncegate: Func: {}, line: {} \"{}\"\n",
                                  fmt.location.function_name(),
                                  fmt.location.line(),
                                  std::format(fmt.formatString, std::forward<Args>(args)...));

        impl::panicImpl(buffer.c_str());
    }

}} // namespace oncegate::detail

#define ONCEGATE_ASSERT(expr) (static_cast<bool>(expr) ? void(0) : oncegate::detail::panic("ONCEGATE_ASSERT! ({})", #expr))
#define ONCEGATE_PANIC(...) oncegate::detail::panic(__VA_ARGS__)
#else
#define ONCEGATE_ASSERT(expr) void(0)
#define ONCEGATE_PANIC(...)

#endif // ONCEGATE_DIAGNOSTICS

#endif // ONCE_GATE_DIAGNOSTICS_HPP

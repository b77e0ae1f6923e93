/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_COMMON_ERROR_HPP
#define BLOBSYNC_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#   endif
#endif
#include <fmt/core.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace blobsync {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    template<typename T>
    concept not_an_exception = !std::is_base_of_v<std::exception, std::decay_t<T>>;

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);

        template<not_an_exception A, typename ...Args>
        explicit error(fmt::format_string<A, Args...> fmt, A &&a, Args&&... args):
            error { std::string_view { fmt::format(fmt, std::forward<A>(a), std::forward<Args>(args)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);

        template<not_an_exception A, typename ...Args>
        explicit error_sys(fmt::format_string<A, Args...> fmt, A &&a, Args&&... args):
            error_sys { std::string_view { fmt::format(fmt, std::forward<A>(a), std::forward<Args>(args)...) } }
        {
        }
    };
}

#endif // !BLOBSYNC_COMMON_ERROR_HPP

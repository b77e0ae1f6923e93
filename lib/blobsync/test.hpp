/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_TEST_HPP
#define BLOBSYNC_TEST_HPP

#include <filesystem>
#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <blobsync/common/format.hpp>
#include <blobsync/file.hpp>

namespace blobsync {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", std::span<const uint8_t> { t });
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, typename Y>
    bool test_same(const std::string_view name, const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    // A fresh directory under the system's temporary directory, removed with its content on destruction.
    struct test_dir {
        explicit test_dir(const std::string_view name):
            _path { file::unique_path(std::filesystem::temp_directory_path(), fmt::format("blobsync-{}", name)) }
        {
            std::filesystem::create_directories(_path);
        }

        test_dir(const test_dir &) =delete;

        ~test_dir()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }

        const std::filesystem::path &path() const
        {
            return _path;
        }

        std::filesystem::path operator/(const std::string_view rel) const
        {
            return _path / rel;
        }
    private:
        std::filesystem::path _path;
    };
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<blobsync::test_printer>> {};

#endif // !BLOBSYNC_TEST_HPP

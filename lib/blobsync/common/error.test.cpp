/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#include <cerrno>
#include <optional>
#include <source_location>
#include <blobsync/test.hpp>

using namespace blobsync;

template<typename F>
inline void expect_throws_msg(const F &f, const std::initializer_list<std::string> &matches, const std::source_location &src_loc=std::source_location::current())
{
    expect(boost::ut::throws<error>(f)) << "no exception has been thrown";
    std::optional<std::string> msg {};
    try {
        f();
    } catch (error &ex) {
        msg = ex.what();
    }
    expect((bool)msg) << "exception message is empty";
    if (msg) {
        for (const auto &match: matches) {
            expect(msg->find(match) != msg->npos) << fmt::format("'{}' does not contain '{}' from {}:{}", *msg, match, src_loc.file_name(), src_loc.line());
        }
    }
}

template<typename F>
inline void expect_throws_msg(const F &f, const std::string &match, const std::source_location &src_loc=std::source_location::current())
{
    expect_throws_msg(f, { match }, src_loc);
}

suite common_error_suite = [] {
    "common::error"_test = [] {
        "no_args"_test = [] {
            auto f = [] { throw error("Hello!"); };
            expect_throws_msg(f, "Hello!");
        };
        "integers"_test = [] {
            auto f = [] { throw error("Hello {}!", 123); };
            expect_throws_msg(f, "Hello 123!");
        };
        "string"_test = [] {
            auto f = [&] { throw error("Hello {}!", "world"); };
            expect_throws_msg(f, "Hello world!");
        };
        "bytes"_test = [] {
            const std::array<uint8_t, 4> buf { 0xDE, 0xAD, 0xBE, 0xEF };
            auto f = [&] { throw error("Hello {}!", std::span<const uint8_t> { buf }); };
            expect_throws_msg(f, "Hello deadbeef!");
        };
        "nested"_test = [] {
            auto f = [] {
                try {
                    throw error("inner {}", 1);
                } catch (const std::exception &ex) {
                    throw error("outer", ex);
                }
            };
            expect_throws_msg(f, { "outer caused by", "inner 1" });
        };
        "error_sys_fail"_test = [] {
            auto f = [&] { errno = 2; throw error_sys("Hello {}!", "world"); };
            expect_throws_msg(f, "Hello world! errno: 2 strerror: No such file or directory");
        };
    };
};

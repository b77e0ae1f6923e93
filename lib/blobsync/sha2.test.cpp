/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/sha2.hpp>
#include <blobsync/test.hpp>

using namespace blobsync;

suite sha2_suite = [] {
    "sha2"_test = [] {
        "empty"_test = [] {
            test_same(std::string { "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" }, sha2::to_hex(sha2::digest(std::string_view {})));
        };
        "abc"_test = [] {
            test_same(std::string { "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" }, sha2::to_hex(sha2::digest(std::string_view { "abc" })));
        };
        "incremental matches one-shot"_test = [] {
            const std::string data(100'000, 'x');
            sha2::hasher h {};
            const std::string_view sv { data };
            for (size_t off = 0; off < sv.size(); off += 4096) {
                const auto chunk = sv.substr(off, 4096);
                h.update(std::span { reinterpret_cast<const uint8_t *>(chunk.data()), chunk.size() });
            }
            expect(h.finalize() == sha2::digest(sv));
        };
        "finalize once"_test = [] {
            sha2::hasher h {};
            h.finalize();
            expect(throws([&] { h.finalize(); }));
            expect(throws([&] { h.update(std::span<const uint8_t> {}); }));
        };
    };
};

/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/cas.hpp>
#include <blobsync/test.hpp>

using namespace blobsync;

namespace {
    const std::string abc_hex { "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" };

    size_t count_files(const std::filesystem::path &dir)
    {
        size_t n = 0;
        for (const auto &e: std::filesystem::recursive_directory_iterator(dir)) {
            if (e.is_regular_file())
                ++n;
        }
        return n;
    }
}

suite cas_suite = [] {
    "cas"_test = [] {
        "oid"_test = [] {
            const auto id = cas::oid::from_hex(abc_hex);
            test_same(abc_hex, id.hex());
            test_same(abc_hex, fmt::format("{}", id));
            expect(id == cas::oid::from_hash(sha2::digest(std::string_view { "abc" })));
            expect(cas::oid::valid(abc_hex));
            expect(!cas::oid::valid(abc_hex.substr(1)));
            expect(!cas::oid::valid("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
            expect(!cas::oid::valid("../../../../../../../../../../../../../../../../../../etc/passwd00"));
            expect(throws([] { cas::oid::from_hex("xyz"); }));
        };
        "locate"_test = [] {
            const test_dir dir { "cas-locate" };
            const cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            const auto p = store.locate(id);
            expect(p == store.root() / "objects" / "ba" / "78" / abc_hex) << p.string();
            expect(!store.exists(id));
        };
        "write and open"_test = [] {
            const test_dir dir { "cas-write" };
            cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            file::memory_source src { std::string_view { "abc" } };
            test_same(uint64_t { 3 }, store.write(id, src));
            expect(store.exists(id));
            test_same(uint64_t { 3 }, store.size(id));
            test_same(std::string { "abc" }, file::read_string(store.locate(id).string()));
            expect(store.verify(id));
            auto is = store.open(id);
            test_same(uint64_t { 3 }, is.size());
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "write is idempotent"_test = [] {
            const test_dir dir { "cas-idempotent" };
            cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            for (size_t i = 0; i < 3; ++i) {
                file::memory_source src { std::string_view { "abc" } };
                store.write(id, src);
            }
            test_same(size_t { 1 }, count_files(store.root() / "objects"));
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "integrity mismatch leaves nothing"_test = [] {
            const test_dir dir { "cas-mismatch" };
            cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            file::memory_source src { std::string_view { "abd" } };
            expect(throws<error_integrity>([&] { store.write(id, src); }));
            expect(!store.exists(id));
            test_same(size_t { 0 }, count_files(store.root() / "objects"));
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "missing objects"_test = [] {
            const test_dir dir { "cas-missing" };
            const cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            expect(throws<error_not_found>([&] { store.size(id); }));
            expect(throws<error_not_found>([&] { store.open(id); }));
        };
        "staging teardown"_test = [] {
            const test_dir dir { "cas-staging" };
            cas::store store { dir.path() };
            std::filesystem::path staged {};
            {
                auto st = store.stage();
                staged = st.path();
                st.write(std::span<const uint8_t> { reinterpret_cast<const uint8_t *>("abc"), 3 });
                expect(std::filesystem::exists(staged));
            }
            expect(!std::filesystem::exists(staged));
            auto st = store.stage();
            st.teardown();
            st.teardown();
            expect(!std::filesystem::exists(st.path()));
            expect(throws([&] { st.commit(); }));
        };
        "commit computes the oid"_test = [] {
            const test_dir dir { "cas-commit" };
            cas::store store { dir.path() };
            auto st = store.stage();
            file::memory_source src { std::string_view { "abc" } };
            test_same(uint64_t { 3 }, st.write_all(src));
            const auto id = st.commit();
            test_same(abc_hex, id.hex());
            expect(st.committed());
            expect(store.exists(id));
            expect(throws([&] { st.commit(); }));
        };
        "corrupted objects fail verification"_test = [] {
            const test_dir dir { "cas-verify" };
            cas::store store { dir.path() };
            const auto id = cas::oid::from_hex(abc_hex);
            file::memory_source src { std::string_view { "abc" } };
            store.write(id, src);
            file::write(store.locate(id).string(), std::string_view { "abd" });
            expect(!store.verify(id));
        };
        "stale staging cleanup"_test = [] {
            const test_dir dir { "cas-stale" };
            cas::store store { dir.path() };
            file::write((store.staging_dir() / "crashed.tmp").string(), std::string_view { "partial" });
            test_same(size_t { 0 }, store.remove_stale_staging(std::chrono::seconds { 3600 }));
            test_same(size_t { 1 }, store.remove_stale_staging(std::chrono::seconds { 0 }));
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
    };
};

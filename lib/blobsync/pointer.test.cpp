/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/pointer.hpp>
#include <blobsync/test.hpp>

using namespace blobsync;

namespace {
    const std::string abc_hex { "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" };
    const std::string abc_stub { "version https://git-lfs.github.com/spec/v1\n"
        "oid sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\n"
        "size 3\n" };

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

suite pointer_suite = [] {
    "pointer"_test = [] {
        "encode"_test = [] {
            const pointer p { cas::oid::from_hex(abc_hex), 3 };
            test_same(abc_stub, p.encode());
        };
        "decode"_test = [] {
            const auto p = pointer::decode(abc_stub);
            test_same(abc_hex, p.oid.hex());
            test_same(uint64_t { 3 }, p.size);
            test_same(std::string { pointer::version_latest }, p.version);
            test_same(abc_stub, p.encode());
        };
        "decode without a trailing newline"_test = [] {
            const auto p = pointer::decode(std::string_view { abc_stub }.substr(0, abc_stub.size() - 1));
            test_same(uint64_t { 3 }, p.size);
        };
        "legacy versions"_test = [] {
            for (const auto *ver: { "https://hawser.github.com/spec/v1", "http://git-media.io/v/2" }) {
                const auto text = fmt::format("version {}\noid sha256:{}\nsize 3\n", ver, abc_hex);
                const auto p = pointer::decode(text);
                test_same(abc_stub, p.encode());
            }
        };
        "malformed"_test = [] {
            expect(throws([] { pointer::decode(""); }));
            expect(throws([] { pointer::decode("hello world\n"); }));
            expect(throws([] { pointer::decode("version https://example.com/v9\noid sha256:" + abc_hex + "\nsize 3\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\nsize 3\noid sha256:" + abc_hex + "\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\noid sha256:" + abc_hex + "\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\noid sha256:" + abc_hex + "\nsize -3\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\noid md5:" + abc_hex + "\nsize 3\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\noid sha256:abc\nsize 3\n"); }));
            expect(throws([] { pointer::decode("version https://git-lfs.github.com/spec/v1\noid sha256:" + abc_hex + "\nsize 3\nzzz 1\n"); }));
            expect(throws([] { pointer::decode(std::string(pointer::max_size + 1, 'x')); }));
        };
        "try_decode"_test = [] {
            expect(static_cast<bool>(pointer::try_decode(abc_stub)));
            expect(!pointer::try_decode("just some text"));
        };
        "clean and smudge"_test = [] {
            const test_dir dir { "pointer-clean" };
            cas::store store { dir / "store" };
            const std::string content(200'000, 'z');
            file::memory_source src { std::string_view { content } };
            uint64_t last_so_far = 0;
            size_t num_calls = 0;
            auto res = clean(store, src, "big.bin", content.size(), [&](const uint64_t total, const uint64_t so_far, const size_t) {
                test_same(uint64_t { content.size() }, total);
                expect(so_far > last_so_far);
                last_so_far = so_far;
                ++num_calls;
            });
            test_same(uint64_t { content.size() }, res.ptr.size);
            test_same(sha2::to_hex(sha2::digest(content)), res.ptr.oid.hex());
            test_same(uint64_t { content.size() }, last_so_far);
            expect(num_calls >= 2_u);
            expect(store.exists(res.ptr.oid));
            res.teardown();

            auto is = smudge(store, res.ptr.oid);
            test_same(uint64_t { content.size() }, is.size());
            const auto out_path = (dir / "out.bin").string();
            {
                file::write_stream os { out_path };
                test_same(uint64_t { content.size() }, smudge_to(store, res.ptr, os));
            }
            test_same(content, file::read_string(out_path));
        };
        "clean is deterministic"_test = [] {
            const test_dir dir { "pointer-deterministic" };
            cas::store store { dir.path() };
            file::memory_source src1 { std::string_view { "same content" } };
            file::memory_source src2 { std::string_view { "same content" } };
            const auto res1 = clean(store, src1, "a.txt", 12);
            const auto res2 = clean(store, src2, "b.txt", 12);
            test_same(res1.ptr.encode(), res2.ptr.encode());
            test_same(size_t { 1 }, count_files(store.root() / "objects"));
        };
        "clean releases staging"_test = [] {
            const test_dir dir { "pointer-staging" };
            cas::store store { dir.path() };
            {
                file::memory_source src { std::string_view { "abc" } };
                const auto res = clean(store, src, "abc.txt", 3);
            }
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "smudge missing"_test = [] {
            const test_dir dir { "pointer-smudge-missing" };
            const cas::store store { dir.path() };
            expect(throws<error_not_found>([&] { smudge(store, cas::oid::from_hex(abc_hex)); }));
        };
        "smudge size mismatch"_test = [] {
            const test_dir dir { "pointer-smudge-size" };
            cas::store store { dir.path() };
            file::memory_source src { std::string_view { "abc" } };
            const auto res = clean(store, src, "abc.txt", 3);
            const pointer wrong { res.ptr.oid, 4 };
            file::write_stream os { (dir / "out.bin").string() };
            expect(throws<error_integrity>([&] { smudge_to(store, wrong, os); }));
        };
        "reconcile"_test = [] {
            const test_dir dir { "pointer-reconcile" };
            cas::store store { dir / "store" };
            const auto id = cas::oid::from_hex(abc_hex);
            const auto work = dir / "abc.txt";

            // the object is missing and the working copy matches
            file::write(work.string(), std::string_view { "abc" });
            expect(nothrow([&] { reconcile(store, id, work); }));
            expect(store.exists(id));

            // the object is present, the working copy is not consulted
            file::write(work.string(), std::string_view { "modified" });
            expect(nothrow([&] { reconcile(store, id, work); }));

            // the object is missing and the working copy does not match
            const test_dir dir2 { "pointer-reconcile-mismatch" };
            cas::store store2 { dir2.path() };
            std::optional<std::string> msg {};
            try {
                reconcile(store2, id, work);
            } catch (const error_integrity &ex) {
                msg = ex.what();
            }
            expect(static_cast<bool>(msg));
            if (msg) {
                expect(msg->find(abc_hex) != std::string::npos) << *msg;
                expect(msg->find(work.string()) != std::string::npos) << *msg;
            }
            expect(!store2.exists(id));
            test_same(size_t { 0 }, count_files(store2.staging_dir()));
        };
        "reconcile without a working copy"_test = [] {
            const test_dir dir { "pointer-reconcile-missing" };
            cas::store store { dir.path() };
            expect(throws<error_sys>([&] { reconcile(store, cas::oid::from_hex(abc_hex), dir / "missing.txt"); }));
        };
    };
};

/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/test.hpp>
#include <blobsync/transfer/remote-mock.hpp>
#include <blobsync/transfer/transferable.hpp>

using namespace blobsync;
using namespace blobsync::transfer;

namespace {
    size_t count_files(const std::filesystem::path &dir)
    {
        size_t n = 0;
        for (const auto &e: std::filesystem::recursive_directory_iterator(dir)) {
            if (e.is_regular_file())
                ++n;
        }
        return n;
    }

    cas::oid store_content(cas::store &store, const std::string_view content)
    {
        file::memory_source src { content };
        return clean(store, src, "content", content.size()).ptr.oid;
    }

    std::string test_content(const size_t size, const char seed)
    {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i)
            data[i] = static_cast<char>(seed + i * 7);
        return data;
    }
}

suite transfer_transferable_suite = [] {
    "transfer::transferable"_test = [] {
        "upload"_test = [] {
            const test_dir dir { "transferable-upload" };
            cas::store store { dir / "store" };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto content = test_content(20'000, 'a');
            file::write((dir / "data.bin").string(), std::string_view { content });
            const auto id = store_content(store, content);

            const auto up = uploadable::make(store, remote, id, "data.bin", dir.path());
            test_same(id.hex(), up->oid().hex());
            test_same(uint64_t { content.size() }, up->size());
            test_same(std::string { "data.bin" }, up->name());
            expect(up->dir() == direction::upload);
            expect(!up->object());
            expect(up->describe().find("data.bin") != std::string::npos) << up->describe();

            up->check(auth);
            expect(static_cast<bool>(up->object()));
            uint64_t last = 0;
            size_t num_chunks = 0;
            up->transfer([&](const uint64_t total, const uint64_t so_far, const size_t chunk) {
                test_same(uint64_t { content.size() }, total);
                test_same(last + chunk, so_far);
                last = so_far;
                ++num_chunks;
            });
            test_same(uint64_t { content.size() }, last);
            expect(num_chunks >= 1_u);
            expect(remote.has(id.hex()));
            test_same(content, remote.content(id.hex()));
            test_same(size_t { 0 }, remote.verifications());
        };
        "upload with verification"_test = [] {
            const test_dir dir { "transferable-verify" };
            cas::store store { dir.path() };
            remote_mock remote {};
            remote.with_verify = true;
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto id = store_content(store, "verify me");
            const auto up = uploadable::make(store, remote, id);
            test_same(id.hex(), up->name());
            up->check(auth);
            up->transfer({});
            test_same(size_t { 1 }, remote.verifications());
            expect(remote.has(id.hex()));
        };
        "upload of an object the remote has"_test = [] {
            const test_dir dir { "transferable-present" };
            cas::store store { dir.path() };
            remote_mock remote {};
            remote.add("present");
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto up = uploadable::make(store, remote, store_content(store, "present"));
            up->check(auth);
            expect(up->object()->actions.empty());
            up->transfer({});
            test_same(size_t { 0 }, remote.transfers());
        };
        "make requires the object"_test = [] {
            const test_dir dir { "transferable-make" };
            cas::store store { dir / "store" };
            remote_mock remote {};
            const auto id = cas::oid::from_hash(sha2::digest(std::string_view { "abc" }));
            expect(throws<error_not_found>([&] { uploadable::make(store, remote, id); }));
            // the working copy has been modified after it was staged
            file::write((dir / "abc.txt").string(), std::string_view { "abd" });
            expect(throws<error_integrity>([&] { uploadable::make(store, remote, id, "abc.txt", dir.path()); }));
            // the object is missing but the working copy can restore it
            file::write((dir / "abc.txt").string(), std::string_view { "abc" });
            const auto up = uploadable::make(store, remote, id, "abc.txt", dir.path());
            test_same(uint64_t { 3 }, up->size());
        };
        "set_object once"_test = [] {
            const test_dir dir { "transferable-set" };
            cas::store store { dir.path() };
            remote_mock remote {};
            const auto id = store_content(store, "abc");
            const auto up = uploadable::make(store, remote, id);
            expect(throws([&] { up->transfer({}); }));
            expect(throws([&] { up->set_object(object_resource { std::string(64, '0'), 3 }); }));
            up->set_object(object_resource { id.hex(), 3 });
            expect(throws([&] { up->set_object(object_resource { id.hex(), 3 }); }));
            up->reauthorize(object_resource { id.hex(), 3, { { "upload", action { "http://remote.mock/fresh" } } } });
            expect(up->object()->find_action("upload") != nullptr);
            expect(throws([&] { up->reauthorize(object_resource { std::string(64, '0'), 3 }); }));
        };
        "expired upload"_test = [] {
            const test_dir dir { "transferable-expired" };
            cas::store store { dir.path() };
            remote_mock remote {};
            remote.expires_at = "2000-01-01T00:00:00Z";
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto up = uploadable::make(store, remote, store_content(store, "expiring"));
            up->check(auth);
            expect(throws<error_auth_expired>([&] { up->transfer({}); }));
            test_same(size_t { 0 }, remote.transfers());
        };
        "failed upload"_test = [] {
            const test_dir dir { "transferable-upload-fail" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto id1 = store_content(store, "first");
            const auto id2 = store_content(store, "second");
            remote.fail_transfer(id1.hex(), 500);
            remote.break_transfer(id2.hex());
            for (const auto &id: { id1, id2 }) {
                const auto up = uploadable::make(store, remote, id);
                up->check(auth);
                expect(throws<error_upload>([&] { up->transfer({}); }));
                expect(!remote.has(id.hex()));
            }
        };
        "download"_test = [] {
            const test_dir dir { "transferable-download" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto content = test_content(10'000, 'b');
            const auto hex = remote.add(content);
            const pointer ptr { cas::oid::from_hex(hex), content.size() };
            const auto down = std::make_shared<downloadable>(store, remote, ptr, "image.png");
            expect(down->dir() == direction::download);
            down->check(auth);
            uint64_t last = 0;
            down->transfer([&](const uint64_t total, const uint64_t so_far, const size_t) {
                test_same(uint64_t { content.size() }, total);
                last = so_far;
            });
            test_same(uint64_t { content.size() }, last);
            expect(store.exists(ptr.oid));
            test_same(content, file::read_string(store.locate(ptr.oid).string()));
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "corrupted download"_test = [] {
            const test_dir dir { "transferable-corrupt" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto hex = remote.add("some important bytes");
            remote.corrupt(hex);
            const auto down = std::make_shared<downloadable>(store, remote, pointer { cas::oid::from_hex(hex), 20 });
            down->check(auth);
            expect(throws<error_integrity>([&] { down->transfer({}); }));
            expect(!store.exists(down->oid()));
            test_same(size_t { 0 }, count_files(store.root() / "objects"));
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "failed download"_test = [] {
            const test_dir dir { "transferable-download-fail" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto hex1 = remote.add("first");
            const auto hex2 = remote.add("second");
            remote.fail_transfer(hex1, 503);
            remote.break_transfer(hex2);
            for (const auto &[hex, size]: { std::pair<std::string, uint64_t> { hex1, 5 }, std::pair<std::string, uint64_t> { hex2, 6 } }) {
                const auto down = std::make_shared<downloadable>(store, remote, pointer { cas::oid::from_hex(hex), size });
                down->check(auth);
                expect(throws<error_download>([&] { down->transfer({}); }));
                expect(!store.exists(down->oid()));
            }
            test_same(size_t { 0 }, count_files(store.staging_dir()));
        };
        "object errors"_test = [] {
            const test_dir dir { "transferable-object-error" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            const auto id = store_content(store, "rejected");
            remote.reject(id.hex(), 422, "quota exceeded");
            const auto up = uploadable::make(store, remote, id);
            expect(throws<error_object>([&] { up->check(auth); }));
            expect(static_cast<bool>(up->object()));
            expect(static_cast<bool>(up->object()->error));
        };
        "cancelled"_test = [] {
            const test_dir dir { "transferable-cancel" };
            cas::store store { dir.path() };
            remote_mock remote {};
            batch_client auth { remote, std::string { remote_mock::endpoint } };
            cancel_token token {};
            auto copy = token;
            copy.cancel();
            expect(token.cancelled());
            const auto hex = remote.add("never downloaded");
            const auto down = std::make_shared<downloadable>(store, remote, pointer { cas::oid::from_hex(hex), 16 });
            down->check(auth);
            expect(throws<error_cancelled>([&] { down->transfer({}, token); }));
            expect(!store.exists(down->oid()));
            test_same(size_t { 0 }, remote.transfers());
        };
    };
};

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "utils/digest.h"

using namespace fakehub;
namespace fs = std::filesystem;

namespace {

constexpr const char* kSha1Abc = "a9993e364706816aba3e25717850c26c9cd0d89d";
constexpr const char* kSha256Abc = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("fakehub-hash-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
}

DigestFunction counting(std::atomic<int>& calls) {
    return [&calls](const fs::path& path) {
        ++calls;
        return digest_file(path);
    };
}

}  // namespace

TEST(DigestTest, KnownVectors) {
    auto d = digest_text("abc");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->sha1, kSha1Abc);
    EXPECT_EQ(d->sha256, kSha256Abc);
}

TEST(DigestTest, FileDigestMatchesTextDigestAcrossChunkBoundaries) {
    TempDir tmp;
    std::string content(10000, 'x');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>('a' + i % 26);
    write_file(tmp.path / "f.bin", content);

    auto from_file = digest_file(tmp.path / "f.bin", 7);
    auto from_text = digest_text(content);
    ASSERT_TRUE(from_file && from_text);
    EXPECT_EQ(from_file->sha1, from_text->sha1);
    EXPECT_EQ(from_file->sha256, from_text->sha256);
}

TEST(DigestTest, MissingFileYieldsNullopt) {
    TempDir tmp;
    EXPECT_FALSE(digest_file(tmp.path / "missing").has_value());
}

TEST(HashCacheTest, ComputesDigestsOfFile) {
    TempDir tmp;
    write_file(tmp.path / "abc.txt", "abc");
    InMemoryHashCache cache;
    auto d = cache.digest(tmp.path / "abc.txt");
    EXPECT_EQ(d.sha1, kSha1Abc);
    EXPECT_EQ(d.sha256, kSha256Abc);
}

TEST(HashCacheTest, RepeatedLookupHitsCache) {
    TempDir tmp;
    write_file(tmp.path / "abc.txt", "abc");
    std::atomic<int> calls{0};
    InMemoryHashCache cache(counting(calls));

    auto first = cache.digest(tmp.path / "abc.txt");
    auto second = cache.digest(tmp.path / "abc.txt");
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(first.sha1, second.sha1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(HashCacheTest, ChangedFileIsRehashed) {
    TempDir tmp;
    const fs::path file = tmp.path / "data.txt";
    write_file(file, "abc");
    std::atomic<int> calls{0};
    InMemoryHashCache cache(counting(calls));

    auto before = cache.digest(file);
    write_file(file, "abcd");
    fs::last_write_time(file, fs::last_write_time(file) + std::chrono::seconds(2));
    auto after = cache.digest(file);

    EXPECT_EQ(calls.load(), 2);
    EXPECT_NE(before.sha1, after.sha1);
    EXPECT_EQ(after.sha1, digest_text("abcd")->sha1);
}

TEST(HashCacheTest, MissingFileThrowsIoError) {
    TempDir tmp;
    InMemoryHashCache cache;
    EXPECT_THROW(cache.digest(tmp.path / "missing"), IoError);
}

TEST(HashCacheTest, FailedComputationThrowsAndIsNotCached) {
    TempDir tmp;
    write_file(tmp.path / "abc.txt", "abc");
    std::atomic<int> calls{0};
    InMemoryHashCache cache([&calls](const fs::path&) -> std::optional<FileDigests> {
        ++calls;
        return std::nullopt;
    });
    EXPECT_THROW(cache.digest(tmp.path / "abc.txt"), IoError);
    EXPECT_THROW(cache.digest(tmp.path / "abc.txt"), IoError);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(HashCacheTest, ConcurrentLookupsAgree) {
    TempDir tmp;
    write_file(tmp.path / "abc.txt", "abc");
    InMemoryHashCache cache;

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 20; ++j) {
                if (cache.digest(tmp.path / "abc.txt").sha1 != kSha1Abc) ++mismatches;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(HashCacheTest, UncachedModeHashesEveryTime) {
    TempDir tmp;
    write_file(tmp.path / "abc.txt", "abc");
    std::atomic<int> calls{0};
    UncachedHashCache cache(counting(calls));
    cache.digest(tmp.path / "abc.txt");
    cache.digest(tmp.path / "abc.txt");
    EXPECT_EQ(calls.load(), 2);
}

TEST(HashCacheTest, FactorySelectsMode) {
    auto memory = makeHashCache("memory");
    auto none = makeHashCache("none");
    auto unknown = makeHashCache("redis");
    EXPECT_NE(dynamic_cast<InMemoryHashCache*>(memory.get()), nullptr);
    EXPECT_NE(dynamic_cast<UncachedHashCache*>(none.get()), nullptr);
    EXPECT_NE(dynamic_cast<InMemoryHashCache*>(unknown.get()), nullptr);
}

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "hub/file_server.h"
#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "hub/hub_storage.h"
#include "utils/digest.h"

using namespace fakehub;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("fakehub-files-XXXXXX");
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
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string hundred_bytes() {
    std::string s;
    for (int i = 0; i < 100; ++i) s.push_back(static_cast<char>('A' + i % 26));
    return s;
}

class FileServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_ = hundred_bytes();
        write_file(tmp_.path / "gpt2" / "config.json", content_);
        write_file(tmp_.path / "gpt2" / "model.safetensors", "weights");
        write_file(tmp_.path / "gpt2" / "empty.txt", "");
        write_file(tmp_.path / "secret.txt", "do not serve");
        fs::create_directories(tmp_.path / "gpt2" / "subdir");
        storage_ = std::make_unique<HubStorage>(tmp_.path.string());
        cache_ = std::make_unique<InMemoryHashCache>();
    }

    FileServer server(FileServerOptions options = {}) { return FileServer(*storage_, *cache_, options); }

    static FileRequest get(const std::string& filename, std::optional<std::string> range = std::nullopt) {
        FileRequest req;
        req.repo_path = "gpt2";
        req.revision = "main";
        req.filename = filename;
        req.method = FileRequestMethod::Content;
        req.range_header = std::move(range);
        return req;
    }

    static FileRequest head(const std::string& filename) {
        FileRequest req = get(filename);
        req.method = FileRequestMethod::Probe;
        return req;
    }

    std::string body(const FileServer& fs_server, const FileResponse& res) {
        return fs_server.openBody(res)->readAll();
    }

    TempDir tmp_;
    std::string content_;
    std::unique_ptr<HubStorage> storage_;
    std::unique_ptr<InMemoryHashCache> cache_;
};

}  // namespace

TEST_F(FileServerTest, ClosedRangeReturnsPartialContent) {
    auto srv = server();
    auto res = srv.serve(get("config.json", "bytes=0-9"));
    EXPECT_EQ(res.status, 206);
    EXPECT_EQ(res.header("Content-Range"), "bytes 0-9/100");
    EXPECT_EQ(res.header("Content-Length"), "10");
    EXPECT_EQ(res.header("Accept-Ranges"), "bytes");
    EXPECT_EQ(body(srv, res), content_.substr(0, 10));
}

TEST_F(FileServerTest, SuffixRangeReturnsTail) {
    auto srv = server();
    auto res = srv.serve(get("config.json", "bytes=-5"));
    EXPECT_EQ(res.status, 206);
    EXPECT_EQ(res.header("Content-Range"), "bytes 95-99/100");
    EXPECT_EQ(res.content_length, 5u);
    EXPECT_EQ(body(srv, res), content_.substr(95));
}

TEST_F(FileServerTest, StartPastEndIsUnsatisfiable) {
    auto srv = server();
    auto res = srv.serve(get("config.json", "bytes=1000-"));
    EXPECT_EQ(res.status, 416);
    EXPECT_EQ(res.header("Content-Range"), "bytes */100");
    EXPECT_FALSE(res.has_body);
    EXPECT_EQ(res.content_length, 0u);
    EXPECT_THROW(srv.openBody(res), IoError);
}

TEST_F(FileServerTest, MalformedRangeServesWholeFile) {
    auto srv = server();
    for (const char* header : {"bytes=abc", "bytes=-0", "pages=1-2"}) {
        auto res = srv.serve(get("config.json", std::string(header)));
        EXPECT_EQ(res.status, 200) << header;
        EXPECT_EQ(res.content_length, 100u) << header;
        EXPECT_FALSE(res.header("Content-Range").has_value()) << header;
        EXPECT_EQ(body(srv, res), content_) << header;
    }
}

TEST_F(FileServerTest, PlainGetServesWholeFileAsAttachment) {
    auto srv = server();
    auto res = srv.serve(get("config.json"));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.header("Content-Type"), kOctetStream);
    EXPECT_EQ(res.header("Content-Disposition"), "attachment; filename=\"config.json\"");
    EXPECT_EQ(res.header("x-repo-commit"), "main");
    EXPECT_EQ(res.header("x-revision"), "main");
    EXPECT_EQ(body(srv, res), content_);
}

TEST_F(FileServerTest, EmptyFileHasEmptyBody) {
    auto srv = server();
    auto res = srv.serve(get("empty.txt"));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.content_length, 0u);
    EXPECT_EQ(srv.serve(get("empty.txt", "bytes=0-0")).status, 416);
}

TEST_F(FileServerTest, HeadReportsMetadataWithoutBody) {
    auto srv = server();
    auto res = srv.serve(head("config.json"));
    EXPECT_EQ(res.status, 200);
    EXPECT_FALSE(res.has_body);
    EXPECT_EQ(res.header("Content-Length"), "100");
    EXPECT_EQ(res.header("Accept-Ranges"), "bytes");
    EXPECT_EQ(res.header("x-repo-commit"), "main");
    EXPECT_FALSE(res.header("x-lfs-size").has_value());
    EXPECT_EQ(res.header("ETag"), "\"" + digest_text(content_)->sha1 + "\"");
}

TEST_F(FileServerTest, HeadOfLfsFileUsesSha256AndSizeHint) {
    auto srv = server();
    auto res = srv.serve(head("model.safetensors"));
    EXPECT_EQ(res.header("x-lfs-size"), "7");
    EXPECT_EQ(res.header("ETag"), "\"" + digest_text("weights")->sha256 + "\"");
}

TEST_F(FileServerTest, HeadIgnoresRange) {
    auto srv = server();
    auto req = head("config.json");
    req.range_header = "bytes=0-9";
    auto res = srv.serve(req);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.content_length, 100u);
}

TEST_F(FileServerTest, EtagCanBeDisabled) {
    FileServerOptions options;
    options.probe_etag = false;
    auto srv = server(options);
    auto res = srv.serve(head("config.json"));
    EXPECT_FALSE(res.header("ETag").has_value());
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(FileServerTest, TraversalIsNotFound) {
    auto srv = server();
    EXPECT_THROW(srv.serve(get("../secret.txt")), NotFoundError);
    EXPECT_THROW(srv.serve(get("subdir/../../secret.txt")), NotFoundError);
}

TEST_F(FileServerTest, MissingFilesAndDirectoriesAreNotFound) {
    auto srv = server();
    EXPECT_THROW(srv.serve(get("nope.bin")), NotFoundError);
    EXPECT_THROW(srv.serve(get("subdir")), NotFoundError);
    EXPECT_THROW(srv.serve(get("")), NotFoundError);

    auto req = get("config.json");
    req.repo_path = "missing-repo";
    EXPECT_THROW(srv.serve(req), NotFoundError);
}

TEST_F(FileServerTest, LfsSuffixMatchIsCaseInsensitive) {
    auto srv = server();
    EXPECT_TRUE(srv.isLfsFilename("MODEL.GGUF"));
    EXPECT_TRUE(srv.isLfsFilename("data/train.parquet"));
    EXPECT_FALSE(srv.isLfsFilename("config.json"));
}

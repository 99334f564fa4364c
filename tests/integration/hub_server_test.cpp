#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "api/http_server.h"
#include "api/hub_endpoints.h"
#include "hub/file_server.h"
#include "hub/hash_cache.h"
#include "hub/hub_storage.h"
#include "hub/path_info_collector.h"
#include "hub/repo_metadata.h"
#include "utils/digest.h"

using namespace fakehub;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("fakehub-server-XXXXXX");
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

std::string pattern_bytes(size_t n) {
    std::string s;
    s.reserve(n);
    for (size_t i = 0; i < n; ++i) s.push_back(static_cast<char>('a' + i % 26));
    return s;
}

std::atomic<int> g_next_port{18210};

class HubServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = pattern_bytes(100);
        big_ = pattern_bytes(20000);
        write_file(tmp_.path / "gpt2" / "config.json", config_);
        write_file(tmp_.path / "gpt2" / "model.safetensors", big_);
        write_file(tmp_.path / "gpt2" / "sub" / "vocab.txt", "hello");
        write_file(tmp_.path / "datasets" / "org" / "data" / "train.csv", "a,b\n1,2\n");
        write_file(tmp_.path / "secret.txt", "top secret");

        storage_ = std::make_unique<HubStorage>(tmp_.path.string());
        cache_ = std::make_unique<InMemoryHashCache>();
        FileServerOptions options;
        options.stream_chunk_bytes = 4096;
        file_server_ = std::make_unique<FileServer>(*storage_, *cache_, options);
        collector_ = std::make_unique<PathInfoCollector>(*cache_);
        metadata_ = std::make_unique<RepoMetadataBuilder>(*storage_);
        endpoints_ = std::make_unique<HubEndpoints>(*storage_, *file_server_, *collector_, *metadata_);

        port_ = g_next_port++;
        server_ = std::make_unique<HttpServer>(port_, *endpoints_, "127.0.0.1", 4);
        server_->setLogger([this](const httplib::Request&, const httplib::Response&) { ++logged_; });
        server_->start();
        client_ = std::make_unique<httplib::Client>("127.0.0.1", port_);
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
    }

    httplib::Result getRange(const std::string& path, const std::string& range) {
        httplib::Headers headers{{"Range", range}};
        return client_->Get(path.c_str(), headers);
    }

    httplib::Result postPathsInfo(const std::string& prefix, const json& body) {
        return client_->Post((prefix + "/paths-info/main").c_str(), body.dump(), "application/json");
    }

    TempDir tmp_;
    std::string config_;
    std::string big_;
    std::unique_ptr<HubStorage> storage_;
    std::unique_ptr<InMemoryHashCache> cache_;
    std::unique_ptr<FileServer> file_server_;
    std::unique_ptr<PathInfoCollector> collector_;
    std::unique_ptr<RepoMetadataBuilder> metadata_;
    std::unique_ptr<HubEndpoints> endpoints_;
    std::unique_ptr<HttpServer> server_;
    std::unique_ptr<httplib::Client> client_;
    std::atomic<int> logged_{0};
    int port_{0};
};

}  // namespace

TEST_F(HubServerTest, ClosedRangeReturns206) {
    auto res = getRange("/gpt2/resolve/main/config.json", "bytes=0-9");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 206);
    EXPECT_EQ(res->body, config_.substr(0, 10));
    EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 0-9/100");
    EXPECT_EQ(res->get_header_value("Content-Length"), "10");
    EXPECT_EQ(res->get_header_value("Accept-Ranges"), "bytes");
}

TEST_F(HubServerTest, SuffixRangeReturnsTail) {
    auto res = getRange("/gpt2/resolve/main/config.json", "bytes=-5");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 206);
    EXPECT_EQ(res->body, config_.substr(95));
    EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 95-99/100");
}

TEST_F(HubServerTest, OpenRangeOnLargeFileStreamsAcrossChunks) {
    auto res = getRange("/gpt2/resolve/main/model.safetensors", "bytes=5000-");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 206);
    EXPECT_EQ(res->body, big_.substr(5000));
    EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 5000-19999/20000");
}

TEST_F(HubServerTest, UnsatisfiableRangeReturns416) {
    auto res = getRange("/gpt2/resolve/main/config.json", "bytes=1000-");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 416);
    EXPECT_EQ(res->get_header_value("Content-Range"), "bytes */100");
    EXPECT_TRUE(res->body.empty());
}

TEST_F(HubServerTest, MalformedRangeReturnsWholeFile) {
    for (const char* range : {"bytes=-0", "items=0-9", "bytes=abc", "bytes=", "bytes 0-9"}) {
        SCOPED_TRACE(range);
        auto res = getRange("/gpt2/resolve/main/config.json", range);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(res->body, config_);
        EXPECT_EQ(res->get_header_value("Content-Length"), "100");
        EXPECT_FALSE(res->has_header("Content-Range"));
        EXPECT_FALSE(res->get_header_value("X-Request-Id").empty());
    }
}

TEST_F(HubServerTest, MalformedRangeOnLargeFileStreamsWholeBody) {
    auto res = getRange("/gpt2/resolve/main/model.safetensors", "items=0-9");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, big_);
}

TEST_F(HubServerTest, RangeUnitIsCaseInsensitiveAndAllowsSpaces) {
    for (const char* range : {"BYTES=0-9", "bytes= 0-9", "Bytes=0-9", "bytes=0 - 9", "bytes=0-9,abc"}) {
        SCOPED_TRACE(range);
        auto res = getRange("/gpt2/resolve/main/config.json", range);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 206);
        EXPECT_EQ(res->body, config_.substr(0, 10));
        EXPECT_EQ(res->get_header_value("Content-Range"), "bytes 0-9/100");
    }

    auto suffix = getRange("/gpt2/resolve/main/config.json", "BYTES=-5");
    ASSERT_TRUE(suffix);
    EXPECT_EQ(suffix->status, 206);
    EXPECT_EQ(suffix->body, config_.substr(95));
}

TEST_F(HubServerTest, EveryUnsatisfiableRangeCarriesContentRange) {
    for (const char* range : {"bytes=1000-", "BYTES=1000-", "bytes=100-200", "Bytes= 500-"}) {
        SCOPED_TRACE(range);
        auto res = getRange("/gpt2/resolve/main/config.json", range);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 416);
        EXPECT_EQ(res->get_header_value("Content-Range"), "bytes */100");
        EXPECT_TRUE(res->body.empty());
    }
}

TEST_F(HubServerTest, HeadIgnoresMalformedRange) {
    httplib::Headers headers{{"Range", "items=0-9"}};
    auto res = client_->Head("/gpt2/resolve/main/config.json", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Length"), "100");
    EXPECT_FALSE(res->has_header("Content-Range"));
}

TEST_F(HubServerTest, MalformedRangeOnMissingFileIsEntryNotFound) {
    auto res = getRange("/gpt2/resolve/main/missing.bin", "items=0-9");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->body, "Entry not found");

    auto escape = getRange("/gpt2/resolve/main/../../secret.txt", "bytes=abc");
    ASSERT_TRUE(escape);
    EXPECT_EQ(escape->status, 404);
    EXPECT_EQ(escape->body.find("top secret"), std::string::npos);
}

TEST_F(HubServerTest, UnparsableRangeOnApiRouteReturnsJsonDetail) {
    auto res = getRange("/api/models/gpt2", "items=0-9");
    ASSERT_TRUE(res);
    if (res->status == 416) {
        EXPECT_EQ(json::parse(res->body)["detail"], "Range Not Satisfiable");
    } else {
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(json::parse(res->body)["id"], "gpt2");
    }
    EXPECT_FALSE(res->get_header_value("X-Request-Id").empty());
}

TEST_F(HubServerTest, PlainGetReturnsWholeFile) {
    auto res = client_->Get("/gpt2/resolve/main/model.safetensors");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, big_);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/octet-stream");
    EXPECT_EQ(res->get_header_value("Content-Disposition"), "attachment; filename=\"model.safetensors\"");
    EXPECT_EQ(res->get_header_value("x-repo-commit"), "main");
}

TEST_F(HubServerTest, HeadReportsSizeAndEtag) {
    auto res = client_->Head("/gpt2/resolve/main/config.json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(res->body.empty());
    EXPECT_EQ(res->get_header_value("Content-Length"), "100");
    EXPECT_EQ(res->get_header_value("Accept-Ranges"), "bytes");
    EXPECT_EQ(res->get_header_value("x-revision"), "main");
    EXPECT_EQ(res->get_header_value("ETag"), "\"" + digest_text(config_)->sha1 + "\"");
}

TEST_F(HubServerTest, HeadOfLfsFileCarriesSizeHint) {
    auto res = client_->Head("/gpt2/resolve/main/model.safetensors");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("x-lfs-size"), "20000");
    EXPECT_EQ(res->get_header_value("ETag"), "\"" + digest_text(big_)->sha256 + "\"");
}

TEST_F(HubServerTest, TraversalIsNotFound) {
    auto res = client_->Get("/gpt2/resolve/main/../../secret.txt");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->body.find("top secret"), std::string::npos);

    auto encoded = client_->Get("/gpt2/resolve/main/%2e%2e/secret.txt");
    ASSERT_TRUE(encoded);
    EXPECT_EQ(encoded->status, 404);
}

TEST_F(HubServerTest, MissingFileIsEntryNotFound) {
    auto res = client_->Get("/gpt2/resolve/main/missing.bin");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->body, "Entry not found");

    auto repo = client_->Get("/nobody/resolve/main/config.json");
    ASSERT_TRUE(repo);
    EXPECT_EQ(repo->status, 404);
}

TEST_F(HubServerTest, DatasetFilesResolveUnderDatasetsPrefix) {
    auto res = client_->Get("/datasets/org/data/resolve/main/train.csv");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "a,b\n1,2\n");
}

TEST_F(HubServerTest, ModelInfoAndRevision) {
    auto res = client_->Get("/api/models/gpt2");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["id"], "gpt2");
    EXPECT_EQ(body["sha"], "fakesha1234567890");
    EXPECT_EQ(body["siblings"].size(), 3u);
    EXPECT_EQ(body["usedStorage"], 100 + 20000 + 5);

    auto rev = client_->Get("/api/models/gpt2/revision/v1.0");
    ASSERT_TRUE(rev);
    EXPECT_EQ(json::parse(rev->body)["sha"], "fakesha-v1.0");
}

TEST_F(HubServerTest, DatasetInfo) {
    auto res = client_->Get("/api/datasets/org/data/revision/main");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["id"], "org/data");
    EXPECT_EQ(body["_id"], "local/datasets/org/data");
}

TEST_F(HubServerTest, MissingRepositoriesReturnJsonDetail) {
    auto model = client_->Get("/api/models/nobody/nothing");
    ASSERT_TRUE(model);
    EXPECT_EQ(model->status, 404);
    EXPECT_EQ(json::parse(model->body)["detail"], "Repository not found");

    auto dataset = client_->Get("/api/datasets/nobody/nothing");
    ASSERT_TRUE(dataset);
    EXPECT_EQ(dataset->status, 404);
    EXPECT_EQ(json::parse(dataset->body)["detail"], "Dataset not found");

    auto escape = client_->Get("/api/models/../secret.txt");
    ASSERT_TRUE(escape);
    EXPECT_EQ(escape->status, 404);
}

TEST_F(HubServerTest, PathsInfoListsRequestedEntries) {
    auto res = postPathsInfo("/api/models/gpt2", {{"paths", {"config.json", "sub"}}, {"expand", true}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    ASSERT_EQ(body.size(), 3u);
    EXPECT_EQ(body[0]["path"], "config.json");
    EXPECT_EQ(body[0]["type"], "file");
    EXPECT_EQ(body[0]["size"], 100);
    EXPECT_EQ(body[0]["oid"], digest_text(config_)->sha1);
    EXPECT_EQ(body[0]["lfs"]["oid"], "sha256:" + digest_text(config_)->sha256);
    EXPECT_EQ(body[1]["path"], "sub");
    EXPECT_EQ(body[1]["type"], "directory");
    EXPECT_EQ(body[2]["path"], "sub/vocab.txt");
}

TEST_F(HubServerTest, PathsInfoWithoutBodyListsEverything) {
    auto res = client_->Post("/api/models/gpt2/paths-info/main", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body).size(), 3u);
}

TEST_F(HubServerTest, PathsInfoWithoutExpandDescribesRoot) {
    auto res = postPathsInfo("/api/datasets/org/data", {{"paths", {"/"}}, {"expand", false}});
    ASSERT_TRUE(res);
    auto body = json::parse(res->body);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["path"], "");
    EXPECT_EQ(body[0]["type"], "directory");
}

TEST_F(HubServerTest, PathsInfoForMissingRepository) {
    auto res = postPathsInfo("/api/datasets/nobody/nothing", json::object());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["detail"], "Dataset not found");
}

TEST_F(HubServerTest, UnknownRouteReturnsJsonNotFound) {
    auto res = client_->Get("/no/such/route");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["detail"], "Not Found");
}

TEST_F(HubServerTest, RequestIdIsEchoedOrGenerated) {
    httplib::Headers headers{{"X-Request-Id", "trace-42"}};
    auto echoed = client_->Get("/api/models/gpt2", headers);
    ASSERT_TRUE(echoed);
    EXPECT_EQ(echoed->get_header_value("X-Request-Id"), "trace-42");

    httplib::Headers bad{{"X-Request-Id", "bad id with spaces"}};
    auto generated = client_->Get("/api/models/gpt2", bad);
    ASSERT_TRUE(generated);
    EXPECT_EQ(generated->get_header_value("X-Request-Id").size(), 16u);
}

TEST_F(HubServerTest, LoggerSeesEveryResponse) {
    ASSERT_TRUE(client_->Get("/api/models/gpt2"));
    ASSERT_TRUE(client_->Head("/gpt2/resolve/main/config.json"));
    EXPECT_GE(logged_.load(), 2);
}

TEST(HttpServerTest, BindFailureThrows) {
    TempDir tmp;
    HubStorage storage(tmp.path.string());
    InMemoryHashCache cache;
    FileServer file_server(storage, cache);
    PathInfoCollector collector(cache);
    RepoMetadataBuilder metadata(storage);
    HubEndpoints endpoints(storage, file_server, collector, metadata);

    HttpServer first(18299, endpoints, "127.0.0.1", 1);
    first.start();
    HttpServer second(18299, endpoints, "127.0.0.1", 1);
    EXPECT_THROW(second.start(), std::runtime_error);
    EXPECT_FALSE(second.running());
    first.stop();
}

TEST(HubEndpointsTest, ServeResolvePathAnswersWithoutRouter) {
    TempDir tmp;
    write_file(tmp.path / "gpt2" / "config.json", pattern_bytes(100));
    HubStorage storage(tmp.path.string());
    InMemoryHashCache cache;
    FileServer file_server(storage, cache);
    PathInfoCollector collector(cache);
    RepoMetadataBuilder metadata(storage);
    HubEndpoints endpoints(storage, file_server, collector, metadata);

    httplib::Request req;
    req.method = "GET";
    req.path = "/gpt2/resolve/main/config.json";
    req.headers.emplace("Range", "items=0-9");
    httplib::Response res;
    ASSERT_TRUE(endpoints.serveResolvePath(req, res));
    EXPECT_EQ(res.status, 200);
    EXPECT_FALSE(res.has_header("Content-Range"));

    httplib::Request upper;
    upper.method = "GET";
    upper.path = "/gpt2/resolve/main/config.json";
    upper.headers.emplace("Range", "BYTES=0-9");
    httplib::Response partial;
    ASSERT_TRUE(endpoints.serveResolvePath(upper, partial));
    EXPECT_EQ(partial.status, 206);
    EXPECT_EQ(partial.get_header_value("Content-Range"), "bytes 0-9/100");

    httplib::Request other;
    other.method = "GET";
    other.path = "/api/models/gpt2";
    httplib::Response untouched;
    EXPECT_FALSE(endpoints.serveResolvePath(other, untouched));

    httplib::Request post;
    post.method = "POST";
    post.path = "/gpt2/resolve/main/config.json";
    EXPECT_FALSE(endpoints.serveResolvePath(post, untouched));
}

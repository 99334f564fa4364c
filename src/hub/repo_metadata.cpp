#include "hub/repo_metadata.h"

using json = nlohmann::json;

namespace fakehub {

std::string fakeSha(const std::optional<std::string>& revision) {
    if (revision && !revision->empty()) return "fakesha-" + *revision;
    return "fakesha1234567890";
}

json siblingsJson(const std::vector<RepoFile>& files) {
    json siblings = json::array();
    for (const auto& file : files) {
        siblings.push_back({{"rfilename", file.relative_path}});
    }
    return siblings;
}

RepoMetadataBuilder::RepoMetadataBuilder(const HubStorage& storage) : storage_(storage) {}

json RepoMetadataBuilder::model(const std::string& repo_id, const std::optional<std::string>& revision) const {
    const auto root = storage_.repoRoot(RepoKind::Model, repo_id);
    const auto files = HubStorage::walkFiles(root);

    json j;
    j["_id"] = "local/" + repo_id;
    j["id"] = repo_id;
    j["private"] = false;
    j["pipeline_tag"] = "text-generation";
    j["library_name"] = "transformers";
    j["tags"] = json::array({"transformers", "gpt2", "text-generation"});
    j["downloads"] = 0;
    j["likes"] = 0;
    j["modelId"] = repo_id;
    j["author"] = kLocalAuthor;
    j["sha"] = fakeSha(revision);
    j["lastModified"] = kEpochTimestamp;
    j["createdAt"] = kEpochTimestamp;
    j["gated"] = false;
    j["disabled"] = false;
    j["widgetData"] = json::array({{{"text", "Hello"}}});
    j["model-index"] = nullptr;
    j["config"] = {{"architectures", json::array({"GPT2LMHeadModel"})},
                   {"model_type", "gpt2"},
                   {"tokenizer_config", json::object()}};
    j["cardData"] = {{"language", "en"}, {"tags", json::array({"example"})}, {"license", "mit"}};
    j["transformersInfo"] = {{"auto_model", "AutoModelForCausalLM"},
                             {"pipeline_tag", "text-generation"},
                             {"processor", "AutoTokenizer"}};
    j["safetensors"] = {{"parameters", {{"F32", 0}}}, {"total", 0}};
    j["siblings"] = siblingsJson(files);
    j["spaces"] = json::array();
    j["usedStorage"] = HubStorage::usedStorage(files);
    return j;
}

json RepoMetadataBuilder::dataset(const std::string& repo_id, const std::optional<std::string>& revision) const {
    const auto root = storage_.repoRoot(RepoKind::Dataset, repo_id);
    const auto files = HubStorage::walkFiles(root);

    json j;
    j["_id"] = "local/datasets/" + repo_id;
    j["id"] = repo_id;
    j["private"] = false;
    j["tags"] = json::array({"dataset"});
    j["downloads"] = 0;
    j["likes"] = 0;
    j["author"] = kLocalAuthor;
    j["sha"] = fakeSha(revision);
    j["lastModified"] = kEpochTimestamp;
    j["createdAt"] = kEpochTimestamp;
    j["gated"] = false;
    j["disabled"] = false;
    j["cardData"] = {{"license", "mit"}, {"language", json::array({"en"})}};
    j["siblings"] = siblingsJson(files);
    j["usedStorage"] = HubStorage::usedStorage(files);
    return j;
}

}  // namespace fakehub

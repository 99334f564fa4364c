#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hub/hub_storage.h"

namespace fakehub {

constexpr const char* kEpochTimestamp = "1970-01-01T00:00:00.000Z";
constexpr const char* kLocalAuthor = "local-user";

// "fakesha-<revision>", or a fixed placeholder without a revision.
std::string fakeSha(const std::optional<std::string>& revision);

nlohmann::json siblingsJson(const std::vector<RepoFile>& files);

/// Builds repository info documents shaped like the public hub API.
/// Only the schema (key set and value types) is meant to match; the values
/// describing the model itself are fixed.
class RepoMetadataBuilder {
public:
    explicit RepoMetadataBuilder(const HubStorage& storage);

    // Throws NotFoundError("Repository not found").
    nlohmann::json model(const std::string& repo_id, const std::optional<std::string>& revision = std::nullopt) const;

    // Throws NotFoundError("Dataset not found").
    nlohmann::json dataset(const std::string& repo_id, const std::optional<std::string>& revision = std::nullopt) const;

private:
    const HubStorage& storage_;
};

}  // namespace fakehub

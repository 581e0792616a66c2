#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hearth_errors.hpp"
#include "policy/policy_guard.hpp"
#include "sandbox/artifact_validator.hpp"

namespace hearth::storage {

struct StoredArtifact {
    std::filesystem::path path;
    std::string content_type;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Persists validated sandbox artifacts as {base_dir}/{report_id}/{filename}.
// Every call re-checks both identifiers and the resolved path, regardless of
// what earlier layers already validated.
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path base_dir = "data/artifacts");

    // Security error for unsafe identifiers or an artifact that did not pass
    // egress validation; Internal error when the copy fails.
    core::errors::Result<std::filesystem::path> persist(
        const std::string& report_id, const sandbox::ArtifactMeta& artifact) const;

    // Input/"artifact_not_found" when missing; Security for unsafe ids.
    core::errors::Result<StoredArtifact> retrieve(const std::string& report_id,
                                                  const std::string& filename) const;

    // Returns whether anything was removed.
    core::errors::Result<bool> delete_report(const std::string& report_id) const;

    // Sorted filenames; empty when the report has no artifacts.
    core::errors::Result<std::vector<std::string>> list_artifacts(
        const std::string& report_id) const;

    // {"report_id", "artifacts": [{"filename", "content_type", "size_bytes"}]}
    core::errors::Result<nlohmann::json> describe_report(const std::string& report_id) const;

    static std::string content_type_for(const std::string& filename);

    // Headers the web layer must send with an artifact body.
    static HeaderList response_headers(const StoredArtifact& artifact,
                                       const std::string& filename);

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    core::errors::Result<bool> check_identifiers(const std::string& report_id,
                                                 const std::string* filename) const;

    std::filesystem::path base_dir_;
    policy::PolicyGuard guard_;
};

}  // namespace hearth::storage

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/hearth_errors.hpp"

namespace hearth::sandbox {

// A file that passed every egress check. Only exists between script
// completion and persistence; `source_path` points into the ephemeral
// sandbox output directory.
struct ArtifactMeta {
    std::filesystem::path source_path;
    std::string filename;
    std::string content_type;
    std::uintmax_t size_bytes = 0;
    bool validated = false;
};

struct ArtifactEgressPolicy {
    std::set<std::string> allowed_extensions = {".png", ".jpg", ".jpeg",
                                                ".svg", ".csv", ".json"};
    std::uintmax_t max_file_size_bytes = 10 * 1024 * 1024;
    std::uintmax_t max_total_size_bytes = 50 * 1024 * 1024;
    std::size_t max_file_count = 20;
    std::size_t max_filename_length = 255;
    std::string allowed_filename_pattern = "^[a-zA-Z0-9][a-zA-Z0-9._-]*$";
};

struct ArtifactScan {
    std::vector<ArtifactMeta> accepted;
    int rejected = 0;
};

class ArtifactEgressValidator {
public:
    explicit ArtifactEgressValidator(ArtifactEgressPolicy policy = {});

    // Runs filename, extension, symlink, size and content checks on one
    // file. Never trusts anything the sandboxed script reported about it.
    core::errors::Result<ArtifactMeta> validate(
        const std::filesystem::path& candidate_path) const;

    // Scans the top level of a sandbox output directory in sorted order,
    // additionally enforcing the file-count and total-size ceilings.
    ArtifactScan validate_artifacts(const std::filesystem::path& output_dir) const;

    core::errors::Result<bool> validate_filename(const std::string& filename) const;
    core::errors::Result<bool> validate_extension(const std::string& filename) const;
    core::errors::Result<bool> validate_magic_bytes(const std::filesystem::path& path,
                                                    const std::string& extension) const;

    const ArtifactEgressPolicy& policy() const { return policy_; }

private:
    ArtifactEgressPolicy policy_;
};

// Lower-cased extension including the dot, empty when there is none.
std::string lowercase_extension(const std::string& filename);

// MIME type for the allow-listed extensions; nullopt for anything else.
std::optional<std::string> content_type_for_extension(const std::string& extension);

}  // namespace hearth::sandbox

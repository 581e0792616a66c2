#include "storage/artifact_store.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace hearth::storage {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using nlohmann::json;

namespace {

constexpr const char* kDefaultContentType = "application/octet-stream";
constexpr const char* kArtifactCsp =
    "default-src 'none'; img-src 'self' data:; style-src 'unsafe-inline'; sandbox";

HearthError not_found(const std::string& report_id, const std::string& filename) {
    return HearthError{ErrorCategory::Input,
                       "Artifact not found: " + report_id + "/" + filename,
                       "artifact_not_found"};
}

}  // namespace

ArtifactStore::ArtifactStore(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

core::errors::Result<bool> ArtifactStore::check_identifiers(
    const std::string& report_id, const std::string* filename) const {
    auto report_check = guard_.validate_identifier(report_id, "report_id");
    if (core::errors::is_error(report_check)) {
        return core::errors::get_error(report_check);
    }
    if (filename != nullptr) {
        auto filename_check = guard_.validate_filename(*filename);
        if (core::errors::is_error(filename_check)) {
            return core::errors::get_error(filename_check);
        }
    }
    return true;
}

std::string ArtifactStore::content_type_for(const std::string& filename) {
    const auto content_type =
        sandbox::content_type_for_extension(sandbox::lowercase_extension(filename));
    return content_type.has_value() ? *content_type : kDefaultContentType;
}

HeaderList ArtifactStore::response_headers(const StoredArtifact& artifact,
                                           const std::string& filename) {
    return {
        {"Content-Type", artifact.content_type},
        {"X-Content-Type-Options", "nosniff"},
        {"Content-Security-Policy", kArtifactCsp},
        {"Content-Disposition", "inline; filename=\"" + filename + "\""},
    };
}

core::errors::Result<std::filesystem::path> ArtifactStore::persist(
    const std::string& report_id, const sandbox::ArtifactMeta& artifact) const {
    auto ids = check_identifiers(report_id, &artifact.filename);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }
    if (!artifact.validated) {
        HEARTH_LOG_WARN("Refusing to persist unvalidated artifact: " + artifact.filename);
        return HearthError{ErrorCategory::Security,
                           "Artifact did not pass egress validation: " + artifact.filename,
                           "artifact_not_validated"};
    }

    std::error_code ec;
    const auto source_status = std::filesystem::symlink_status(artifact.source_path, ec);
    if (ec || !std::filesystem::is_regular_file(source_status)) {
        return HearthError{ErrorCategory::Security,
                           "Artifact source is not a regular file: " +
                               artifact.source_path.string(),
                           "artifact_source_invalid"};
    }

    std::filesystem::create_directories(base_dir_ / report_id, ec);
    if (ec) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to create report directory: " +
                               (base_dir_ / report_id).string(),
                           "artifact_dir_create_failed"};
    }

    auto dest_result = guard_.validate_path_in_root(
        base_dir_, std::filesystem::path(report_id) / artifact.filename);
    if (core::errors::is_error(dest_result)) {
        return core::errors::get_error(dest_result);
    }
    const auto dest = core::errors::get_value(dest_result);

    // Readers only ever see a complete file: copy beside the destination
    // under a dot-prefixed name, then rename over it.
    const auto staging = dest.parent_path() /
                         ("." + artifact.filename + "." + core::config::generate_id("tmp"));
    std::filesystem::copy_file(artifact.source_path, staging,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
        std::filesystem::rename(staging, dest, ec);
    }
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(staging, cleanup_ec);
        return HearthError{ErrorCategory::Internal,
                           "Unable to store artifact " + artifact.filename + ": " +
                               ec.message(),
                           "artifact_write_failed"};
    }

    HEARTH_LOG_INFO("Artifact stored: " + report_id + "/" + artifact.filename + " (" +
                    artifact.content_type + ", " + std::to_string(artifact.size_bytes) +
                    " bytes)");
    return dest;
}

core::errors::Result<StoredArtifact> ArtifactStore::retrieve(
    const std::string& report_id, const std::string& filename) const {
    auto ids = check_identifiers(report_id, &filename);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(base_dir_, ec)) {
        return not_found(report_id, filename);
    }

    auto path_result =
        guard_.validate_path_in_root(base_dir_, std::filesystem::path(report_id) / filename);
    if (core::errors::is_error(path_result)) {
        const auto& err = core::errors::get_error(path_result);
        if (err.category == ErrorCategory::Security) {
            HEARTH_LOG_WARN("Path traversal blocked in retrieve: " + report_id + "/" +
                            filename);
            return err;
        }
        return not_found(report_id, filename);
    }

    const auto path = core::errors::get_value(path_result);
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return not_found(report_id, filename);
    }
    return StoredArtifact{path, content_type_for(filename)};
}

core::errors::Result<bool> ArtifactStore::delete_report(const std::string& report_id) const {
    auto ids = check_identifiers(report_id, nullptr);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(base_dir_, ec)) {
        return false;
    }
    auto dir_result = guard_.validate_path_in_root(base_dir_, report_id);
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }
    const auto report_dir = core::errors::get_value(dir_result);
    if (!std::filesystem::exists(report_dir, ec)) {
        return false;
    }

    std::filesystem::remove_all(report_dir, ec);
    if (ec) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to delete artifacts for report " + report_id + ": " +
                               ec.message(),
                           "artifact_delete_failed"};
    }
    HEARTH_LOG_INFO("Artifacts deleted for report: " + report_id);
    return true;
}

core::errors::Result<std::vector<std::string>> ArtifactStore::list_artifacts(
    const std::string& report_id) const {
    auto ids = check_identifiers(report_id, nullptr);
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }

    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(base_dir_ / report_id, ec)) {
        return names;
    }
    auto dir_result = guard_.validate_path_in_root(base_dir_, report_id);
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }

    for (const auto& entry :
         std::filesystem::directory_iterator(core::errors::get_value(dir_result), ec)) {
        std::error_code entry_ec;
        std::string name = entry.path().filename().string();
        // Dot-prefixed names are writes still in flight.
        if (entry.is_regular_file(entry_ec) && name.rfind('.', 0) != 0) {
            names.push_back(std::move(name));
        }
    }
    if (ec) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to list artifacts for report " + report_id + ": " +
                               ec.message(),
                           "artifact_list_failed"};
    }
    std::sort(names.begin(), names.end());
    return names;
}

core::errors::Result<json> ArtifactStore::describe_report(const std::string& report_id) const {
    auto names = list_artifacts(report_id);
    if (core::errors::is_error(names)) {
        return core::errors::get_error(names);
    }

    json artifacts = json::array();
    for (const auto& name : core::errors::get_value(names)) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(base_dir_ / report_id / name, ec);
        artifacts.push_back({{"filename", name},
                             {"content_type", content_type_for(name)},
                             {"size_bytes", ec ? 0 : size}});
    }

    json payload;
    payload["report_id"] = report_id;
    payload["artifacts"] = artifacts;
    return payload;
}

}  // namespace hearth::storage

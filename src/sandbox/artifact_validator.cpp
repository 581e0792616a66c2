#include "sandbox/artifact_validator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <regex>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace hearth::sandbox {

using core::errors::ErrorCategory;
using core::errors::HearthError;

namespace {

const std::map<std::string, std::vector<std::string>>& magic_signatures() {
    static const std::map<std::string, std::vector<std::string>> kSignatures = {
        {".png", {std::string("\x89PNG\r\n\x1a\n", 8)}},
        {".jpg", {std::string("\xff\xd8\xff", 3)}},
        {".jpeg", {std::string("\xff\xd8\xff", 3)}},
    };
    return kSignatures;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

HearthError reject(const ErrorCategory category, const std::string& reason,
                   const std::string& filename, std::string code) {
    HEARTH_LOG_WARN("Artifact rejected (" + reason + "): " + filename);
    return HearthError{category, "Artifact rejected (" + reason + "): " + filename,
                       std::move(code)};
}

}  // namespace

std::string lowercase_extension(const std::string& filename) {
    return lowercase(std::filesystem::path(filename).extension().string());
}

std::optional<std::string> content_type_for_extension(const std::string& extension) {
    static const std::map<std::string, std::string> kContentTypes = {
        {".png", "image/png"},   {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"}, {".svg", "image/svg+xml"},
        {".csv", "text/csv"},    {".json", "application/json"},
    };
    const auto it = kContentTypes.find(lowercase(extension));
    if (it == kContentTypes.end()) {
        return std::nullopt;
    }
    return it->second;
}

ArtifactEgressValidator::ArtifactEgressValidator(ArtifactEgressPolicy policy)
    : policy_(std::move(policy)) {}

core::errors::Result<bool> ArtifactEgressValidator::validate_filename(
    const std::string& filename) const {
    if (filename.empty()) {
        return reject(ErrorCategory::Validation, "empty name", filename,
                      "invalid_artifact_name");
    }
    if (filename.find('\0') != std::string::npos) {
        return reject(ErrorCategory::Security, "null byte", filename,
                      "unsafe_artifact_name");
    }
    if (filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos) {
        return reject(ErrorCategory::Security, "path separator", filename,
                      "unsafe_artifact_name");
    }
    if (filename.find("..") != std::string::npos) {
        return reject(ErrorCategory::Security, "path traversal", filename,
                      "unsafe_artifact_name");
    }
    if (filename.front() == '.') {
        return reject(ErrorCategory::Security, "dotfile", filename,
                      "unsafe_artifact_name");
    }
    if (filename.size() > policy_.max_filename_length) {
        return reject(ErrorCategory::Validation,
                      "too long: " + std::to_string(filename.size()), filename,
                      "invalid_artifact_name");
    }
    const std::regex pattern(policy_.allowed_filename_pattern);
    if (!std::regex_match(filename, pattern)) {
        return reject(ErrorCategory::Validation, "pattern mismatch", filename,
                      "invalid_artifact_name");
    }
    return true;
}

core::errors::Result<bool> ArtifactEgressValidator::validate_extension(
    const std::string& filename) const {
    const std::string extension = lowercase_extension(filename);
    if (extension.empty()) {
        return reject(ErrorCategory::Security, "no extension", filename,
                      "disallowed_artifact_type");
    }
    if (policy_.allowed_extensions.find(extension) == policy_.allowed_extensions.end()) {
        return reject(ErrorCategory::Security, "extension " + extension, filename,
                      "disallowed_artifact_type");
    }
    return true;
}

core::errors::Result<bool> ArtifactEgressValidator::validate_magic_bytes(
    const std::filesystem::path& path, const std::string& extension) const {
    const std::string filename = path.filename().string();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return reject(ErrorCategory::Validation, "unreadable", filename,
                      "artifact_unreadable");
    }
    const std::string data((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    if (data.empty()) {
        return reject(ErrorCategory::Validation, "empty", filename, "artifact_empty");
    }

    const std::string ext = lowercase(extension);
    const auto& signatures = magic_signatures();
    const auto sig_it = signatures.find(ext);
    if (sig_it != signatures.end()) {
        for (const auto& signature : sig_it->second) {
            if (data.compare(0, signature.size(), signature) == 0) {
                return true;
            }
        }
        return reject(ErrorCategory::Validation, "magic bytes mismatch for " + ext,
                      filename, "artifact_content_mismatch");
    }

    if (ext == ".svg") {
        if (lowercase(data).find("<svg") != std::string::npos) {
            return true;
        }
        return reject(ErrorCategory::Validation, "not valid SVG", filename,
                      "artifact_content_mismatch");
    }

    if (ext == ".csv") {
        return true;
    }

    if (ext == ".json") {
        const auto first = data.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && (data[first] == '{' || data[first] == '[')) {
            return true;
        }
        return reject(ErrorCategory::Validation, "not valid JSON", filename,
                      "artifact_content_mismatch");
    }

    return reject(ErrorCategory::Security, "unknown format " + ext, filename,
                  "disallowed_artifact_type");
}

core::errors::Result<ArtifactMeta> ArtifactEgressValidator::validate(
    const std::filesystem::path& candidate_path) const {
    const std::string filename = candidate_path.filename().string();

    auto name_ok = validate_filename(filename);
    if (core::errors::is_error(name_ok)) {
        return core::errors::get_error(name_ok);
    }
    auto ext_ok = validate_extension(filename);
    if (core::errors::is_error(ext_ok)) {
        return core::errors::get_error(ext_ok);
    }

    std::error_code ec;
    const auto link_status = std::filesystem::symlink_status(candidate_path, ec);
    if (ec || !std::filesystem::exists(link_status)) {
        return reject(ErrorCategory::Validation, "missing", filename, "artifact_missing");
    }
    if (std::filesystem::is_symlink(link_status)) {
        return reject(ErrorCategory::Security, "symlink", filename, "artifact_symlink");
    }
    if (!std::filesystem::is_regular_file(link_status)) {
        return reject(ErrorCategory::Security, "not a regular file", filename,
                      "artifact_not_regular");
    }

    const auto size = std::filesystem::file_size(candidate_path, ec);
    if (ec) {
        return reject(ErrorCategory::Validation, "unreadable", filename,
                      "artifact_unreadable");
    }
    if (size > policy_.max_file_size_bytes) {
        return reject(ErrorCategory::Validation,
                      "size " + std::to_string(size) + " > " +
                          std::to_string(policy_.max_file_size_bytes),
                      filename, "artifact_too_large");
    }

    const std::string extension = lowercase_extension(filename);
    auto content_ok = validate_magic_bytes(candidate_path, extension);
    if (core::errors::is_error(content_ok)) {
        return core::errors::get_error(content_ok);
    }

    ArtifactMeta meta;
    meta.source_path = candidate_path;
    meta.filename = filename;
    meta.content_type =
        content_type_for_extension(extension).value_or("application/octet-stream");
    meta.size_bytes = size;
    meta.validated = true;
    return meta;
}

ArtifactScan ArtifactEgressValidator::validate_artifacts(
    const std::filesystem::path& output_dir) const {
    ArtifactScan scan;
    std::error_code ec;
    if (!std::filesystem::is_directory(output_dir, ec) || ec) {
        return scan;
    }

    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::directory_iterator(output_dir, ec)) {
        entries.push_back(entry.path());
    }
    if (ec) {
        HEARTH_LOG_WARN("Unable to list sandbox output directory: " + output_dir.string());
        return scan;
    }
    std::sort(entries.begin(), entries.end());

    std::uintmax_t total_bytes = 0;
    for (const auto& path : entries) {
        std::error_code entry_ec;
        const auto status = std::filesystem::symlink_status(path, entry_ec);
        if (!entry_ec && std::filesystem::is_directory(status)) {
            continue;
        }

        if (scan.accepted.size() >= policy_.max_file_count) {
            HEARTH_LOG_WARN("Artifact rejected (count limit " +
                            std::to_string(policy_.max_file_count) +
                            "): " + path.filename().string());
            ++scan.rejected;
            continue;
        }

        auto validated = validate(path);
        if (core::errors::is_error(validated)) {
            ++scan.rejected;
            continue;
        }

        const ArtifactMeta& meta = core::errors::get_value(validated);
        if (total_bytes + meta.size_bytes > policy_.max_total_size_bytes) {
            HEARTH_LOG_WARN("Artifact rejected (total size would exceed " +
                            std::to_string(policy_.max_total_size_bytes) +
                            "): " + meta.filename);
            ++scan.rejected;
            continue;
        }
        total_bytes += meta.size_bytes;
        scan.accepted.push_back(meta);
    }

    if (scan.rejected > 0) {
        HEARTH_LOG_INFO("Artifact validation: " + std::to_string(scan.accepted.size()) +
                        " accepted, " + std::to_string(scan.rejected) +
                        " rejected in " + output_dir.string());
    }
    return scan;
}

}  // namespace hearth::sandbox

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/hearth_errors.hpp"

namespace hearth::policy {

// Identifiers that become path segments (report ids, artifact names).
struct IdentifierPolicy {
    std::size_t max_length = 255;
    // Characters allowed besides ASCII letters and digits.
    std::string extra_chars = "-_";
};

class PolicyGuard {
public:
    explicit PolicyGuard(IdentifierPolicy identifier_policy = {});

    // Alphanumeric, hyphen and underscore only: no separators, no "..", no
    // leading dot, no NUL. `what` names the identifier in error messages.
    core::errors::Result<std::string> validate_identifier(
        const std::string& value, const std::string& what) const;

    // Like validate_identifier, but also allows interior dots
    // ("chart-1.png"). Leading dots and ".." are still rejected.
    core::errors::Result<std::string> validate_filename(const std::string& value) const;

    // Resolves target (relative to root if relative) and rejects it unless
    // it is root itself or a descendant. Symlinks are resolved.
    core::errors::Result<std::filesystem::path> validate_path_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    bool is_allowed_char(char c) const;

    IdentifierPolicy identifier_policy_;
};

}  // namespace hearth::policy

#include "policy/policy_guard.hpp"

#include <cctype>
#include <iterator>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace hearth::policy {

using core::errors::ErrorCategory;
using core::errors::HearthError;

PolicyGuard::PolicyGuard(IdentifierPolicy identifier_policy)
    : identifier_policy_(std::move(identifier_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            // weakly_canonical keeps a trailing empty element for "dir/".
            return root_it->empty() && std::next(root_it) == root.end();
        }
    }
    return root_it == root.end() ||
           (root_it->empty() && std::next(root_it) == root.end());
}

bool PolicyGuard::is_allowed_char(const char c) const {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0 &&
        static_cast<unsigned char>(c) < 0x80) {
        return true;
    }
    return identifier_policy_.extra_chars.find(c) != std::string::npos;
}

core::errors::Result<std::string> PolicyGuard::validate_identifier(
    const std::string& value, const std::string& what) const {
    if (value.empty()) {
        return HearthError{ErrorCategory::Security, what + " cannot be empty.",
                           "invalid_identifier"};
    }
    if (value.size() > identifier_policy_.max_length) {
        return HearthError{ErrorCategory::Security, what + " is too long.",
                           "invalid_identifier"};
    }
    if (value.find('\0') != std::string::npos) {
        HEARTH_LOG_WARN("Rejected " + what + " containing NUL byte");
        return HearthError{ErrorCategory::Security, what + " contains a NUL byte.",
                           "invalid_identifier"};
    }
    for (const char c : value) {
        if (!is_allowed_char(c)) {
            HEARTH_LOG_WARN("Rejected unsafe " + what + ": " + value);
            return HearthError{ErrorCategory::Security,
                               what + " contains disallowed characters: " + value,
                               "invalid_identifier",
                               "Use letters, digits, '-' and '_' only."};
        }
    }
    return value;
}

core::errors::Result<std::string> PolicyGuard::validate_filename(
    const std::string& value) const {
    if (value.empty() || value.size() > identifier_policy_.max_length ||
        value.front() == '.' || value.find("..") != std::string::npos ||
        value.find('\0') != std::string::npos) {
        HEARTH_LOG_WARN("Rejected unsafe filename: " + value);
        return HearthError{ErrorCategory::Security, "Unsafe filename: " + value,
                           "invalid_filename"};
    }
    for (const char c : value) {
        if (c != '.' && !is_allowed_char(c)) {
            HEARTH_LOG_WARN("Rejected unsafe filename: " + value);
            return HearthError{ErrorCategory::Security, "Unsafe filename: " + value,
                               "invalid_filename"};
        }
    }
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec) || ec) {
        return HearthError{ErrorCategory::Input,
                           "Root does not exist: " + root.string(), "invalid_root"};
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return HearthError{ErrorCategory::Input,
                           "Root is not a directory: " + root.string(), "invalid_root"};
    }

    const std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return HearthError{ErrorCategory::Input,
                           "Unable to resolve root: " + root.string(), "invalid_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return HearthError{ErrorCategory::Input,
                           "Unable to resolve target path: " + target_path.string(),
                           "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        HEARTH_LOG_WARN("Path escapes root: " + canonical_candidate.string());
        return HearthError{ErrorCategory::Security,
                           "Path escapes root: " + canonical_candidate.string(),
                           "path_outside_root"};
    }

    return canonical_candidate;
}

}  // namespace hearth::policy

#include "core/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace hearth::core::config {

using errors::ErrorCategory;
using errors::HearthError;
using nlohmann::json;

namespace {

constexpr int kMinToolTimeout = 1;
constexpr int kMaxToolTimeout = 3600;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::optional<bool> parse_bool(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

// Rejects trailing text and values outside the int range.
std::optional<int> parse_int(const std::string& text) {
    int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> json_int(const json& field) {
    if (field.is_number_unsigned()) {
        const auto value = field.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    if (!field.is_number_integer()) {
        return std::nullopt;
    }
    const auto value = field.get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<ImageFallbackMode> parse_fallback_mode(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "degrade") {
        return ImageFallbackMode::Degrade;
    }
    if (lowered == "fail_fast") {
        return ImageFallbackMode::FailFast;
    }
    return std::nullopt;
}

const char* read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

HearthError bad_value(const std::string& key, const std::string& value) {
    return HearthError{ErrorCategory::Input,
                       "Invalid value for " + key + ": " + value,
                       "invalid_setting"};
}

}  // namespace

std::string to_string(const Environment environment) {
    switch (environment) {
        case Environment::Development:
            return "development";
        case Environment::Staging:
            return "staging";
        case Environment::Production:
            return "production";
        case Environment::Testing:
            return "testing";
        default:
            return "unknown";
    }
}

std::optional<Environment> parse_environment(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "development") {
        return Environment::Development;
    }
    if (lowered == "staging") {
        return Environment::Staging;
    }
    if (lowered == "production") {
        return Environment::Production;
    }
    if (lowered == "testing") {
        return Environment::Testing;
    }
    return std::nullopt;
}

errors::Result<Settings> Settings::load(
    const std::optional<std::filesystem::path>& config_file) {
    Settings settings = Settings::defaults();

    if (config_file.has_value()) {
        std::ifstream in(config_file.value());
        if (!in.is_open()) {
            return HearthError{ErrorCategory::Input,
                               "Unable to open settings file: " +
                                   config_file->string(),
                               "settings_file_unreadable"};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        auto applied = settings.apply_json(buffer.str());
        if (errors::is_error(applied)) {
            return errors::get_error(applied);
        }
    }

    auto env_applied = settings.apply_environment();
    if (errors::is_error(env_applied)) {
        return errors::get_error(env_applied);
    }
    return settings;
}

errors::Result<bool> Settings::apply_json(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return HearthError{ErrorCategory::Input,
                           "Settings file is not a JSON object.",
                           "settings_file_invalid"};
    }

    try {
        if (doc.contains("environment")) {
            const auto text = doc.at("environment").get<std::string>();
            const auto parsed = parse_environment(text);
            if (!parsed.has_value()) {
                return bad_value("environment", text);
            }
            environment = parsed.value();
        }
        if (doc.contains("sandbox_enabled")) {
            sandbox_enabled = doc.at("sandbox_enabled").get<bool>();
        }
        if (doc.contains("sandbox_artifacts_enabled")) {
            sandbox_artifacts_enabled = doc.at("sandbox_artifacts_enabled").get<bool>();
        }
        if (doc.contains("container_cli")) {
            container_cli = doc.at("container_cli").get<std::string>();
        }
        if (doc.contains("sandbox_image")) {
            sandbox_image = doc.at("sandbox_image").get<std::string>();
        }
        if (doc.contains("fallback_image")) {
            fallback_image = doc.at("fallback_image").get<std::string>();
        }
        if (doc.contains("image_fallback")) {
            const auto text = doc.at("image_fallback").get<std::string>();
            const auto parsed = parse_fallback_mode(text);
            if (!parsed.has_value()) {
                return bad_value("image_fallback", text);
            }
            image_fallback = parsed.value();
        }
        if (doc.contains("unsandboxed_interpreter")) {
            unsandboxed_interpreter = doc.at("unsandboxed_interpreter").get<std::string>();
        }
        for (const auto& [key, target] :
             {std::pair<const char*, int*>{"tool_timeout_seconds", &tool_timeout_seconds},
              std::pair<const char*, int*>{"analysis_tool_timeout_seconds",
                                           &analysis_tool_timeout_seconds}}) {
            if (!doc.contains(key)) {
                continue;
            }
            const auto& field = doc.at(key);
            const auto parsed = json_int(field);
            if (!parsed.has_value()) {
                return bad_value(key, field.dump());
            }
            *target = parsed.value();
        }
        if (doc.contains("artifact_dir")) {
            artifact_dir = doc.at("artifact_dir").get<std::string>();
        }
        if (doc.contains("analysis_tools")) {
            analysis_tools.clear();
            for (const auto& name : doc.at("analysis_tools")) {
                analysis_tools.insert(name.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        return HearthError{ErrorCategory::Input,
                           std::string("Settings file has a wrongly typed field: ") +
                               e.what(),
                           "settings_file_invalid"};
    }
    return true;
}

errors::Result<bool> Settings::apply_environment() {
    if (const char* value = read_env("HEARTH_ENVIRONMENT")) {
        const auto parsed = parse_environment(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_ENVIRONMENT", value);
        }
        environment = parsed.value();
    }
    if (const char* value = read_env("HEARTH_SANDBOX_ENABLED")) {
        const auto parsed = parse_bool(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_SANDBOX_ENABLED", value);
        }
        sandbox_enabled = parsed.value();
    }
    if (const char* value = read_env("HEARTH_SANDBOX_ARTIFACTS_ENABLED")) {
        const auto parsed = parse_bool(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_SANDBOX_ARTIFACTS_ENABLED", value);
        }
        sandbox_artifacts_enabled = parsed.value();
    }
    if (const char* value = read_env("HEARTH_CONTAINER_CLI")) {
        container_cli = value;
    }
    if (const char* value = read_env("HEARTH_SANDBOX_IMAGE")) {
        sandbox_image = value;
    }
    if (const char* value = read_env("HEARTH_SANDBOX_FALLBACK_IMAGE")) {
        fallback_image = value;
    }
    if (const char* value = read_env("HEARTH_SANDBOX_IMAGE_FALLBACK")) {
        const auto parsed = parse_fallback_mode(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_SANDBOX_IMAGE_FALLBACK", value);
        }
        image_fallback = parsed.value();
    }
    if (const char* value = read_env("HEARTH_UNSANDBOXED_INTERPRETER")) {
        unsandboxed_interpreter = value;
    }
    if (const char* value = read_env("HEARTH_TOOL_TIMEOUT_SECONDS")) {
        const auto parsed = parse_int(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_TOOL_TIMEOUT_SECONDS", value);
        }
        tool_timeout_seconds = parsed.value();
    }
    if (const char* value = read_env("HEARTH_ANALYSIS_TOOL_TIMEOUT_SECONDS")) {
        const auto parsed = parse_int(value);
        if (!parsed.has_value()) {
            return bad_value("HEARTH_ANALYSIS_TOOL_TIMEOUT_SECONDS", value);
        }
        analysis_tool_timeout_seconds = parsed.value();
    }
    if (const char* value = read_env("HEARTH_ARTIFACT_DIR")) {
        artifact_dir = value;
    }
    return true;
}

errors::Result<bool> Settings::validate() const {
    if (tool_timeout_seconds < kMinToolTimeout || tool_timeout_seconds > kMaxToolTimeout) {
        return HearthError{ErrorCategory::Input,
                           "tool_timeout_seconds out of bounds",
                           "bounds_error",
                           "Must be between 1 and 3600."};
    }
    if (analysis_tool_timeout_seconds < kMinToolTimeout ||
        analysis_tool_timeout_seconds > kMaxToolTimeout) {
        return HearthError{ErrorCategory::Input,
                           "analysis_tool_timeout_seconds out of bounds",
                           "bounds_error",
                           "Must be between 1 and 3600."};
    }
    if (container_cli.empty()) {
        return HearthError{ErrorCategory::Input, "container_cli cannot be empty.",
                           "invalid_setting"};
    }
    return require_sandbox_policy(*this);
}

bool Settings::is_analysis_tool(const std::string& tool_name) const {
    return analysis_tools.find(tool_name) != analysis_tools.end();
}

errors::Result<bool> require_sandbox_policy(const Settings& settings) {
    if (!settings.sandbox_enabled && settings.is_production()) {
        return HearthError{
            ErrorCategory::Configuration,
            "Sandbox MUST be enabled in production (HEARTH_SANDBOX_ENABLED=true). "
            "Unsandboxed script execution is only permitted outside production.",
            "sandbox_disabled_in_production"};
    }
    return true;
}

}  // namespace hearth::core::config

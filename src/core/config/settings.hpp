#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include "core/errors/hearth_errors.hpp"

namespace hearth::core::config {

enum class Environment {
    Development,
    Staging,
    Production,
    Testing
};

// What SandboxRunner does when the preferred image is missing.
enum class ImageFallbackMode {
    Degrade,   // warn and use the fallback interpreter image
    FailFast   // return a failed SandboxResult
};

struct Settings {
    Environment environment = Environment::Development;

    bool sandbox_enabled = true;
    bool sandbox_artifacts_enabled = false;
    std::string container_cli = "podman";
    std::string sandbox_image = "hearth-sandbox:latest";
    std::string fallback_image = "python:3.11-slim";
    ImageFallbackMode image_fallback = ImageFallbackMode::Degrade;
    std::string unsandboxed_interpreter = "python3";

    int tool_timeout_seconds = 30;
    int analysis_tool_timeout_seconds = 180;

    std::filesystem::path artifact_dir = "data/artifacts";

    std::set<std::string> analysis_tools = {
        "consult_data_science_team",
        "run_custom_analysis",
        "analyze_energy",
        "diagnose_issue"};

    static Settings defaults() { return Settings{}; }

    // Defaults, then the JSON file (if given), then HEARTH_* environment.
    static errors::Result<Settings> load(
        const std::optional<std::filesystem::path>& config_file = std::nullopt);

    errors::Result<bool> apply_json(const std::string& json_text);
    errors::Result<bool> apply_environment();

    // Input errors for bad ranges; Configuration error when the sandbox is
    // disabled in production.
    errors::Result<bool> validate() const;

    bool is_analysis_tool(const std::string& tool_name) const;
    bool is_production() const { return environment == Environment::Production; }
};

std::string to_string(Environment environment);
std::optional<Environment> parse_environment(const std::string& text);

// The one fatal configuration check, shared by startup and SandboxRunner.
errors::Result<bool> require_sandbox_policy(const Settings& settings);

}  // namespace hearth::core::config

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/hearth_errors.hpp"
#include "sandbox/artifact_validator.hpp"
#include "sandbox/sandbox_policy.hpp"

namespace hearth::sandbox {

// Fixed in-container locations. Generated scripts are told to read their
// input from kContainerDataPath and write charts/CSVs into kContainerOutputDir.
inline constexpr const char* kContainerScriptPath = "/workspace/script.py";
inline constexpr const char* kContainerDataPath = "/workspace/data.json";
inline constexpr const char* kContainerOutputDir = "/workspace/output";

// Owns a host temp directory and removes it on destruction.
class ScratchDirectory {
    struct PrivateTag {};

public:
    static core::errors::Result<std::shared_ptr<ScratchDirectory>> create(
        const std::string& prefix);

    // Only reachable through create().
    ScratchDirectory(PrivateTag, std::filesystem::path path);

    ~ScratchDirectory();
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct SandboxResult {
    std::string id;
    bool success = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_seconds = 0.0;
    bool timed_out = false;
    bool cancelled = false;
    std::string policy_name;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;
    std::optional<double> memory_peak_mb;
    std::optional<double> cpu_time_seconds;

    std::vector<ArtifactMeta> artifacts;
    int artifacts_rejected = 0;
    // Keeps artifact source files alive until they have been persisted.
    std::shared_ptr<ScratchDirectory> workspace;
};

nlohmann::json to_json(const SandboxResult& result);

struct RuntimeStatus {
    bool cli_available = false;
    std::string cli_version;
    bool strong_isolation_available = false;
    bool image_available = false;
    std::string image;
    std::vector<std::string> errors;
};

nlohmann::json to_json(const RuntimeStatus& status);

class SandboxRunner {
public:
    explicit SandboxRunner(core::config::Settings settings);

    // Always yields a SandboxResult for runtime failures (missing CLI, spawn
    // error, timeout, missing image in fail-fast mode). The only error
    // returned is Configuration: sandbox disabled in production.
    core::errors::Result<SandboxResult> run(
        const std::string& script,
        const std::optional<SandboxPolicy>& policy = std::nullopt,
        const std::optional<std::filesystem::path>& data_path = std::nullopt,
        const std::map<std::string, std::string>& environment = {},
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Pure argv assembly; `policy` must already be downgraded if needed.
    static std::vector<std::string> build_command(
        const std::string& container_cli, const SandboxPolicy& policy,
        const std::filesystem::path& script_path,
        const std::optional<std::filesystem::path>& data_path,
        const std::optional<std::filesystem::path>& output_dir,
        const std::map<std::string, std::string>& environment,
        const std::string& image);

    // Checked once per runner, then cached.
    bool strong_isolation_available();

    // Preferred image if present, else the fallback image (Degrade) or an
    // Execution error (FailFast).
    core::errors::Result<std::string> resolve_image();

    void refresh_runtime_checks();

    RuntimeStatus check_runtime();

    // Returns the policy unchanged, or with strong isolation and seccomp
    // switched off when the isolation runtime is not installed.
    SandboxPolicy effective_policy(const SandboxPolicy& policy);

    static bool resolve_artifacts_enabled(bool global_enabled, bool policy_enabled);

    static bool is_safe_env_key(const std::string& key);

    const core::config::Settings& settings() const { return settings_; }

private:
    SandboxResult run_unsandboxed(const std::string& script, const SandboxPolicy& policy,
                                  std::shared_ptr<std::atomic_bool> cancel_token);
    bool image_exists(const std::string& image);

    core::config::Settings settings_;
    ArtifactEgressValidator validator_;

    std::mutex check_mutex_;
    std::optional<bool> strong_isolation_cache_;
    std::optional<std::string> image_cache_;
};

}  // namespace hearth::sandbox

#include "sandbox/sandbox_runner.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/process_runner.hpp"

namespace hearth::sandbox {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using nlohmann::json;

namespace {

constexpr std::uint32_t kRuntimeCheckTimeoutMs = 10000;
// Lets the container CLI forward SIGTERM so `--rm` can clean up.
constexpr std::uint32_t kTerminateGraceMs = 3000;
constexpr const char* kStrongIsolationRuntime = "runsc";

std::string format_utc(const std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm parts {};
    gmtime_r(&seconds, &parts);
    char buffer[32];
    const std::size_t written =
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return std::string(buffer, written);
}

core::errors::Result<std::filesystem::path> write_script(
    const std::filesystem::path& directory, const std::string& script) {
    const auto script_path = directory / "script.py";
    std::ofstream out(script_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to create script file: " + script_path.string(),
                           "script_write_failed"};
    }
    out << script;
    out.close();
    if (!out) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to write script file: " + script_path.string(),
                           "script_write_failed"};
    }

    // The container user is not the host user.
    std::error_code ec;
    std::filesystem::permissions(script_path,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::others_read,
                                 ec);
    return script_path;
}

SandboxResult failed_result(const SandboxPolicy& policy, std::string reason,
                            const std::chrono::system_clock::time_point started_at) {
    SandboxResult result;
    result.id = core::config::generate_long_id();
    result.success = false;
    result.exit_code = -1;
    result.stderr_text = std::move(reason);
    result.policy_name = policy.name;
    result.started_at = started_at;
    result.completed_at = std::chrono::system_clock::now();
    result.duration_seconds =
        std::chrono::duration<double>(result.completed_at - started_at).count();
    return result;
}

void apply_capture(SandboxResult& result, const ProcessCapture& capture) {
    result.exit_code = capture.exit_code;
    result.timed_out = capture.timed_out;
    result.cancelled = capture.cancelled;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    if (capture.timed_out) {
        result.stderr_text = "Execution timed out";
    } else if (capture.cancelled) {
        result.stderr_text = "Execution cancelled";
    }
    result.success = capture.exit_code == 0 && !capture.timed_out && !capture.cancelled;
}

}  // namespace

core::errors::Result<std::shared_ptr<ScratchDirectory>> ScratchDirectory::create(
    const std::string& prefix) {
    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return HearthError{ErrorCategory::Internal,
                           "No usable temp directory: " + ec.message(),
                           "temp_dir_unavailable"};
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    if (mkdtemp(pattern.data()) == nullptr) {
        return HearthError{ErrorCategory::Internal,
                           "Unable to create temp directory under " + base.string(),
                           "temp_dir_create_failed"};
    }
    return std::make_shared<ScratchDirectory>(PrivateTag{}, pattern);
}

ScratchDirectory::ScratchDirectory(PrivateTag, std::filesystem::path path)
    : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        HEARTH_LOG_WARN("Failed to remove sandbox scratch dir " + path_.string() + ": " +
                        ec.message());
    }
}

json to_json(const SandboxResult& result) {
    json payload;
    payload["id"] = result.id;
    payload["success"] = result.success;
    payload["exit_code"] = result.exit_code;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["duration_seconds"] = result.duration_seconds;
    payload["timed_out"] = result.timed_out;
    payload["cancelled"] = result.cancelled;
    payload["policy_name"] = result.policy_name;
    payload["started_at"] = format_utc(result.started_at);
    payload["completed_at"] = format_utc(result.completed_at);
    payload["memory_peak_mb"] =
        result.memory_peak_mb.has_value() ? json(*result.memory_peak_mb) : json(nullptr);
    payload["cpu_time_seconds"] = result.cpu_time_seconds.has_value()
                                      ? json(*result.cpu_time_seconds)
                                      : json(nullptr);

    json artifacts = json::array();
    for (const auto& artifact : result.artifacts) {
        artifacts.push_back({{"filename", artifact.filename},
                             {"content_type", artifact.content_type},
                             {"size_bytes", artifact.size_bytes}});
    }
    payload["artifacts"] = artifacts;
    payload["artifacts_rejected"] = result.artifacts_rejected;
    return payload;
}

json to_json(const RuntimeStatus& status) {
    json payload;
    payload["cli_available"] = status.cli_available;
    payload["cli_version"] = status.cli_version;
    payload["strong_isolation_available"] = status.strong_isolation_available;
    payload["image_available"] = status.image_available;
    payload["image"] = status.image;
    payload["errors"] = status.errors;
    return payload;
}

SandboxRunner::SandboxRunner(core::config::Settings settings)
    : settings_(std::move(settings)) {}

bool SandboxRunner::resolve_artifacts_enabled(const bool global_enabled,
                                              const bool policy_enabled) {
    return global_enabled && policy_enabled;
}

bool SandboxRunner::is_safe_env_key(const std::string& key) {
    bool has_alnum = false;
    for (const char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0) {
            has_alnum = true;
        } else if (c != '_') {
            return false;
        }
    }
    return has_alnum;
}

std::vector<std::string> SandboxRunner::build_command(
    const std::string& container_cli, const SandboxPolicy& policy,
    const std::filesystem::path& script_path,
    const std::optional<std::filesystem::path>& data_path,
    const std::optional<std::filesystem::path>& output_dir,
    const std::map<std::string, std::string>& environment, const std::string& image) {
    std::vector<std::string> cmd = {container_cli, "run", "--rm"};

    const auto policy_args = to_runtime_args(policy);
    cmd.insert(cmd.end(), policy_args.begin(), policy_args.end());

    cmd.push_back("--volume");
    cmd.push_back(script_path.string() + ":" + kContainerScriptPath + ":ro");

    if (data_path.has_value()) {
        cmd.push_back("--volume");
        cmd.push_back(data_path->string() + ":" + kContainerDataPath + ":ro");
    }

    // The only writable mount.
    if (output_dir.has_value()) {
        cmd.push_back("--volume");
        cmd.push_back(output_dir->string() + ":" + kContainerOutputDir + ":rw");
        cmd.push_back("--env");
        cmd.push_back(std::string("OUTDIR=") + kContainerOutputDir);
    }

    // Stray warnings on stdout break JSON extraction downstream.
    cmd.push_back("--env");
    cmd.push_back("PYTHONWARNINGS=ignore::DeprecationWarning");
    cmd.push_back("--env");
    cmd.push_back("MPLCONFIGDIR=/tmp");

    for (const auto& [key, value] : environment) {
        if (!is_safe_env_key(key)) {
            HEARTH_LOG_WARN("Dropping sandbox env var with unsafe name: " + key);
            continue;
        }
        cmd.push_back("--env");
        cmd.push_back(key + "=" + value);
    }

    cmd.push_back(image);
    cmd.push_back("python");
    cmd.push_back(kContainerScriptPath);
    return cmd;
}

bool SandboxRunner::strong_isolation_available() {
    std::lock_guard<std::mutex> lock(check_mutex_);
    if (strong_isolation_cache_.has_value()) {
        return *strong_isolation_cache_;
    }

    ProcessOptions options;
    options.timeout_ms = kRuntimeCheckTimeoutMs;

    bool available = false;
    auto check = run_process(
        {settings_.container_cli, "info", "--format", "{{.Host.OCIRuntime.Name}}"}, options);
    if (core::errors::is_error(check)) {
        HEARTH_LOG_WARN("Failed to check isolation runtime: " +
                        core::errors::get_error(check).message);
    } else if (core::errors::get_value(check).stdout_text.find(kStrongIsolationRuntime) !=
               std::string::npos) {
        available = true;
    } else {
        // Not the default runtime; it may still be registered.
        auto runtimes =
            run_process({settings_.container_cli, "info", "--format", "json"}, options);
        available = !core::errors::is_error(runtimes) &&
                    core::errors::get_value(runtimes).stdout_text.find(
                        kStrongIsolationRuntime) != std::string::npos;
    }

    strong_isolation_cache_ = available;
    return available;
}

bool SandboxRunner::image_exists(const std::string& image) {
    ProcessOptions options;
    options.timeout_ms = kRuntimeCheckTimeoutMs;
    auto check = run_process({settings_.container_cli, "image", "exists", image}, options);
    if (core::errors::is_error(check)) {
        return false;
    }
    const auto& capture = core::errors::get_value(check);
    if (capture.timed_out) {
        HEARTH_LOG_WARN("Timed out checking image '" + image +
                        "' (container machine may not be running)");
        return false;
    }
    return capture.exit_code == 0;
}

core::errors::Result<std::string> SandboxRunner::resolve_image() {
    std::lock_guard<std::mutex> lock(check_mutex_);
    if (image_cache_.has_value()) {
        return *image_cache_;
    }

    if (image_exists(settings_.sandbox_image)) {
        image_cache_ = settings_.sandbox_image;
        return settings_.sandbox_image;
    }

    if (settings_.image_fallback == core::config::ImageFallbackMode::FailFast) {
        return HearthError{ErrorCategory::Execution,
                           "Container image '" + settings_.sandbox_image + "' not found.",
                           "sandbox_image_missing",
                           "Build the sandbox image or set HEARTH_SANDBOX_IMAGE_FALLBACK=degrade."};
    }

    HEARTH_LOG_WARN("Container image '" + settings_.sandbox_image +
                    "' not found, falling back to '" + settings_.fallback_image +
                    "'. The fallback image lacks data-science packages and analysis "
                    "scripts may fail.");
    return settings_.fallback_image;
}

void SandboxRunner::refresh_runtime_checks() {
    std::lock_guard<std::mutex> lock(check_mutex_);
    strong_isolation_cache_.reset();
    image_cache_.reset();
}

SandboxPolicy SandboxRunner::effective_policy(const SandboxPolicy& policy) {
    if (!policy.use_strong_isolation || strong_isolation_available()) {
        return policy;
    }
    HEARTH_LOG_WARN("Isolation runtime (" + policy.isolation_runtime +
                    ") not available, running policy '" + policy.name +
                    "' with standard container isolation");
    SandboxPolicy downgraded = policy;
    downgraded.use_strong_isolation = false;
    downgraded.seccomp_profile.reset();
    return downgraded;
}

RuntimeStatus SandboxRunner::check_runtime() {
    RuntimeStatus status;
    status.image = settings_.sandbox_image;

    ProcessOptions options;
    options.timeout_ms = kRuntimeCheckTimeoutMs;

    auto version = run_process({settings_.container_cli, "version"}, options);
    if (core::errors::is_error(version)) {
        status.errors.push_back("Container runtime not found: " + settings_.container_cli);
        return status;
    }
    const auto& version_capture = core::errors::get_value(version);
    if (version_capture.exit_code != 0) {
        status.errors.push_back("Container runtime '" + settings_.container_cli +
                                "' is not usable (exit code " +
                                std::to_string(version_capture.exit_code) + ")");
        return status;
    }
    status.cli_available = true;
    status.cli_version = version_capture.stdout_text;
    while (!status.cli_version.empty() &&
           std::isspace(static_cast<unsigned char>(status.cli_version.back())) != 0) {
        status.cli_version.pop_back();
    }

    auto runtimes = run_process(
        {settings_.container_cli, "info", "--format", "{{json .Host.Runtimes}}"}, options);
    if (core::errors::is_error(runtimes)) {
        status.errors.push_back("Error checking runtimes: " +
                                core::errors::get_error(runtimes).message);
    } else if (core::errors::get_value(runtimes).stdout_text.find(
                   kStrongIsolationRuntime) != std::string::npos) {
        status.strong_isolation_available = true;
    } else {
        status.errors.push_back(std::string("Isolation runtime (") +
                                kStrongIsolationRuntime + ") not configured");
    }

    status.image_available = image_exists(settings_.sandbox_image);
    if (!status.image_available) {
        status.errors.push_back("Image '" + settings_.sandbox_image + "' not found locally");
    }
    return status;
}

core::errors::Result<SandboxResult> SandboxRunner::run(
    const std::string& script, const std::optional<SandboxPolicy>& policy,
    const std::optional<std::filesystem::path>& data_path,
    const std::map<std::string, std::string>& environment,
    std::shared_ptr<std::atomic_bool> cancel_token) {
    auto gate = core::config::require_sandbox_policy(settings_);
    if (core::errors::is_error(gate)) {
        HEARTH_LOG_ERROR(core::errors::get_error(gate).message);
        return core::errors::get_error(gate);
    }

    const SandboxPolicy requested = policy.has_value() ? *policy : default_policy();
    const auto started_at = std::chrono::system_clock::now();

    auto valid = validate_policy(requested);
    if (core::errors::is_error(valid)) {
        return failed_result(requested,
                             "Invalid sandbox policy: " +
                                 core::errors::get_error(valid).message,
                             started_at);
    }

    if (!settings_.sandbox_enabled) {
        return run_unsandboxed(script, requested, std::move(cancel_token));
    }

    const bool artifacts_active = resolve_artifacts_enabled(
        settings_.sandbox_artifacts_enabled, requested.artifacts_enabled);

    auto scratch_result = ScratchDirectory::create("hearth-sandbox-");
    if (core::errors::is_error(scratch_result)) {
        return failed_result(requested,
                             "Sandbox error: " +
                                 core::errors::get_error(scratch_result).message,
                             started_at);
    }
    auto scratch = core::errors::get_value(scratch_result);

    auto script_result = write_script(scratch->path(), script);
    if (core::errors::is_error(script_result)) {
        return failed_result(requested,
                             "Sandbox error: " +
                                 core::errors::get_error(script_result).message,
                             started_at);
    }
    const auto script_path = core::errors::get_value(script_result);

    // Always mounted so scripts writing to OUTDIR do not crash on the
    // read-only root, even when artifacts are not collected.
    const auto output_dir = scratch->path() / "output";
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (!ec) {
        std::filesystem::permissions(output_dir, std::filesystem::perms::all, ec);
    }
    if (ec) {
        return failed_result(requested,
                             "Sandbox error: unable to prepare output directory: " +
                                 ec.message(),
                             started_at);
    }

    std::optional<std::filesystem::path> data_mount;
    if (data_path.has_value()) {
        if (std::filesystem::exists(*data_path, ec)) {
            data_mount = std::filesystem::absolute(*data_path, ec);
        } else {
            HEARTH_LOG_WARN("Sandbox data file not found, not mounting: " +
                            data_path->string());
        }
    }

    const SandboxPolicy effective = effective_policy(requested);

    auto image = resolve_image();
    if (core::errors::is_error(image)) {
        const auto& err = core::errors::get_error(image);
        HEARTH_LOG_ERROR("Sandbox image unavailable [" + err.code + "]: " + err.message);
        return failed_result(requested, err.message, started_at);
    }

    const auto argv = build_command(settings_.container_cli, effective, script_path,
                                    data_mount, output_dir, environment,
                                    core::errors::get_value(image));

    ProcessOptions options;
    options.timeout_ms = static_cast<std::uint32_t>(effective.timeout_seconds) * 1000U;
    options.cancel_token = std::move(cancel_token);
    options.terminate_grace_ms = kTerminateGraceMs;

    HEARTH_LOG_DEBUG("Sandbox launch: policy=" + effective.name +
                     " image=" + core::errors::get_value(image));
    auto capture = run_process(argv, options);
    if (core::errors::is_error(capture)) {
        const auto& err = core::errors::get_error(capture);
        if (err.code == "executable_not_found") {
            SandboxResult result = failed_result(
                requested,
                "Container runtime not found at '" + settings_.container_cli +
                    "'. Install Podman or disable sandbox.",
                started_at);
            result.duration_seconds = 0.0;
            return result;
        }
        return failed_result(requested, "Sandbox error: " + err.message, started_at);
    }

    const auto& process = core::errors::get_value(capture);
    SandboxResult result;
    result.id = core::config::generate_long_id();
    result.policy_name = requested.name;
    result.started_at = started_at;
    result.completed_at = std::chrono::system_clock::now();
    result.duration_seconds = process.duration_ms / 1000.0;
    apply_capture(result, process);

    if (artifacts_active) {
        ArtifactScan scan = validator_.validate_artifacts(output_dir);
        result.artifacts = std::move(scan.accepted);
        result.artifacts_rejected = scan.rejected;
        result.workspace = scratch;
    }

    if (result.success) {
        HEARTH_LOG_INFO("Sandbox run " + result.id + " finished in " +
                        std::to_string(result.duration_seconds) + "s");
    } else {
        HEARTH_LOG_WARN("Sandbox run " + result.id + " failed (exit code " +
                        std::to_string(result.exit_code) +
                        (result.timed_out ? ", timed out" : "") + ")");
    }
    return result;
}

SandboxResult SandboxRunner::run_unsandboxed(const std::string& script,
                                             const SandboxPolicy& policy,
                                             std::shared_ptr<std::atomic_bool> cancel_token) {
    const auto started_at = std::chrono::system_clock::now();
    HEARTH_LOG_WARN("Sandbox disabled: running script without isolation using " +
                    settings_.unsandboxed_interpreter);

    SandboxPolicy reported = policy;
    reported.name = policy.name + ":unsandboxed";

    auto scratch_result = ScratchDirectory::create("hearth-unsandboxed-");
    if (core::errors::is_error(scratch_result)) {
        return failed_result(reported,
                             "Sandbox error: " +
                                 core::errors::get_error(scratch_result).message,
                             started_at);
    }
    const auto scratch = core::errors::get_value(scratch_result);

    auto script_result = write_script(scratch->path(), script);
    if (core::errors::is_error(script_result)) {
        return failed_result(reported,
                             "Sandbox error: " +
                                 core::errors::get_error(script_result).message,
                             started_at);
    }

    ProcessOptions options;
    options.working_directory = scratch->path();
    options.timeout_ms = static_cast<std::uint32_t>(policy.timeout_seconds) * 1000U;
    options.cancel_token = std::move(cancel_token);

    auto capture = run_process(
        {settings_.unsandboxed_interpreter, core::errors::get_value(script_result).string()},
        options);
    if (core::errors::is_error(capture)) {
        return failed_result(reported,
                             "Sandbox error: " + core::errors::get_error(capture).message,
                             started_at);
    }

    const auto& process = core::errors::get_value(capture);
    SandboxResult result;
    result.id = core::config::generate_long_id();
    result.policy_name = reported.name;
    result.started_at = started_at;
    result.completed_at = std::chrono::system_clock::now();
    result.duration_seconds = process.duration_ms / 1000.0;
    result.memory_peak_mb = process.max_rss_mb;
    result.cpu_time_seconds = process.cpu_time_seconds;
    apply_capture(result, process);
    return result;
}

}  // namespace hearth::sandbox

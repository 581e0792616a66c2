#include "sandbox/sandbox_policy.hpp"

#include <utility>

namespace hearth::sandbox {

using core::errors::ErrorCategory;
using core::errors::HearthError;
using nlohmann::json;

namespace {

SandboxPolicy preset(std::string name, const SecurityLevel level,
                     const int timeout_seconds, const int memory_mb,
                     const int cpu_shares, const int pids_limit,
                     const int temp_dir_mb) {
    SandboxPolicy policy;
    policy.name = std::move(name);
    policy.level = level;
    policy.timeout_seconds = timeout_seconds;
    policy.network = NetworkMode::None;
    policy.resources.memory_mb = memory_mb;
    policy.resources.cpu_shares = cpu_shares;
    policy.resources.pids_limit = pids_limit;
    policy.temp_dir_mb = temp_dir_mb;
    return policy;
}

const std::vector<SandboxPolicy>& presets() {
    static const std::vector<SandboxPolicy> kPresets = {
        preset("minimal", SecurityLevel::Minimal, 10, 128, 128, 16, 10),
        preset("analysis", SecurityLevel::Analysis, 30, 512, 256, 32, 50),
        preset("standard", SecurityLevel::Standard, 60, 1024, 512, 64, 100),
        preset("extended", SecurityLevel::Extended, 180, 2048, 768, 128, 256),
    };
    return kPresets;
}

HearthError out_of_range(const std::string& field, const int value,
                         const int low, const int high) {
    return HearthError{ErrorCategory::Input,
                       field + " out of bounds: " + std::to_string(value),
                       "policy_bounds_error",
                       "Must be between " + std::to_string(low) + " and " +
                           std::to_string(high) + "."};
}

}  // namespace

std::string to_string(const SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Minimal:
            return "minimal";
        case SecurityLevel::Analysis:
            return "analysis";
        case SecurityLevel::Standard:
            return "standard";
        case SecurityLevel::Extended:
            return "extended";
        default:
            return "unknown";
    }
}

std::string to_string(const NetworkMode mode) {
    switch (mode) {
        case NetworkMode::None:
            return "none";
        case NetworkMode::LocalOnly:
            return "local_only";
        case NetworkMode::Limited:
            return "limited";
        default:
            return "unknown";
    }
}

std::string to_string(const MountMode mode) {
    return mode == MountMode::ReadWrite ? "rw" : "ro";
}

core::errors::Result<SandboxPolicy> get_policy(const std::string& name) {
    for (const auto& policy : presets()) {
        if (policy.name == name) {
            return policy;
        }
    }

    std::string available;
    for (const auto& known : policy_names()) {
        if (!available.empty()) {
            available += ", ";
        }
        available += known;
    }
    return HearthError{ErrorCategory::Input,
                       "Unknown policy '" + name + "'. Available: " + available,
                       "unknown_policy"};
}

SandboxPolicy default_policy() {
    return core::errors::get_value(get_policy("standard"));
}

std::vector<std::string> policy_names() {
    std::vector<std::string> names;
    for (const auto& policy : presets()) {
        names.push_back(policy.name);
    }
    return names;
}

core::errors::Result<bool> validate_policy(const SandboxPolicy& policy) {
    if (policy.name.empty()) {
        return HearthError{ErrorCategory::Input, "Policy name cannot be empty.",
                           "invalid_policy"};
    }
    if (policy.timeout_seconds < 5 || policy.timeout_seconds > 300) {
        return out_of_range("timeout_seconds", policy.timeout_seconds, 5, 300);
    }
    if (policy.temp_dir_mb < 10 || policy.temp_dir_mb > 1024) {
        return out_of_range("temp_dir_mb", policy.temp_dir_mb, 10, 1024);
    }
    const auto& limits = policy.resources;
    if (limits.memory_mb < 64 || limits.memory_mb > 4096) {
        return out_of_range("memory_mb", limits.memory_mb, 64, 4096);
    }
    if (limits.cpu_shares < 64 || limits.cpu_shares > 1024) {
        return out_of_range("cpu_shares", limits.cpu_shares, 64, 1024);
    }
    if (limits.pids_limit < 8 || limits.pids_limit > 256) {
        return out_of_range("pids_limit", limits.pids_limit, 8, 256);
    }
    if (limits.nofile_soft <= 0 || limits.nofile_hard < limits.nofile_soft) {
        return HearthError{ErrorCategory::Input,
                           "nofile limits must satisfy 0 < soft <= hard",
                           "policy_bounds_error"};
    }
    if (limits.cpu_period <= 0 || limits.cpu_quota <= 0) {
        return HearthError{ErrorCategory::Input,
                           "cpu_period and cpu_quota must be positive",
                           "policy_bounds_error"};
    }
    if (policy.network == NetworkMode::Limited && policy.allowed_hosts.empty()) {
        return HearthError{ErrorCategory::Input,
                           "Limited network mode requires at least one allowed host.",
                           "invalid_policy"};
    }
    return true;
}

core::errors::Result<SandboxPolicy> make_policy(const std::string& base_name,
                                                const PolicyOverrides& overrides) {
    auto base = get_policy(base_name);
    if (core::errors::is_error(base)) {
        return core::errors::get_error(base);
    }
    SandboxPolicy policy = core::errors::get_value(base);

    if (overrides.timeout_seconds) policy.timeout_seconds = *overrides.timeout_seconds;
    if (overrides.network) policy.network = *overrides.network;
    if (overrides.allowed_hosts) policy.allowed_hosts = *overrides.allowed_hosts;
    if (overrides.mounts) policy.mounts = *overrides.mounts;
    if (overrides.temp_dir_mb) policy.temp_dir_mb = *overrides.temp_dir_mb;
    if (overrides.memory_mb) policy.resources.memory_mb = *overrides.memory_mb;
    if (overrides.cpu_shares) policy.resources.cpu_shares = *overrides.cpu_shares;
    if (overrides.pids_limit) policy.resources.pids_limit = *overrides.pids_limit;
    if (overrides.use_strong_isolation) {
        policy.use_strong_isolation = *overrides.use_strong_isolation;
    }
    if (overrides.seccomp_profile) policy.seccomp_profile = *overrides.seccomp_profile;
    if (overrides.artifacts_enabled) policy.artifacts_enabled = *overrides.artifacts_enabled;

    auto valid = validate_policy(policy);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    return policy;
}

std::vector<std::string> to_runtime_args(const SandboxPolicy& policy) {
    std::vector<std::string> args;

    if (policy.use_strong_isolation) {
        args.emplace_back("--runtime");
        args.push_back(policy.isolation_runtime);
    }

    const auto& limits = policy.resources;
    args.emplace_back("--memory");
    args.push_back(std::to_string(limits.memory_mb) + "m");
    args.emplace_back("--cpu-shares");
    args.push_back(std::to_string(limits.cpu_shares));
    args.emplace_back("--cpu-period");
    args.push_back(std::to_string(limits.cpu_period));
    args.emplace_back("--cpu-quota");
    args.push_back(std::to_string(limits.cpu_quota));
    args.emplace_back("--pids-limit");
    args.push_back(std::to_string(limits.pids_limit));
    args.emplace_back("--ulimit");
    args.push_back("nofile=" + std::to_string(limits.nofile_soft) + ":" +
                   std::to_string(limits.nofile_hard));

    // Limited mode has no CLI flag of its own; host filtering happens in
    // the isolation runtime.
    if (policy.network == NetworkMode::None) {
        args.emplace_back("--network=none");
    } else if (policy.network == NetworkMode::LocalOnly) {
        args.emplace_back("--network=host");
    }

    if (policy.read_only_root) {
        args.emplace_back("--read-only");
    }

    args.emplace_back("--tmpfs");
    args.push_back("/tmp:size=" + std::to_string(policy.temp_dir_mb) + "m,mode=1777");

    for (const auto& mount : policy.mounts) {
        args.emplace_back("--volume");
        args.push_back(mount.source.string() + ":" + mount.target.string() + ":" +
                       to_string(mount.mode));
    }

    args.emplace_back("--workdir");
    args.push_back(policy.working_dir.string());

    args.emplace_back("--user");
    args.push_back(policy.user);

    if (policy.drop_all_caps) {
        args.emplace_back("--cap-drop=ALL");
    }
    if (policy.no_new_privileges) {
        args.emplace_back("--security-opt=no-new-privileges:true");
    }
    if (policy.seccomp_profile.has_value() && !policy.seccomp_profile->empty()) {
        args.push_back("--security-opt=seccomp=" + policy.seccomp_profile.value());
    }

    return args;
}

json to_json(const SandboxPolicy& policy) {
    json mounts = json::array();
    for (const auto& mount : policy.mounts) {
        mounts.push_back({{"source", mount.source.string()},
                          {"target", mount.target.string()},
                          {"mode", to_string(mount.mode)}});
    }

    json payload;
    payload["name"] = policy.name;
    payload["level"] = to_string(policy.level);
    payload["timeout_seconds"] = policy.timeout_seconds;
    payload["network"] = to_string(policy.network);
    payload["allowed_hosts"] = policy.allowed_hosts;
    payload["mounts"] = mounts;
    payload["temp_dir_mb"] = policy.temp_dir_mb;
    payload["resources"] = {{"memory_mb", policy.resources.memory_mb},
                            {"cpu_shares", policy.resources.cpu_shares},
                            {"cpu_period", policy.resources.cpu_period},
                            {"cpu_quota", policy.resources.cpu_quota},
                            {"pids_limit", policy.resources.pids_limit},
                            {"nofile_soft", policy.resources.nofile_soft},
                            {"nofile_hard", policy.resources.nofile_hard}};
    payload["working_dir"] = policy.working_dir.string();
    payload["user"] = policy.user;
    payload["read_only_root"] = policy.read_only_root;
    payload["use_strong_isolation"] = policy.use_strong_isolation;
    payload["isolation_runtime"] = policy.isolation_runtime;
    payload["isolation_platform"] = policy.isolation_platform;
    payload["drop_all_caps"] = policy.drop_all_caps;
    payload["no_new_privileges"] = policy.no_new_privileges;
    payload["seccomp_profile"] =
        policy.seccomp_profile.has_value() ? json(policy.seccomp_profile.value()) : json();
    payload["artifacts_enabled"] = policy.artifacts_enabled;
    return payload;
}

}  // namespace hearth::sandbox

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hearth_errors.hpp"

namespace hearth::sandbox {

// Ordered from most to least restrictive.
enum class SecurityLevel {
    Minimal,
    Analysis,
    Standard,
    Extended
};

enum class NetworkMode {
    None,
    LocalOnly,
    Limited
};

enum class MountMode {
    ReadOnly,
    ReadWrite
};

struct Mount {
    std::filesystem::path source;
    std::filesystem::path target;
    MountMode mode = MountMode::ReadOnly;
};

struct ResourceLimits {
    int memory_mb = 512;       // 64..4096
    int cpu_shares = 256;      // 64..1024
    int cpu_period = 100000;   // microseconds
    int cpu_quota = 50000;     // microseconds
    int pids_limit = 64;       // 8..256
    int nofile_soft = 256;
    int nofile_hard = 512;
};

struct SandboxPolicy {
    std::string name;
    SecurityLevel level = SecurityLevel::Standard;

    int timeout_seconds = 30;  // 5..300

    NetworkMode network = NetworkMode::None;
    std::vector<std::string> allowed_hosts;  // only meaningful for Limited

    std::vector<Mount> mounts;
    int temp_dir_mb = 100;  // 10..1024

    ResourceLimits resources;

    std::filesystem::path working_dir = "/workspace";
    std::string user = "nobody";
    bool read_only_root = true;

    // Escalation: request the strongest isolation runtime. SandboxRunner
    // downgrades when the runtime is not installed.
    bool use_strong_isolation = true;
    std::string isolation_runtime = "runsc";
    std::string isolation_platform = "systrap";

    bool drop_all_caps = true;
    bool no_new_privileges = true;
    std::optional<std::string> seccomp_profile = std::string("default");

    bool artifacts_enabled = false;
};

// Parameterized overrides applied on top of a named preset.
struct PolicyOverrides {
    std::optional<int> timeout_seconds;
    std::optional<NetworkMode> network;
    std::optional<std::vector<std::string>> allowed_hosts;
    std::optional<std::vector<Mount>> mounts;
    std::optional<int> temp_dir_mb;
    std::optional<int> memory_mb;
    std::optional<int> cpu_shares;
    std::optional<int> pids_limit;
    std::optional<bool> use_strong_isolation;
    std::optional<std::optional<std::string>> seccomp_profile;
    std::optional<bool> artifacts_enabled;
};

core::errors::Result<SandboxPolicy> get_policy(const std::string& name);
SandboxPolicy default_policy();
std::vector<std::string> policy_names();

core::errors::Result<SandboxPolicy> make_policy(const std::string& base_name,
                                                const PolicyOverrides& overrides);

// Range checks for every bounded field.
core::errors::Result<bool> validate_policy(const SandboxPolicy& policy);

// Pure: renders the policy into OCI container CLI arguments. Order is the
// compatibility surface and must not change.
std::vector<std::string> to_runtime_args(const SandboxPolicy& policy);

nlohmann::json to_json(const SandboxPolicy& policy);

std::string to_string(SecurityLevel level);
std::string to_string(NetworkMode mode);
std::string to_string(MountMode mode);

}  // namespace hearth::sandbox

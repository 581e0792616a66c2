#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/hearth_errors.hpp"

namespace hearth::sandbox {

struct ProcessOptions {
    std::optional<std::filesystem::path> working_directory;
    std::uint32_t timeout_ms = 5000;  // 0 disables the deadline
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::size_t max_output_bytes = 1024 * 1024;  // per stream
    // SIGTERM first and SIGKILL after this grace period; 0 kills at once.
    std::uint32_t terminate_grace_ms = 0;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
    std::optional<double> max_rss_mb;
    std::optional<double> cpu_time_seconds;
};

// Spawns argv[0] (PATH lookup, no shell) in its own process group and
// captures stdout/stderr. On timeout or cancellation the whole process group
// is signalled, so descendants do not outlive the call.
//
// Errors: Execution/"executable_not_found" when argv[0] cannot be found,
// Execution/"spawn_failed" for any other launch failure.
core::errors::Result<ProcessCapture> run_process(const std::vector<std::string>& argv,
                                                 const ProcessOptions& options);

}  // namespace hearth::sandbox

#pragma once

#include "runtime.h"

#include <memory>
#include <string>

namespace verigate {

enum class Profile { DEV, PROD };

// Detect profile from VERIGATE_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// Both profiles run snippets under docker; the process runtime is only
// used when VERIGATE_RUNTIME=process is set explicitly.
// DEV: generous output cap
// PROD: tighter output and pid caps
void apply_profile_defaults(Profile p);

struct EngineConfig {
    int timeout_sec{5};
    size_t min_candidate_len{6};
    std::string runtime{"docker"};          // docker | process
    std::string docker_bin{"docker"};
    std::string sandbox_image{"verigate-sandbox"};
    std::string interpreter{"python3"};     // split on whitespace, quotes honored
    size_t memory_mb{64};
    double cpus{0.5};
    int pids_limit{64};
    size_t output_max_bytes{64 * 1024};
    std::string audit_log;                  // empty = no audit trail
    int cache_ttl_sec{600};
};

// Reads VERIGATE_* env vars. Missing or malformed values keep the defaults.
EngineConfig load_engine_config();

// Runtime selected by cfg.runtime. The process runtime always installs the
// seccomp filter (sockets denied). Throws std::invalid_argument for an
// unknown runtime name or an empty interpreter.
std::unique_ptr<IsolationRuntime> make_runtime(const EngineConfig& cfg);

} // namespace verigate

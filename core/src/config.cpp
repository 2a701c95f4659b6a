#include "verigate/config.h"
#include "verigate/proc.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace verigate {

Profile detect_profile() {
    const char* env = std::getenv("VERIGATE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("VERIGATE_RUNTIME",         "docker",  NO_OVERWRITE);
            setenv("VERIGATE_OUTPUT_MAX",      "262144",  NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("VERIGATE_RUNTIME",         "docker",  NO_OVERWRITE);
            setenv("VERIGATE_OUTPUT_MAX",      "65536",   NO_OVERWRITE);
            setenv("VERIGATE_SANDBOX_PIDS",    "32",      NO_OVERWRITE);
            break;
    }
}

static std::string getenv_str(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    if (!v || !*v) return def;
    return std::string(v);
}

static long long getenv_ll(const char* k, long long def, long long lo, long long hi) {
    const char* v = std::getenv(k);
    if (!v || !*v) return def;
    char* end = nullptr;
    long long x = std::strtoll(v, &end, 10);
    if (end == v || *end != '\0') return def;
    if (x < lo || x > hi) return def;
    return x;
}

static double getenv_double(const char* k, double def, double lo, double hi) {
    const char* v = std::getenv(k);
    if (!v || !*v) return def;
    char* end = nullptr;
    double x = std::strtod(v, &end);
    if (end == v || *end != '\0') return def;
    if (!(x >= lo && x <= hi)) return def;
    return x;
}

EngineConfig load_engine_config() {
    EngineConfig c;
    c.timeout_sec = (int)getenv_ll("VERIGATE_TIMEOUT_SEC", c.timeout_sec, 1, 3600);
    c.min_candidate_len = (size_t)getenv_ll("VERIGATE_MIN_CANDIDATE_LEN", (long long)c.min_candidate_len, 0, 1 << 20);
    c.runtime = getenv_str("VERIGATE_RUNTIME", c.runtime);
    c.docker_bin = getenv_str("VERIGATE_DOCKER_BIN", c.docker_bin);
    c.sandbox_image = getenv_str("VERIGATE_SANDBOX_IMAGE", c.sandbox_image);
    c.interpreter = getenv_str("VERIGATE_INTERPRETER", c.interpreter);
    c.memory_mb = (size_t)getenv_ll("VERIGATE_SANDBOX_MEMORY_MB", (long long)c.memory_mb, 6, 1 << 20);
    c.cpus = getenv_double("VERIGATE_SANDBOX_CPUS", c.cpus, 0.01, 1024.0);
    c.pids_limit = (int)getenv_ll("VERIGATE_SANDBOX_PIDS", c.pids_limit, 1, 1 << 20);
    c.output_max_bytes = (size_t)getenv_ll("VERIGATE_OUTPUT_MAX", (long long)c.output_max_bytes, 1024, 64LL << 20);
    c.audit_log = getenv_str("VERIGATE_AUDIT_LOG", "");
    c.cache_ttl_sec = (int)getenv_ll("VERIGATE_CACHE_TTL_SEC", c.cache_ttl_sec, 0, 7 * 24 * 3600);
    return c;
}

std::unique_ptr<IsolationRuntime> make_runtime(const EngineConfig& cfg) {
    std::vector<std::string> interp = split_argv_quoted(cfg.interpreter);
    if (interp.empty()) throw std::invalid_argument("empty interpreter command");

    IsolationLimits lim;
    lim.memory_mb = cfg.memory_mb;
    lim.cpus = cfg.cpus;
    lim.pids_limit = cfg.pids_limit;
    lim.output_max_bytes = cfg.output_max_bytes;

    if (cfg.runtime == "docker") {
        DockerOptions o;
        o.docker_bin = cfg.docker_bin;
        o.image = cfg.sandbox_image;
        o.interpreter = interp;
        o.limits = lim;
        return std::make_unique<DockerRuntime>(o);
    }
    if (cfg.runtime == "process") {
        ProcessOptions o;
        o.interpreter = interp;
        o.limits = lim;
        o.enable_seccomp = true;
        std::cerr << "[verigate] process runtime: snippets run on this host under rlimits and seccomp,"
                  << " without filesystem isolation\n";
        return std::make_unique<ProcessRuntime>(o);
    }
    throw std::invalid_argument("unknown runtime: " + cfg.runtime);
}

} // namespace verigate

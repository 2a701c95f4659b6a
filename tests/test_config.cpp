#include "test_common.h"
#include "verigate/config.h"

#include <cstdlib>
#include <stdexcept>

using namespace verigate;

static void clear_env() {
    const char* keys[] = {
        "VERIGATE_PROFILE", "VERIGATE_TIMEOUT_SEC", "VERIGATE_MIN_CANDIDATE_LEN", "VERIGATE_RUNTIME",
        "VERIGATE_DOCKER_BIN", "VERIGATE_SANDBOX_IMAGE", "VERIGATE_INTERPRETER", "VERIGATE_SANDBOX_MEMORY_MB",
        "VERIGATE_SANDBOX_CPUS", "VERIGATE_SANDBOX_PIDS", "VERIGATE_OUTPUT_MAX",
        "VERIGATE_AUDIT_LOG", "VERIGATE_CACHE_TTL_SEC",
    };
    for (const char* k : keys) unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    expect_true(detect_profile() == Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("VERIGATE_PROFILE", "PROD", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
    setenv("VERIGATE_PROFILE", "production", 1);
    expect_true(detect_profile() == Profile::PROD, "production alias");

    // Test 3: Apply defaults (won't override existing)
    setenv("VERIGATE_RUNTIME", "process", 1);
    apply_profile_defaults(Profile::PROD);
    expect_eq_str(std::getenv("VERIGATE_RUNTIME"), "process", "should NOT override pre-existing env var");
    expect_eq_str(std::getenv("VERIGATE_SANDBOX_PIDS"), "32", "PROD tightens pids");
    clear_env();

    apply_profile_defaults(Profile::PROD);
    expect_eq_str(std::getenv("VERIGATE_RUNTIME"), "docker", "PROD uses docker");
    clear_env();

    apply_profile_defaults(Profile::DEV);
    expect_eq_str(std::getenv("VERIGATE_RUNTIME"), "docker", "DEV uses docker too");
    clear_env();

    // with nothing set, the engine ends up on the docker runtime
    {
        apply_profile_defaults(detect_profile());
        auto rt = make_runtime(load_engine_config());
        expect_eq_str(rt->name(), "docker", "unconfigured engine isolates with docker");
        expect_true(dynamic_cast<DockerRuntime*>(rt.get()) != nullptr, "DockerRuntime type");
        clear_env();
    }

    // Test 4: Profile name
    expect_eq_str(profile_name(Profile::DEV), "dev", "dev name");
    expect_eq_str(profile_name(Profile::PROD), "prod", "prod name");

    // Test 5: engine defaults
    {
        EngineConfig c = load_engine_config();
        expect_eq_ll(c.timeout_sec, 5, "default timeout");
        expect_eq_ll((long long)c.min_candidate_len, 6, "default minimum length");
        expect_eq_str(c.runtime, "docker", "default runtime");
        expect_eq_str(c.sandbox_image, "verigate-sandbox", "default image");
        expect_eq_ll((long long)c.memory_mb, 64, "default memory");
        expect_eq_ll(c.pids_limit, 64, "default pids");
        expect_true(c.audit_log.empty(), "no audit log by default");
        expect_eq_ll(c.cache_ttl_sec, 600, "default cache ttl");
    }

    // Test 6: overrides and malformed values
    {
        setenv("VERIGATE_TIMEOUT_SEC", "12", 1);
        setenv("VERIGATE_SANDBOX_CPUS", "1.5", 1);
        setenv("VERIGATE_INTERPRETER", "python3 -I", 1);
        setenv("VERIGATE_AUDIT_LOG", "/tmp/a.jsonl", 1);
        setenv("VERIGATE_SANDBOX_MEMORY_MB", "lots", 1);
        setenv("VERIGATE_SANDBOX_PIDS", "-4", 1);
        EngineConfig c = load_engine_config();
        expect_eq_ll(c.timeout_sec, 12, "timeout override");
        expect_true(c.cpus > 1.49 && c.cpus < 1.51, "cpu override");
        expect_eq_str(c.interpreter, "python3 -I", "interpreter override");
        expect_eq_str(c.audit_log, "/tmp/a.jsonl", "audit path");
        expect_eq_ll((long long)c.memory_mb, 64, "garbage memory falls back");
        expect_eq_ll(c.pids_limit, 64, "negative pids falls back");
        clear_env();
    }

    // Test 7: runtime factory
    {
        EngineConfig c;
        c.runtime = "process";
        c.interpreter = "python3 -I";
        auto rt = make_runtime(c);
        expect_eq_str(rt->name(), "process", "process runtime built");
        auto* pr = dynamic_cast<ProcessRuntime*>(rt.get());
        expect_true(pr != nullptr, "ProcessRuntime type");
        expect_eq_ll((long long)pr->options().interpreter.size(), 2, "interpreter split into argv");
        expect_true(pr->options().enable_seccomp, "process runtime always filtered");
        expect_true(pr->limits_for(5000).enable_seccomp, "filter requested for every run");

        c.runtime = "docker";
        c.docker_bin = "/usr/local/bin/docker";
        c.memory_mb = 96;
        rt = make_runtime(c);
        auto* dr = dynamic_cast<DockerRuntime*>(rt.get());
        expect_true(dr != nullptr, "DockerRuntime type");
        expect_eq_str(dr->options().docker_bin, "/usr/local/bin/docker", "docker binary forwarded");
        expect_eq_ll((long long)dr->options().limits.memory_mb, 96, "limits forwarded");

        bool threw = false;
        c.runtime = "vm";
        try {
            (void)make_runtime(c);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "unknown runtime rejected");

        threw = false;
        c.runtime = "process";
        c.interpreter = "   ";
        try {
            (void)make_runtime(c);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "empty interpreter rejected");
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}

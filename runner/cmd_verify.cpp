#include "cmd_verify.h"
#include "runner_utils.h"

#include "verigate/candidate_supply.h"
#include "verigate/config.h"
#include "verigate/executor.h"
#include "verigate/log.h"
#include "verigate/orchestrator.h"
#include "verigate/screener.h"
#include "verigate/serialization.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace verigate;

// Everything one invocation needs; the executor owns the runtime.
struct Engine {
    EngineConfig cfg;
    std::unique_ptr<SandboxExecutor> executor;
    StaticScreener screener;
    std::unique_ptr<AuditLog> audit;
    std::unique_ptr<Verifier> verifier;
};

// Returns false (message on stderr) if the runtime or audit log cannot be set up.
bool build_engine(Engine& e, const std::string& audit_path, const std::string& request_id) {
    apply_profile_defaults(detect_profile());
    e.cfg = load_engine_config();
    if (!audit_path.empty()) e.cfg.audit_log = audit_path;

    std::unique_ptr<IsolationRuntime> rt;
    try {
        rt = make_runtime(e.cfg);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[verigate] " << ex.what() << "\n";
        return false;
    }

    ExecutorOptions eo;
    eo.default_timeout = std::chrono::seconds(e.cfg.timeout_sec);
    e.executor = std::make_unique<SandboxExecutor>(std::move(rt), eo);

    if (!e.cfg.audit_log.empty()) {
        AuditHeader hdr;
        hdr.run_id = gen_run_id();
        hdr.request_id = request_id;
        e.audit = std::make_unique<AuditLog>(hdr, e.cfg.audit_log);
        if (!e.audit->ok()) {
            std::cerr << "[verigate] cannot open audit log " << e.cfg.audit_log << "\n";
            return false;
        }
    }

    VerifierOptions vo;
    vo.min_candidate_len = e.cfg.min_candidate_len;
    vo.default_timeout = std::chrono::seconds(e.cfg.timeout_sec);
    e.verifier = std::make_unique<Verifier>(*e.executor, e.screener, vo, e.audit.get());
    return true;
}

int print_result(const VerificationResult& r) {
    std::cout << verification_result_to_string(r, true) << "\n";
    return r.verified ? 0 : 1;
}

int print_fault(const std::exception& ex) {
    std::cerr << "[verigate] verification aborted: " << ex.what() << "\n";
    std::cout << "{\"verified\":false,\"reason\":\"exception_in_verifier\",\"error\":"
              << json_quote(ex.what()) << "}\n";
    return 1;
}

} // namespace

// Usage: verigate_cli verify [--timeout S] [--audit PATH] [FILE|-]
int cmd_verify(int argc, char** argv) {
    int timeout_flag = 0;
    std::string audit_path;
    std::string input = "-";

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--timeout" && i + 1 < argc) {
            if (!parse_positive_int(argv[++i], 3600, &timeout_flag)) {
                std::cerr << "--timeout expects seconds in 1..3600\n";
                return 2;
            }
        } else if (a == "--audit" && i + 1 < argc) {
            audit_path = argv[++i];
        } else if (a.size() > 1 && a[0] == '-' && a != "-") {
            std::cerr << "usage: verigate_cli verify [--timeout S] [--audit PATH] [FILE|-]\n";
            return 2;
        } else {
            input = a;
        }
    }

    std::string raw, err;
    if (!read_input(input, &raw, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    VerifyRequest req;
    if (!parse_verify_request(raw, &req, &err)) {
        std::cerr << "bad request: " << err << "\n";
        return 2;
    }

    Engine e;
    if (!build_engine(e, audit_path, req.request_id)) return 2;

    int timeout = e.cfg.timeout_sec;
    if (req.timeout_sec > 0) timeout = req.timeout_sec;
    if (timeout_flag > 0) timeout = timeout_flag;

    try {
        if (req.batch) return print_result(e.verifier->verify(req.candidates, timeout));
        return print_result(e.verifier->verify(req.candidates.front(), timeout));
    } catch (const std::exception& ex) {
        return print_fault(ex);
    }
}

// Usage: verigate_cli ask --supply FILE [--max N] [--timeout S] [--audit PATH] QUESTION
int cmd_ask(int argc, char** argv) {
    std::string supply_path, audit_path, question;
    int max_candidates = 10;
    int timeout_flag = 0;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--supply" && i + 1 < argc) {
            supply_path = argv[++i];
        } else if (a == "--max" && i + 1 < argc) {
            if (!parse_positive_int(argv[++i], 1000, &max_candidates)) {
                std::cerr << "--max expects 1..1000\n";
                return 2;
            }
        } else if (a == "--timeout" && i + 1 < argc) {
            if (!parse_positive_int(argv[++i], 3600, &timeout_flag)) {
                std::cerr << "--timeout expects seconds in 1..3600\n";
                return 2;
            }
        } else if (a == "--audit" && i + 1 < argc) {
            audit_path = argv[++i];
        } else {
            question = a;
        }
    }
    if (supply_path.empty() || question.empty()) {
        std::cerr << "usage: verigate_cli ask --supply FILE [--max N] [--timeout S] [--audit PATH] QUESTION\n";
        return 2;
    }

    Engine e;
    if (!build_engine(e, audit_path, "")) return 2;

    CandidateCache cache((int64_t)e.cfg.cache_ttl_sec * 1000);
    CachedCandidateSupply supply(std::make_unique<JsonFileCandidateSupply>(supply_path), cache);

    CandidateQuery q;
    q.question = question;
    q.max_candidates = (size_t)max_candidates;
    std::vector<std::string> candidates;
    std::string err;
    if (!supply.fetch(q, &candidates, &err)) {
        std::cerr << "[verigate] no candidates: " << err << "\n";
        return 1;
    }

    const int timeout = timeout_flag > 0 ? timeout_flag : e.cfg.timeout_sec;
    try {
        return print_result(e.verifier->verify(candidates, timeout));
    } catch (const std::exception& ex) {
        return print_fault(ex);
    }
}

#include "verigate/orchestrator.h"
#include "verigate/json_mini.h"
#include "verigate/normalizer.h"

#include <exception>
#include <sstream>

namespace verigate {

namespace {

std::string trim_copy(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r' || s[b] == '\f' || s[b] == '\v')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r' || s[e - 1] == '\f' || s[e - 1] == '\v')) e--;
    return s.substr(b, e - b);
}

std::string matches_json(const std::vector<std::string>& m) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < m.size(); i++) {
        if (i) oss << ",";
        oss << "\"" << json_mini::json_escape(m[i]) << "\"";
    }
    oss << "]";
    return oss.str();
}

} // namespace

std::vector<Candidate> make_candidates(const std::vector<std::string>& sources) {
    std::vector<Candidate> out;
    out.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); i++) out.push_back(Candidate{i, sources[i]});
    return out;
}

Verifier::Verifier(SandboxExecutor& executor, const StaticScreener& screener,
                   VerifierOptions opts, AuditLog* audit)
    : executor_(executor), screener_(screener), opts_(opts), audit_(audit) {}

std::chrono::milliseconds Verifier::effective_timeout(std::chrono::milliseconds t) const {
    return t.count() > 0 ? t : opts_.default_timeout;
}

void Verifier::audit(const std::string& name, const std::string& payload_json) {
    if (!audit_) return;
    audit_->event(step_++, name, payload_json);
}

VerificationResult Verifier::verify_one(const std::string& source, std::chrono::milliseconds timeout) {
    VerificationResult res;
    res.batch = false;

    const std::string code = normalize_snippet(source);
    ScanVerdict verdict = screener_.scan(code);
    if (!verdict.safe) {
        res.verified = false;
        res.reason = Reason::STATIC_BLACKLIST_MATCH;
        res.scan = std::move(verdict);
        return res;
    }

    ExecutionOutcome out = executor_.execute(code, effective_timeout(timeout));
    res.verified = out.success;
    res.reason = out.success ? Reason::DOCKER_PASSED : Reason::DOCKER_FAILED;
    res.outcome = std::move(out);
    return res;
}

TrialRecord Verifier::run_trial(const Candidate& cand, std::chrono::milliseconds timeout) {
    TrialRecord rec;
    rec.index = cand.index;

    if (trim_copy(cand.source).size() < opts_.min_candidate_len) {
        rec.skipped = true;
        rec.reason = Reason::TOO_SHORT;
        audit("candidate_skipped", "{\"index\":" + std::to_string(cand.index) + ",\"reason\":\"too_short\"}");
        return rec;
    }

    bool faulted = false;
    try {
        VerificationResult one = verify_one(cand.source, timeout);
        rec.verified = one.verified;
        rec.reason = one.reason;
        rec.scan = std::move(one.scan);
        rec.execution = std::move(one.outcome);
    } catch (const std::exception& e) {
        faulted = true;
        rec.verified = false;
        rec.reason = Reason::EXCEPTION_IN_VERIFIER;
        rec.error = e.what();
    } catch (...) {
        faulted = true;
        rec.verified = false;
        rec.reason = Reason::EXCEPTION_IN_VERIFIER;
        rec.error = "non-standard exception";
    }

    if (faulted) {
        audit("candidate_fault", "{\"error\":\"" + json_mini::json_escape(rec.error) +
                                 "\",\"index\":" + std::to_string(cand.index) + "}");
    } else if (rec.reason == Reason::STATIC_BLACKLIST_MATCH) {
        audit("candidate_rejected", "{\"index\":" + std::to_string(cand.index) +
                                    ",\"matches\":" + matches_json(rec.scan ? rec.scan->matches
                                                                            : std::vector<std::string>{}) + "}");
    } else {
        std::ostringstream p;
        p << "{\"index\":" << cand.index << ",\"verified\":" << (rec.verified ? "true" : "false");
        if (rec.execution) {
            p << ",\"exit_code\":" << rec.execution->exit_code
              << ",\"duration_ms\":" << (long long)rec.execution->duration_ms;
            if (rec.execution->failure_kind)
                p << ",\"failure_kind\":\"" << failure_kind_to_str(*rec.execution->failure_kind) << "\"";
        }
        p << "}";
        audit("candidate_executed", p.str());
    }
    return rec;
}

VerificationResult Verifier::verify_many(const std::vector<Candidate>& candidates,
                                         std::chrono::milliseconds timeout) {
    VerificationResult res;
    res.batch = true;
    const auto t = effective_timeout(timeout);

    {
        std::ostringstream p;
        p << "{\"candidates\":" << candidates.size() << ",\"timeout_ms\":" << (long long)t.count() << "}";
        audit("verify_begin", p.str());
    }

    for (const Candidate& cand : candidates) {
        res.trials.push_back(run_trial(cand, t));
        if (res.trials.back().verified) {
            res.verified = true;
            res.reason = Reason::DOCKER_PASSED;
            res.outcome = res.trials.back().execution;
            break;
        }
    }

    if (!res.verified) res.reason = Reason::NO_BLOCK_VERIFIED;

    {
        std::ostringstream p;
        p << "{\"reason\":\"" << reason_to_str(res.reason) << "\",\"tried\":" << res.trials.size()
          << ",\"verified\":" << (res.verified ? "true" : "false");
        if (res.verified) p << ",\"winner\":" << res.trials.back().index;
        p << "}";
        audit("verify_end", p.str());
    }
    return res;
}

VerificationResult Verifier::verify_many(const std::vector<std::string>& sources,
                                         std::chrono::milliseconds timeout) {
    return verify_many(make_candidates(sources), timeout);
}

VerificationResult Verifier::verify(const std::string& source, int timeout_seconds) {
    if (audit_) {
        audit("verify_begin", "{\"candidates\":1,\"timeout_ms\":" +
                              std::to_string((long long)timeout_seconds * 1000) + "}");
    }
    VerificationResult res = verify_one(source, std::chrono::seconds(timeout_seconds));
    if (audit_) {
        std::ostringstream p;
        p << "{\"reason\":\"" << reason_to_str(res.reason) << "\",\"verified\":"
          << (res.verified ? "true" : "false");
        if (res.scan) p << ",\"matches\":" << matches_json(res.scan->matches);
        p << "}";
        audit("verify_end", p.str());
    }
    return res;
}

VerificationResult Verifier::verify(const std::vector<std::string>& sources, int timeout_seconds) {
    return verify_many(sources, std::chrono::seconds(timeout_seconds));
}

} // namespace verigate

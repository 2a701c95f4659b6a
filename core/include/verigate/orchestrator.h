#pragma once

#include "executor.h"
#include "log.h"
#include "screener.h"
#include "types.h"

#include <chrono>
#include <string>
#include <vector>

namespace verigate {

// Index i for the i-th source.
std::vector<Candidate> make_candidates(const std::vector<std::string>& sources);

struct VerifierOptions {
    size_t min_candidate_len{6};   // trimmed length below this is skipped
    std::chrono::milliseconds default_timeout{5000};
};

// Runs candidates through normalize -> screen -> execute, strictly in
// order, and stops at the first one that executes cleanly.
class Verifier {
public:
    Verifier(SandboxExecutor& executor, const StaticScreener& screener,
             VerifierOptions opts = {}, AuditLog* audit = nullptr);

    // Single form. Faults from the executor propagate.
    VerificationResult verify_one(const std::string& source, std::chrono::milliseconds timeout);

    // Batch form. Every candidate examined gets exactly one TrialRecord,
    // tagged with the candidate's index; candidates after the winner are
    // never looked at.
    VerificationResult verify_many(const std::vector<Candidate>& candidates,
                                   std::chrono::milliseconds timeout);
    VerificationResult verify_many(const std::vector<std::string>& sources,
                                   std::chrono::milliseconds timeout);

    VerificationResult verify(const std::string& source, int timeout_seconds = 5);
    VerificationResult verify(const std::vector<std::string>& sources, int timeout_seconds = 5);

    const VerifierOptions& options() const { return opts_; }

private:
    std::chrono::milliseconds effective_timeout(std::chrono::milliseconds t) const;
    TrialRecord run_trial(const Candidate& cand, std::chrono::milliseconds timeout);
    void audit(const std::string& name, const std::string& payload_json);

    SandboxExecutor& executor_;
    const StaticScreener& screener_;
    VerifierOptions opts_;
    AuditLog* audit_;
    int step_{0};
};

} // namespace verigate

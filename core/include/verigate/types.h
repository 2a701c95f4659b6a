#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace verigate {

// Candidate: one untrusted snippet plus its position in the caller's list.
struct Candidate {
    size_t index{0};
    std::string source;
};

// Result of static screening. matches holds the ids of every forbidden
// pattern found (empty iff safe).
struct ScanVerdict {
    bool safe{true};
    std::vector<std::string> matches;
};

enum class FailureKind {
    TIMEOUT,
    LAUNCH_ERROR,
    NONZERO_EXIT,
};

// Result of one sandbox run.
struct ExecutionOutcome {
    bool success{false};
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};
    std::optional<FailureKind> failure_kind;
    std::string error;          // launch / infrastructure message, not child stderr
    bool output_truncated{false};
    int64_t duration_ms{0};
    std::string runtime;        // "docker", "process", ...
};

enum class Reason {
    NONE,
    TOO_SHORT,
    STATIC_BLACKLIST_MATCH,
    DOCKER_PASSED,
    DOCKER_FAILED,
    EXCEPTION_IN_VERIFIER,
    NO_BLOCK_VERIFIED,
};

// Per-candidate audit entry. Appended once, never rewritten.
struct TrialRecord {
    size_t index{0};
    bool skipped{false};
    bool verified{false};
    Reason reason{Reason::NONE};
    std::optional<ScanVerdict> scan;
    std::optional<ExecutionOutcome> execution;
    std::string error; // set for EXCEPTION_IN_VERIFIER
};

struct VerificationResult {
    bool verified{false};
    Reason reason{Reason::NONE};
    bool batch{false};                       // true for the multi-candidate form
    std::optional<ScanVerdict> scan;         // single form, static rejection
    std::optional<ExecutionOutcome> outcome; // single form, or batch winner
    std::vector<TrialRecord> trials;         // batch form only
};

const char* reason_to_str(Reason r);
std::optional<Reason> reason_from_str(const std::string& s);

const char* failure_kind_to_str(FailureKind k);
std::optional<FailureKind> failure_kind_from_str(const std::string& s);

} // namespace verigate

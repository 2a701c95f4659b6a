#include "verigate/types.h"

namespace verigate {

const char* reason_to_str(Reason r) {
    switch (r) {
        case Reason::NONE: return "none";
        case Reason::TOO_SHORT: return "too_short";
        case Reason::STATIC_BLACKLIST_MATCH: return "static_blacklist_match";
        case Reason::DOCKER_PASSED: return "docker_passed";
        case Reason::DOCKER_FAILED: return "docker_failed";
        case Reason::EXCEPTION_IN_VERIFIER: return "exception_in_verifier";
        case Reason::NO_BLOCK_VERIFIED: return "no_block_verified";
    }
    return "none";
}

std::optional<Reason> reason_from_str(const std::string& s) {
    if (s == "none") return Reason::NONE;
    if (s == "too_short") return Reason::TOO_SHORT;
    if (s == "static_blacklist_match") return Reason::STATIC_BLACKLIST_MATCH;
    if (s == "docker_passed") return Reason::DOCKER_PASSED;
    if (s == "docker_failed") return Reason::DOCKER_FAILED;
    if (s == "exception_in_verifier") return Reason::EXCEPTION_IN_VERIFIER;
    if (s == "no_block_verified") return Reason::NO_BLOCK_VERIFIED;
    return std::nullopt;
}

const char* failure_kind_to_str(FailureKind k) {
    switch (k) {
        case FailureKind::TIMEOUT: return "timeout";
        case FailureKind::LAUNCH_ERROR: return "launch_error";
        case FailureKind::NONZERO_EXIT: return "nonzero_exit";
    }
    return "launch_error";
}

std::optional<FailureKind> failure_kind_from_str(const std::string& s) {
    if (s == "timeout") return FailureKind::TIMEOUT;
    if (s == "launch_error") return FailureKind::LAUNCH_ERROR;
    if (s == "nonzero_exit") return FailureKind::NONZERO_EXIT;
    return std::nullopt;
}

} // namespace verigate

#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace verigate {

// --- JSON helpers ---
std::string json_quote(const std::string& s);

// --- Result serialization ---
// Returned objects are owned by the caller (json_object_put).
json_object* scan_verdict_to_json(const ScanVerdict& v);
json_object* outcome_to_json(const ExecutionOutcome& o);
json_object* trial_to_json(const TrialRecord& t);
json_object* verification_result_to_json(const VerificationResult& r);

std::string verification_result_to_string(const VerificationResult& r, bool pretty = false);
std::string scan_verdict_to_string(const ScanVerdict& v);

// --- Request parsing ---
// Accepted shapes:
//   {"code": "<snippet>" | ["<snippet>", ...], "timeout": <int>?, "request_id": "<id>"?}
//   "<snippet>"
//   ["<snippet>", ...]
struct VerifyRequest {
    bool batch{false};
    std::vector<std::string> candidates;
    int timeout_sec{0};         // 0 = not given
    std::string request_id;
};

bool parse_verify_request(const std::string& json, VerifyRequest* out, std::string* err);

} // namespace verigate

#include "verigate/serialization.h"
#include "verigate/json_mini.h"

#include <sstream>

namespace verigate {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

static json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

static json_object* matches_to_json(const std::vector<std::string>& m) {
    json_object* arr = json_object_new_array();
    for (const auto& id : m) json_object_array_add(arr, new_string(id));
    return arr;
}

// Writes the outcome fields into an existing object; the batch form
// merges the winner into its details this way.
static void add_outcome_fields(json_object* o, const ExecutionOutcome& x) {
    json_object_object_add(o, "ok", json_object_new_boolean(x.success));
    json_object_object_add(o, "stdout", new_string(x.stdout_text));
    json_object_object_add(o, "stderr", new_string(x.stderr_text));
    json_object_object_add(o, "return_code", json_object_new_int(x.exit_code));
    if (x.failure_kind)
        json_object_object_add(o, "failure_kind", json_object_new_string(failure_kind_to_str(*x.failure_kind)));
    if (!x.error.empty())
        json_object_object_add(o, "error", new_string(x.error));
    json_object_object_add(o, "output_truncated", json_object_new_boolean(x.output_truncated));
    json_object_object_add(o, "duration_ms", json_object_new_int64(x.duration_ms));
    if (!x.runtime.empty())
        json_object_object_add(o, "runtime", new_string(x.runtime));
}

// --- Result serialization ---

json_object* scan_verdict_to_json(const ScanVerdict& v) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "safe", json_object_new_boolean(v.safe));
    json_object_object_add(o, "matches", matches_to_json(v.matches));
    return o;
}

json_object* outcome_to_json(const ExecutionOutcome& x) {
    json_object* o = json_object_new_object();
    add_outcome_fields(o, x);
    return o;
}

json_object* trial_to_json(const TrialRecord& t) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "index", json_object_new_int64((int64_t)t.index));
    json_object_object_add(o, "skipped", json_object_new_boolean(t.skipped));
    json_object_object_add(o, "verified", json_object_new_boolean(t.verified));
    json_object_object_add(o, "reason", json_object_new_string(reason_to_str(t.reason)));

    json_object* details = nullptr;
    if (t.execution) {
        details = outcome_to_json(*t.execution);
    } else if (t.scan && !t.scan->safe) {
        details = json_object_new_object();
        json_object_object_add(details, "matches", matches_to_json(t.scan->matches));
    } else if (!t.error.empty()) {
        details = json_object_new_object();
        json_object_object_add(details, "error", new_string(t.error));
    }
    // json-c stores a null member for a nullptr value
    json_object_object_add(o, "details", details);
    return o;
}

json_object* verification_result_to_json(const VerificationResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "verified", json_object_new_boolean(r.verified));
    json_object_object_add(o, "reason", json_object_new_string(reason_to_str(r.reason)));

    if (r.batch) {
        json_object* details = json_object_new_object();
        json_object* tried = json_object_new_array();
        for (const auto& t : r.trials) json_object_array_add(tried, trial_to_json(t));
        json_object_object_add(details, "tried_blocks", tried);
        if (r.outcome) add_outcome_fields(details, *r.outcome);
        json_object_object_add(o, "details", details);
        return o;
    }

    if (r.scan && !r.scan->safe) {
        json_object_object_add(o, "matches", matches_to_json(r.scan->matches));
        return o;
    }
    json_object_object_add(o, "details", r.outcome ? outcome_to_json(*r.outcome) : nullptr);
    return o;
}

std::string verification_result_to_string(const VerificationResult& r, bool pretty) {
    json_object* o = verification_result_to_json(r);
    std::string s = json_object_to_json_string_ext(o, pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return s;
}

std::string scan_verdict_to_string(const ScanVerdict& v) {
    json_object* o = scan_verdict_to_json(v);
    std::string s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return s;
}

// --- Request parsing ---

static bool take_code(json_object* v, VerifyRequest* out, std::string* err) {
    if (json_object_is_type(v, json_type_string)) {
        out->batch = false;
        out->candidates.assign(1, std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v)));
        return true;
    }
    if (json_object_is_type(v, json_type_array)) {
        auto arr = json_mini::array_strings(v);
        if (!arr) {
            if (err) *err = "candidate list must contain only strings";
            return false;
        }
        out->batch = true;
        out->candidates = std::move(*arr);
        return true;
    }
    if (err) *err = "code must be a string or an array of strings";
    return false;
}

bool parse_verify_request(const std::string& json, VerifyRequest* out, std::string* err) {
    if (!out) return false;
    *out = VerifyRequest{};

    json_mini::Doc doc = json_mini::parse(json);
    if (!doc) {
        if (err) *err = "invalid JSON";
        return false;
    }

    if (!json_object_is_type(doc.root, json_type_object)) return take_code(doc.root, out, err);

    json_object* code = json_mini::member(doc.root, "code");
    if (!code) {
        if (err) *err = "missing 'code'";
        return false;
    }
    if (!take_code(code, out, err)) return false;

    if (json_mini::member(doc.root, "timeout")) {
        auto t = json_mini::get_int(doc.root, "timeout");
        if (!t || *t <= 0 || *t > 3600) {
            if (err) *err = "timeout must be an integer in 1..3600";
            return false;
        }
        out->timeout_sec = (int)*t;
    }
    if (auto rid = json_mini::get_string(doc.root, "request_id")) out->request_id = *rid;
    return true;
}

} // namespace verigate

#include "test_common.h"
#include "verigate/serialization.h"

#include <json-c/json.h>

using namespace verigate;

namespace {

json_object* get(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v)) die(std::string("missing key ") + k);
    return v;
}

bool has(json_object* o, const char* k) {
    json_object* v = nullptr;
    return json_object_object_get_ex(o, k, &v);
}

std::string str(json_object* o, const char* k) {
    return json_object_get_string(get(o, k));
}

ExecutionOutcome passing(const std::string& out) {
    ExecutionOutcome oc;
    oc.success = true;
    oc.exit_code = 0;
    oc.stdout_text = out;
    oc.runtime = "docker";
    oc.duration_ms = 12;
    return oc;
}

} // namespace

int main() {
    // single form, executed
    {
        VerificationResult r;
        r.verified = true;
        r.reason = Reason::DOCKER_PASSED;
        r.outcome = passing("hi");

        json_object* o = json_tokener_parse(verification_result_to_string(r).c_str());
        expect_true(o != nullptr, "output parses");
        expect_true(json_object_get_boolean(get(o, "verified")), "verified true");
        expect_eq_str(str(o, "reason"), "docker_passed", "reason string");
        json_object* d = get(o, "details");
        expect_true(json_object_get_boolean(get(d, "ok")), "details.ok");
        expect_eq_str(str(d, "stdout"), "hi", "details.stdout");
        expect_eq_str(str(d, "stderr"), "", "details.stderr");
        expect_eq_ll(json_object_get_int(get(d, "return_code")), 0, "details.return_code");
        expect_true(!has(d, "failure_kind"), "no failure_kind on success");
        expect_true(!has(d, "error"), "no error on success");
        json_object_put(o);
    }

    // single form, timeout
    {
        VerificationResult r;
        r.reason = Reason::DOCKER_FAILED;
        ExecutionOutcome oc;
        oc.failure_kind = FailureKind::TIMEOUT;
        oc.error = "timeout";
        oc.exit_code = 137;
        r.outcome = oc;

        json_object* o = json_tokener_parse(verification_result_to_string(r).c_str());
        json_object* d = get(o, "details");
        expect_eq_str(str(o, "reason"), "docker_failed", "docker_failed");
        expect_eq_str(str(d, "failure_kind"), "timeout", "failure kind serialized");
        expect_eq_str(str(d, "error"), "timeout", "error serialized");
        json_object_put(o);
    }

    // single form, static rejection
    {
        VerificationResult r;
        r.reason = Reason::STATIC_BLACKLIST_MATCH;
        r.scan = ScanVerdict{false, {"os_system", "eval"}};

        json_object* o = json_tokener_parse(verification_result_to_string(r).c_str());
        expect_true(!json_object_get_boolean(get(o, "verified")), "not verified");
        expect_eq_str(str(o, "reason"), "static_blacklist_match", "reason");
        json_object* m = get(o, "matches");
        expect_eq_ll((long long)json_object_array_length(m), 2, "two matches");
        expect_eq_str(json_object_get_string(json_object_array_get_idx(m, 0)), "os_system", "first match");
        expect_true(!has(o, "details"), "no details for static rejection");
        json_object_put(o);
    }

    // batch form
    {
        VerificationResult r;
        r.batch = true;
        r.verified = true;
        r.reason = Reason::DOCKER_PASSED;

        TrialRecord skipped;
        skipped.index = 0;
        skipped.skipped = true;
        skipped.reason = Reason::TOO_SHORT;

        TrialRecord rejected;
        rejected.index = 1;
        rejected.reason = Reason::STATIC_BLACKLIST_MATCH;
        rejected.scan = ScanVerdict{false, {"exec"}};

        TrialRecord fault;
        fault.index = 2;
        fault.reason = Reason::EXCEPTION_IN_VERIFIER;
        fault.error = "boom";

        TrialRecord win;
        win.index = 3;
        win.verified = true;
        win.reason = Reason::DOCKER_PASSED;
        win.execution = passing("2");

        r.trials = {skipped, rejected, fault, win};
        r.outcome = win.execution;

        json_object* o = json_tokener_parse(verification_result_to_string(r, true).c_str());
        expect_true(o != nullptr, "pretty output parses");
        json_object* d = get(o, "details");
        json_object* tried = get(d, "tried_blocks");
        expect_eq_ll((long long)json_object_array_length(tried), 4, "four tried blocks");

        json_object* t0 = json_object_array_get_idx(tried, 0);
        expect_true(json_object_get_boolean(get(t0, "skipped")), "first skipped");
        expect_eq_str(str(t0, "reason"), "too_short", "too_short");
        expect_true(get(t0, "details") == nullptr, "skipped block has null details");

        json_object* t1 = json_object_array_get_idx(tried, 1);
        expect_eq_str(json_object_get_string(json_object_array_get_idx(get(get(t1, "details"), "matches"), 0)),
                      "exec", "rejected block keeps matches");

        json_object* t2 = json_object_array_get_idx(tried, 2);
        expect_eq_str(str(get(t2, "details"), "error"), "boom", "fault message");

        json_object* t3 = json_object_array_get_idx(tried, 3);
        expect_eq_ll(json_object_get_int(get(t3, "index")), 3, "winner index");
        expect_eq_str(str(get(t3, "details"), "stdout"), "2", "winner trial details");

        // winner fields merged beside tried_blocks
        expect_true(json_object_get_boolean(get(d, "ok")), "merged ok");
        expect_eq_str(str(d, "stdout"), "2", "merged stdout");
        json_object_put(o);
    }

    // scan verdict
    {
        json_object* o = json_tokener_parse(scan_verdict_to_string(ScanVerdict{}).c_str());
        expect_true(json_object_get_boolean(get(o, "safe")), "safe verdict");
        expect_eq_ll((long long)json_object_array_length(get(o, "matches")), 0, "no matches");
        json_object_put(o);
        expect_eq_str(json_quote("a\"b"), "\"a\\\"b\"", "json_quote escapes");
    }

    // reason and failure-kind vocabulary
    {
        expect_true(reason_from_str("docker_passed") == Reason::DOCKER_PASSED, "reason parsed");
        expect_true(reason_from_str(reason_to_str(Reason::NO_BLOCK_VERIFIED)) == Reason::NO_BLOCK_VERIFIED,
                    "reason string stable");
        expect_true(!reason_from_str("passed").has_value(), "unknown reason rejected");
        expect_eq_str(failure_kind_to_str(FailureKind::LAUNCH_ERROR), "launch_error", "launch_error string");
        expect_true(failure_kind_from_str("nonzero_exit") == FailureKind::NONZERO_EXIT, "failure kind parsed");
        expect_true(!failure_kind_from_str("crash").has_value(), "unknown failure kind rejected");
    }

    // request parsing
    {
        VerifyRequest req;
        std::string err;

        expect_true(parse_verify_request("{\"code\":\"print(1)\"}", &req, &err), "object with string: " + err);
        expect_true(!req.batch && req.candidates.size() == 1 && req.candidates[0] == "print(1)", "single candidate");
        expect_eq_ll(req.timeout_sec, 0, "timeout unset");

        expect_true(parse_verify_request("{\"code\":[\"a\",\"b\"],\"timeout\":3,\"request_id\":\"r1\"}", &req, &err),
                    "object with list: " + err);
        expect_true(req.batch && req.candidates.size() == 2, "batch candidates");
        expect_eq_ll(req.timeout_sec, 3, "timeout read");
        expect_eq_str(req.request_id, "r1", "request id read");

        expect_true(parse_verify_request("\"1 + 1\"", &req, &err) && !req.batch, "bare string");
        expect_true(parse_verify_request("[\"x\", \"y\"]", &req, &err) && req.batch && req.candidates.size() == 2,
                    "bare array");
        expect_true(parse_verify_request("[]", &req, &err) && req.batch && req.candidates.empty(), "empty array");

        expect_true(!parse_verify_request("not json", &req, &err), "garbage rejected");
        expect_true(!parse_verify_request("{\"nocode\":1}", &req, &err), "missing code rejected");
        expect_true(!parse_verify_request("{\"code\":5}", &req, &err), "numeric code rejected");
        expect_true(!parse_verify_request("{\"code\":[\"a\",1]}", &req, &err), "mixed list rejected");
        expect_true(!parse_verify_request("{\"code\":\"a\",\"timeout\":0}", &req, &err), "zero timeout rejected");
        expect_true(!err.empty(), "error message set");
    }

    std::cerr << "test_serialization: ALL PASSED" << std::endl;
    return 0;
}

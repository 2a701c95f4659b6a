#include "test_common.h"
#include "verigate/candidate_supply.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace verigate;

namespace {

// Fails the first fail_first calls, then answers with a fixed list.
class FlakySupply : public CandidateSupply {
public:
    FlakySupply(int fail_first, std::vector<std::string> answer, int* calls)
        : fail_first_(fail_first), answer_(std::move(answer)), calls_(calls) {}

    std::string endpoint() const override { return "flaky://test"; }
    bool fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) override {
        (*calls_)++;
        if (*calls_ <= fail_first_) {
            if (err) *err = "upstream timeout";
            return false;
        }
        *out = answer_;
        out->push_back("for:" + q.question);
        return true;
    }

private:
    int fail_first_;
    std::vector<std::string> answer_;
    int* calls_;
};

} // namespace

int main() {
    int64_t now = 0;
    auto clock = [&]() { return now; };
    auto no_sleep = [](int64_t) {};

    // signatures: parameter order irrelevant, any difference distinguishes
    {
        std::map<std::string, std::string> a = {{"q", "sort list"}, {"pagesize", "10"}};
        std::map<std::string, std::string> b = {{"pagesize", "10"}, {"q", "sort list"}};
        expect_eq_str(request_signature("ep", a), request_signature("ep", b), "order independent");
        b["pagesize"] = "11";
        expect_true(request_signature("ep", a) != request_signature("ep", b), "value change changes key");
        expect_true(request_signature("ep", a) != request_signature("ep2", a), "endpoint is part of key");
        std::map<std::string, std::string> c = {{"q", "a&pagesize=10"}};
        std::map<std::string, std::string> d = {{"q", "a"}, {"pagesize", "10"}};
        expect_true(request_signature("ep", c) != request_signature("ep", d), "no delimiter collisions");

        CandidateQuery q1{"how to sort", 10};
        CandidateQuery q2{"how to sort", 5};
        expect_true(request_signature("ep", query_params(q1)) != request_signature("ep", query_params(q2)),
                    "max_candidates part of the key");
    }

    // retry then cache
    {
        int calls = 0;
        CandidateCache cache(600 * 1000, clock);
        RetryPolicy rp;
        rp.max_attempts = 3;
        CachedCandidateSupply s(std::make_unique<FlakySupply>(2, std::vector<std::string>{"print(1)"}, &calls),
                                cache, rp, no_sleep);

        CandidateQuery q{"sum", 10};
        std::vector<std::string> out;
        std::string err;
        expect_true(s.fetch(q, &out, &err), "succeeds on third attempt: " + err);
        expect_eq_ll(calls, 3, "two failures then success");
        expect_eq_ll((long long)out.size(), 2, "answer returned");

        std::vector<std::string> again;
        expect_true(s.fetch(q, &again, &err), "cached fetch");
        expect_eq_ll(calls, 3, "served from cache");
        expect_true(again == out, "cached list identical");

        CandidateQuery other{"product", 10};
        expect_true(s.fetch(other, &again, &err), "different query");
        expect_eq_ll(calls, 4, "different query goes upstream");

        now += 600 * 1000;
        expect_true(s.fetch(q, &again, &err), "refetch after expiry");
        expect_eq_ll(calls, 5, "expired entry refreshed");
    }

    // every attempt fails: error surfaced, nothing cached
    {
        int calls = 0;
        CandidateCache cache(1000, clock);
        RetryPolicy rp;
        rp.max_attempts = 2;
        CachedCandidateSupply s(std::make_unique<FlakySupply>(100, std::vector<std::string>{}, &calls),
                                cache, rp, no_sleep);
        std::vector<std::string> out = {"stale"};
        std::string err;
        expect_true(!s.fetch(CandidateQuery{"x", 10}, &out, &err), "failure reported");
        expect_eq_str(err, "upstream timeout", "last error kept");
        expect_true(out.empty(), "output cleared");
        expect_eq_ll(calls, 2, "retried max_attempts times");
        expect_eq_ll((long long)cache.size(), 0, "failure not cached");
    }

    // file-backed supply
    {
        const std::string path = (std::filesystem::temp_directory_path() / "verigate_test_supply.json").string();
        {
            std::ofstream f(path, std::ios::trunc);
            f << "{\"reverse a list\": [\"xs[::-1]\", \"list(reversed(xs))\", \"xs.reverse()\"],"
                 " \"*\": [\"print('fallback')\"]}";
        }
        JsonFileCandidateSupply s(path);
        expect_eq_str(s.endpoint(), "file://" + path, "endpoint names the file");

        std::vector<std::string> out;
        std::string err;
        expect_true(s.fetch(CandidateQuery{"reverse a list", 2}, &out, &err), "known question: " + err);
        expect_eq_ll((long long)out.size(), 2, "capped at max_candidates");
        expect_eq_str(out[0], "xs[::-1]", "order preserved");

        expect_true(s.fetch(CandidateQuery{"anything else", 10}, &out, &err), "fallback entry");
        expect_eq_ll((long long)out.size(), 1, "fallback list");

        {
            std::ofstream f(path, std::ios::trunc);
            f << "{\"q\": [1, 2]}";
        }
        expect_true(!s.fetch(CandidateQuery{"q", 10}, &out, &err), "non-string candidates rejected");

        std::remove(path.c_str());
        expect_true(!s.fetch(CandidateQuery{"q", 10}, &out, &err), "missing file is a failure");
    }

    std::cerr << "test_candidate_supply: ALL PASSED" << std::endl;
    return 0;
}

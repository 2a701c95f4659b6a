#include "verigate/candidate_supply.h"
#include "verigate/json_mini.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace verigate {

std::string request_signature(const std::string& endpoint,
                              const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    oss << endpoint << "?";
    bool first = true;
    for (const auto& kv : params) {
        if (!first) oss << "&";
        first = false;
        // length-prefixed so '&' or '=' inside a value cannot collide
        oss << kv.first.size() << ":" << kv.first << "=" << kv.second.size() << ":" << kv.second;
    }
    return oss.str();
}

std::map<std::string, std::string> query_params(const CandidateQuery& q) {
    return {
        {"max_candidates", std::to_string(q.max_candidates)},
        {"question", q.question},
    };
}

CachedCandidateSupply::CachedCandidateSupply(std::unique_ptr<CandidateSupply> inner, CandidateCache& cache,
                                             RetryPolicy retry, SleepFn sleep)
    : inner_(std::move(inner)), cache_(cache), retry_(retry), sleep_(std::move(sleep)) {}

bool CachedCandidateSupply::fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) {
    if (!out) return false;
    const std::string key = request_signature(inner_->endpoint(), query_params(q));

    std::string last_err;
    bool upstream_ok = true;
    auto got = cache_.get_or_compute(key, [&]() -> std::optional<std::vector<std::string>> {
        std::vector<std::string> fresh;
        bool ok = retry_with_backoff(retry_, [&](int attempt) {
            upstream_calls_++;
            std::string e;
            fresh.clear();
            if (inner_->fetch(q, &fresh, &e)) return true;
            last_err = e;
            std::cerr << "[verigate] candidate fetch failed (attempt " << attempt << "/"
                      << retry_.max_attempts << "): " << e << "\n";
            return false;
        }, sleep_);
        upstream_ok = ok;
        if (!ok || fresh.empty()) return std::nullopt;
        return fresh;
    });

    if (got) {
        *out = std::move(*got);
        return true;
    }
    out->clear();
    if (!upstream_ok) {
        if (err) *err = last_err;
        return false;
    }
    return true;
}

JsonFileCandidateSupply::JsonFileCandidateSupply(std::string path) : path_(std::move(path)) {}

bool JsonFileCandidateSupply::fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) {
    if (!out) return false;
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path_;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    json_mini::Doc doc = json_mini::parse(ss.str());
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = path_ + ": expected a JSON object";
        return false;
    }

    json_object* list = json_mini::member(doc.root, q.question.c_str());
    if (!list) list = json_mini::member(doc.root, "*");
    out->clear();
    if (!list) return true;

    auto arr = json_mini::array_strings(list);
    if (!arr) {
        if (err) *err = path_ + ": candidates must be an array of strings";
        return false;
    }
    *out = std::move(*arr);
    if (out->size() > q.max_candidates) out->resize(q.max_candidates);
    return true;
}

} // namespace verigate

#pragma once

// Candidate supply: where untrusted snippets come from. The engine does
// not care how they are found; it only needs an ordered list per query.

#include "retry.h"
#include "ttl_cache.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace verigate {

struct CandidateQuery {
    std::string question;
    size_t max_candidates{10};
};

class CandidateSupply {
public:
    virtual ~CandidateSupply() = default;

    // Endpoint identity, part of the cache key.
    virtual std::string endpoint() const = 0;

    // Ordered candidates for q. Returns false (with *err) on a transient
    // failure; an empty list is a valid answer.
    virtual bool fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) = 0;
};

// Cache key: endpoint plus every request parameter in sorted order, so
// two requests differing in any parameter never share an entry.
std::string request_signature(const std::string& endpoint,
                              const std::map<std::string, std::string>& params);

std::map<std::string, std::string> query_params(const CandidateQuery& q);

using CandidateCache = TtlCache<std::vector<std::string>>;

// Decorates a supply with the TTL cache and retry-with-backoff. Only
// non-empty successful answers are cached. When every attempt fails the
// result is an empty list and *err carries the last failure.
class CachedCandidateSupply : public CandidateSupply {
public:
    CachedCandidateSupply(std::unique_ptr<CandidateSupply> inner, CandidateCache& cache,
                          RetryPolicy retry = {}, SleepFn sleep = sleep_ms);

    std::string endpoint() const override { return inner_->endpoint(); }
    bool fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) override;

    size_t upstream_calls() const { return upstream_calls_; }

private:
    std::unique_ptr<CandidateSupply> inner_;
    CandidateCache& cache_;
    RetryPolicy retry_;
    SleepFn sleep_;
    size_t upstream_calls_{0};
};

// Reads candidates from a JSON file of the form
//   {"<question>": ["<snippet>", ...], "*": [...]}
// where "*" answers any question without its own entry. The file is
// re-read on every fetch.
class JsonFileCandidateSupply : public CandidateSupply {
public:
    explicit JsonFileCandidateSupply(std::string path);

    std::string endpoint() const override { return "file://" + path_; }
    bool fetch(const CandidateQuery& q, std::vector<std::string>* out, std::string* err) override;

private:
    std::string path_;
};

} // namespace verigate

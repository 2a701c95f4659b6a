#pragma once
#include <fstream>
#include <string>

namespace verigate {

struct AuditHeader {
    std::string engine_version{"1.0.0"};
    std::string run_id;      // one per verification call or CLI invocation
    std::string request_id;  // caller-supplied tracing ID (optional)
};

// JSONL audit trail (opening truncates the file). Every line is canonical JSON (sorted keys)
// and carries chain_prev / chain_hash, where
//   chain_hash = sha256(chain_prev || canonical record without chain fields).
// The first record chains from 64 zeros.
class AuditLog {
public:
    AuditLog(const AuditHeader& hdr, const std::string& path);

    void event(int step, const std::string& name, const std::string& payload_json);

    bool ok() const { return out_.good(); }
    const std::string& path() const { return path_; }
    const std::string& chain_head() const { return chain_prev_; }
    const AuditHeader& header() const { return hdr_; }

private:
    AuditHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
};

// Re-derive the hash chain of an audit file. Returns the number of valid
// records, or -1 with *err set at the first broken or unparsable line.
long verify_audit_chain(const std::string& path, std::string* err);

// Canonical (sorted-key, compact) form of a JSON document. Returns the
// input unchanged if it does not parse.
std::string canonicalize_json(const std::string& raw);

std::string gen_run_id();

} // namespace verigate

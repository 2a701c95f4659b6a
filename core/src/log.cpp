#include "verigate/log.h"
#include "verigate/hash.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace verigate {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Sorted-key serialization so the same record always hashes the same.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

static std::string canonical_string(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

std::string canonicalize_json(const std::string& raw) {
    json_object* obj = json_tokener_parse(raw.c_str());
    if (!obj) return raw;
    std::string s = canonical_string(obj);
    json_object_put(obj);
    return s;
}

std::string gen_run_id() {
    const char* det = std::getenv("VERIGATE_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

AuditLog::AuditLog(const AuditHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(std::string(64, '0')) {}

void AuditLog::event(int step, const std::string& name, const std::string& payload_json) {
    const std::string ts = iso_now();

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "engine_version", json_object_new_string(hdr_.engine_version.c_str()));
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));
    if (!hdr_.request_id.empty())
        json_object_object_add(rec, "request_id", json_object_new_string(hdr_.request_id.c_str()));
    json_object_object_add(rec, "run_id", json_object_new_string(hdr_.run_id.c_str()));
    json_object_object_add(rec, "step", json_object_new_int(step));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));

    const std::string record = canonical_string(rec);
    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    // chain fields join the same object; the line stays canonical
    json_object_object_add(rec, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(rec, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    out_ << canonical_string(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
}

long verify_audit_chain(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return -1;
    }

    std::string prev(64, '0');
    std::string line;
    long n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json_object* obj = json_tokener_parse(line.c_str());
        if (!obj || !json_object_is_type(obj, json_type_object)) {
            if (obj) json_object_put(obj);
            if (err) *err = "line " + std::to_string(n + 1) + ": not a JSON object";
            return -1;
        }

        json_object* v = nullptr;
        std::string got_prev, got_hash;
        if (json_object_object_get_ex(obj, "chain_prev", &v) && json_object_is_type(v, json_type_string))
            got_prev = json_object_get_string(v);
        if (json_object_object_get_ex(obj, "chain_hash", &v) && json_object_is_type(v, json_type_string))
            got_hash = json_object_get_string(v);
        json_object_object_del(obj, "chain_prev");
        json_object_object_del(obj, "chain_hash");
        const std::string record = canonical_string(obj);
        json_object_put(obj);

        if (got_prev != prev) {
            if (err) *err = "line " + std::to_string(n + 1) + ": chain_prev mismatch";
            return -1;
        }
        if (hash::sha256_hex(prev + record) != got_hash) {
            if (err) *err = "line " + std::to_string(n + 1) + ": chain_hash mismatch";
            return -1;
        }
        prev = got_hash;
        n++;
    }
    return n;
}

} // namespace verigate

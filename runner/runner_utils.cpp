#include "runner_utils.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace verigate {

bool read_stdin_capped(size_t max_bytes, std::string* out) {
    out->clear();
    out->reserve(4096);
    char rbuf[8192];
    while (std::cin.read(rbuf, sizeof(rbuf)) || std::cin.gcount()) {
        out->append(rbuf, (size_t)std::cin.gcount());
        if (out->size() > max_bytes) return false;
    }
    return true;
}

bool read_input(const std::string& path_or_dash, std::string* out, std::string* err) {
    // 10MB is far beyond any plausible snippet list
    constexpr size_t MAX_INPUT_BYTES = 10ULL * 1024 * 1024;

    if (path_or_dash.empty() || path_or_dash == "-") {
        if (!read_stdin_capped(MAX_INPUT_BYTES, out)) {
            if (err) *err = "stdin exceeds 10MB limit";
            return false;
        }
        return true;
    }

    std::ifstream in(path_or_dash, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path_or_dash;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    *out = ss.str();
    if (out->size() > MAX_INPUT_BYTES) {
        if (err) *err = path_or_dash + " exceeds 10MB limit";
        return false;
    }
    return true;
}

bool parse_positive_int(const std::string& s, int max_value, int* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') return false;
    if (v <= 0 || v > max_value) return false;
    *out = (int)v;
    return true;
}

} // namespace verigate

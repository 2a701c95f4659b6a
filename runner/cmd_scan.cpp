#include "cmd_scan.h"
#include "runner_utils.h"

#include "verigate/log.h"
#include "verigate/normalizer.h"
#include "verigate/screener.h"
#include "verigate/serialization.h"

#include <iostream>
#include <string>

using namespace verigate;

// Usage: verigate_cli scan [FILE|-]
// Screens the normalized snippet, exactly as the pipeline would.
int cmd_scan(int argc, char** argv) {
    std::string src, err;
    if (!read_input(argc >= 3 ? argv[2] : "-", &src, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    StaticScreener screener;
    ScanVerdict v = screener.scan(normalize_snippet(src));
    std::cout << scan_verdict_to_string(v) << "\n";
    return v.safe ? 0 : 1;
}

// Usage: verigate_cli normalize [FILE|-]
int cmd_normalize(int argc, char** argv) {
    std::string src, err;
    if (!read_input(argc >= 3 ? argv[2] : "-", &src, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    std::cout << normalize_snippet(src);
    return 0;
}

// Usage: verigate_cli audit_verify <audit.jsonl>
int cmd_audit_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: verigate_cli audit_verify <audit.jsonl>\n";
        return 2;
    }
    std::string err;
    long n = verify_audit_chain(argv[2], &err);
    if (n < 0) {
        std::cout << "AUDIT: BROKEN (" << err << ")\n";
        return 1;
    }
    std::cout << "AUDIT: OK (" << n << " records)\n";
    return 0;
}

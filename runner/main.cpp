#include "cmd_scan.h"
#include "cmd_verify.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "verigate_cli <verify|ask|scan|normalize|audit_verify> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "verify") return cmd_verify(argc, argv);
    if (cmd == "ask") return cmd_ask(argc, argv);
    if (cmd == "scan") return cmd_scan(argc, argv);
    if (cmd == "normalize") return cmd_normalize(argc, argv);
    if (cmd == "audit_verify") return cmd_audit_verify(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

#include "verigate/screener.h"

namespace verigate {

const std::vector<ScreenRule>& default_screen_rules() {
    static const std::vector<ScreenRule> rules = {
        // process spawning
        {"os_system",  R"(\bos\.system\s*\()"},
        {"subprocess", R"(\bsubprocess\.)"},
        // dynamic evaluation
        {"eval",       R"(\beval\s*\()"},
        {"exec",       R"(\bexec\s*\()"},
        // destructive writes: open(..., 'w')
        {"open_write", R"(\bopen\s*\(.+['"]w['"])"},
        // outbound network
        {"requests",   R"(\brequests\.)"},
        {"urllib",     R"(\burllib\.)"},
        {"socket",     R"(\bsocket\.)"},
    };
    return rules;
}

StaticScreener::StaticScreener() : StaticScreener(default_screen_rules()) {}

StaticScreener::StaticScreener(std::vector<ScreenRule> rules) {
    rules_.reserve(rules.size());
    for (auto& r : rules) {
        rules_.push_back(Compiled{std::move(r.id), std::regex(r.pattern, std::regex::ECMAScript | std::regex::optimize)});
    }
}

ScanVerdict StaticScreener::scan(const std::string& source) const {
    ScanVerdict v;
    for (const auto& r : rules_) {
        if (std::regex_search(source, r.re)) v.matches.push_back(r.id);
    }
    v.safe = v.matches.empty();
    return v;
}

} // namespace verigate

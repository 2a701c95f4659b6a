#pragma once

// Static screener: coarse capability denylist applied before any sandbox
// run. It only saves sandbox executions on snippets that obviously try to
// spawn processes, evaluate code, write files or reach the network.
// The sandbox (network off, resource capped, disposable) is the boundary.

#include "types.h"

#include <regex>
#include <string>
#include <vector>

namespace verigate {

struct ScreenRule {
    std::string id;      // reported in ScanVerdict::matches
    std::string pattern; // ECMAScript regex
};

// Built-in rule set, in reporting order.
const std::vector<ScreenRule>& default_screen_rules();

class StaticScreener {
public:
    StaticScreener();
    // Throws std::regex_error if a pattern does not compile.
    explicit StaticScreener(std::vector<ScreenRule> rules);

    // Pure function of (source, rule set). Reports every matching rule.
    ScanVerdict scan(const std::string& source) const;

    size_t rule_count() const { return rules_.size(); }

private:
    struct Compiled {
        std::string id;
        std::regex re;
    };
    std::vector<Compiled> rules_;
};

} // namespace verigate

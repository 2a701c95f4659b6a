#include "verigate/normalizer.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace verigate {

static std::string trim_ws(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    if (i) s.erase(0, i);
    return s;
}

static std::string rtrim_ws(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

static std::string strip_cr(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
        out.push_back(s[i]);
    }
    return out;
}

static bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace((unsigned char)c)) return false;
    }
    return true;
}

std::string dedent(const std::string& source) {
    std::vector<std::string> lines;
    {
        std::string cur;
        for (char c : source) {
            if (c == '\n') { lines.push_back(cur); cur.clear(); }
            else cur.push_back(c);
        }
        lines.push_back(cur);
    }

    bool have_prefix = false;
    std::string prefix;
    for (const auto& l : lines) {
        if (is_blank(l)) continue;
        size_t n = 0;
        while (n < l.size() && (l[n] == ' ' || l[n] == '\t')) n++;
        std::string lead = l.substr(0, n);
        if (!have_prefix) {
            prefix = lead;
            have_prefix = true;
            continue;
        }
        size_t k = 0;
        while (k < prefix.size() && k < lead.size() && prefix[k] == lead[k]) k++;
        prefix.resize(k);
    }
    if (prefix.empty()) return source;

    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i) out << "\n";
        const auto& l = lines[i];
        if (is_blank(l)) continue; // whitespace-only lines collapse to empty
        out << l.substr(prefix.size());
    }
    return out.str();
}

namespace {

const char* const kStatementKeywords[] = {
    "import", "from", "def", "class", "if", "elif", "else", "for", "while",
    "with", "try", "except", "finally", "raise", "assert", "del", "pass",
    "return", "global", "nonlocal", "async", "await", "break", "continue",
    "yield",
};

bool is_ident_char(char c) {
    return std::isalnum((unsigned char)c) || c == '_';
}

std::string leading_identifier(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_ident_char(s[i])) i++;
    return s.substr(0, i);
}

// kw spelled at s[i] as a whole word.
bool starts_keyword(const std::string& s, size_t i, const char* kw) {
    const std::string k(kw);
    if (s.compare(i, k.size(), k) != 0) return false;
    if (i > 0 && is_ident_char(s[i - 1])) return false;
    const size_t end = i + k.size();
    return end >= s.size() || !is_ident_char(s[end]);
}

// Walk the line outside string literals. Calls fn(index, char, depth) for
// every code character; stops early if fn returns false.
template <typename Fn>
void scan_code_chars(const std::string& s, Fn fn) {
    int depth = 0;
    char quote = 0;
    bool esc = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; continue; }
        if (c == '(' || c == '[' || c == '{') depth++;
        else if ((c == ')' || c == ']' || c == '}') && depth > 0) depth--;
        if (!fn(i, c, depth)) return;
    }
}

// Drop a trailing "# comment" that sits outside any string literal.
std::string strip_line_comment(const std::string& s) {
    size_t cut = std::string::npos;
    scan_code_chars(s, [&](size_t i, char c, int) {
        if (c == '#') { cut = i; return false; }
        return true;
    });
    if (cut == std::string::npos) return s;
    return trim_ws(s.substr(0, cut));
}

} // namespace

bool is_bare_expression(const std::string& trimmed) {
    if (trimmed.empty()) return false;
    if (trimmed.find('\n') != std::string::npos) return false;
    if (trimmed[0] == '@' || trimmed[0] == '#') return false;

    const std::string word = leading_identifier(trimmed);
    for (const char* kw : kStatementKeywords) {
        if (word == kw) return false;
    }
    if (word == "print") {
        size_t p = word.size();
        while (p < trimmed.size() && (trimmed[p] == ' ' || trimmed[p] == '\t')) p++;
        if (p < trimmed.size() && trimmed[p] == '(') return false;
    }

    bool statement = false;
    int open_lambdas = 0; // top-level lambdas whose parameter list is still open
    scan_code_chars(trimmed, [&](size_t i, char c, int depth) {
        if (c == '#') return false;
        if (depth != 0) return true;
        if (c == ';') { statement = true; return false; }
        if (c == 'l' && starts_keyword(trimmed, i, "lambda")) { open_lambdas++; return true; }
        if (c == ':' && open_lambdas > 0) { open_lambdas--; return true; }
        if (c == '=' && open_lambdas > 0) return true; // parameter default
        if (c == '=') {
            char prev = i > 0 ? trimmed[i - 1] : 0;
            char next = i + 1 < trimmed.size() ? trimmed[i + 1] : 0;
            // ==, !=, <=, >= are comparisons; := only appears parenthesized
            if (next == '=' || prev == '=' || prev == '!' || prev == '<' || prev == '>' || prev == ':') return true;
            statement = true; // =, +=, -=, *=, ...
            return false;
        }
        return true;
    });
    return !statement;
}

std::string normalize_snippet(const std::string& source) {
    std::string code = rtrim_ws(dedent(strip_cr(source)));
    std::string trimmed = trim_ws(code);
    if (trimmed.empty()) return "\n";

    if (is_bare_expression(trimmed)) {
        std::string expr = strip_line_comment(trimmed);
        if (!expr.empty()) return "print(" + expr + ")\n";
    }
    return code + "\n";
}

} // namespace verigate

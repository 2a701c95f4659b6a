#pragma once
#include <string>

namespace verigate {

// Make a raw candidate independently runnable with observable output.
//
// - CRLF line endings become LF, common leading indentation is removed.
// - A single bare expression ("1 + 1", "sorted(xs)") is wrapped as
//   print(<expr>) so a correct expression is distinguishable from a no-op.
// - Anything else (multi-line, ';'-separated, keyword statements,
//   assignments, explicit print calls) passes through unchanged apart from
//   a guaranteed single trailing newline.
std::string normalize_snippet(const std::string& source);

// True if the (already trimmed, single-line) text reads as one bare
// expression rather than a statement.
bool is_bare_expression(const std::string& trimmed);

// Remove the longest whitespace prefix shared by all non-blank lines.
std::string dedent(const std::string& source);

} // namespace verigate

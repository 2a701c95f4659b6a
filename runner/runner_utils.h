#pragma once

#include <cstddef>
#include <string>

namespace verigate {

// Reads all of stdin into *out. False if it exceeds max_bytes.
bool read_stdin_capped(size_t max_bytes, std::string* out);

// "-" (or empty) means stdin; anything else is a file path.
bool read_input(const std::string& path_or_dash, std::string* out, std::string* err);

// Parses a positive integer flag value; false on garbage or out of range.
bool parse_positive_int(const std::string& s, int max_value, int* out);

} // namespace verigate

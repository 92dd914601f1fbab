#pragma once

#include <string>
#include <string_view>

namespace gang::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_positive_uint(const std::string& value, unsigned int& out);

bool parse_double(const std::string& token, double& out);
bool parse_positive_double(const std::string& token, double& out);
bool parse_non_negative_double(const std::string& token, double& out);
bool parse_double_pair(const std::string& token, double& a, double& b);
bool parse_bool_value(const std::string& value, bool& out);

// Double-quoted text; \" \\ \n \r \t are escapes, any other backslash is kept.
bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_quoted(const std::string& s);
std::string to_lower_copy(std::string value);
std::string trim_copy(const std::string& s);

// Shortest decimal text that reads back to the same value for the
// magnitudes used by sheets (points, inches, prices).
std::string format_number(double value);

} // namespace gang::core

#ifndef FLAG_PARSE_H
#define FLAG_PARSE_H

#include <cstdint>
#include <string>

// Whole-string conversions of command line values. Anything that is not
// exactly one number of the requested type is a ConfigurationError naming
// the flag and the value.
int parse_int_flag(const std::string& flag, const std::string& value);
long long parse_long_flag(const std::string& flag, const std::string& value);
double parse_double_flag(const std::string& flag, const std::string& value);
std::uint64_t parse_seed_flag(const std::string& flag, const std::string& value);

#endif // FLAG_PARSE_H

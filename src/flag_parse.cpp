// src/flag_parse.cpp
#include "flag_parse.h"
#include <stdexcept>
#include "domain.h"

namespace {

[[noreturn]] void reject(const std::string& flag, const std::string& value) {
    throw ConfigurationError("invalid " + flag + " '" + value + "'");
}

template <typename Convert>
auto convert_whole(const std::string& flag, const std::string& value, Convert convert)
    -> decltype(convert(value, static_cast<size_t*>(nullptr))) {
    size_t pos = 0;
    decltype(convert(value, &pos)) result{};
    try {
        result = convert(value, &pos);
    } catch (const std::invalid_argument&) {
        reject(flag, value);
    } catch (const std::out_of_range&) {
        reject(flag, value);
    }
    if (pos != value.size()) {
        reject(flag, value);
    }
    return result;
}

} // namespace

int parse_int_flag(const std::string& flag, const std::string& value) {
    return convert_whole(flag, value,
                         [](const std::string& s, size_t* pos) { return std::stoi(s, pos); });
}

long long parse_long_flag(const std::string& flag, const std::string& value) {
    return convert_whole(flag, value,
                         [](const std::string& s, size_t* pos) { return std::stoll(s, pos); });
}

double parse_double_flag(const std::string& flag, const std::string& value) {
    return convert_whole(flag, value,
                         [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

std::uint64_t parse_seed_flag(const std::string& flag, const std::string& value) {
    // stoull accepts "-1" and wraps it
    if (value.find('-') != std::string::npos) {
        reject(flag, value);
    }
    return convert_whole(flag, value,
                         [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
}

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace fastxfer {

// 1234567 -> "1,234,567"
std::string format_with_commas(std::uint64_t n);

// local time, e.g. 2024-05-01T12:30:00+02:00
std::string rfc3339_now();

// echo full command line once for diagnostics
void echo_command_line(std::ostream &out, int argc, char *argv[]);

constexpr double kMebibyte = 1024.0 * 1024.0;

} // namespace fastxfer

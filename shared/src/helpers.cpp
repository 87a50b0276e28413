#include "fastxfer/helpers.hpp"

#include <ctime>

namespace fastxfer {

std::string format_with_commas(std::uint64_t n) {
    std::string digits = std::to_string(n);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    std::size_t first_group = digits.size() % 3;
    if (first_group == 0) {
        first_group = 3;
    }
    result.append(digits, 0, first_group);
    for (std::size_t i = first_group; i < digits.size(); i += 3) {
        result.push_back(',');
        result.append(digits, i, 3);
    }
    return result;
}

std::string rfc3339_now() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    ::localtime_r(&now, &local);

    char buf[40];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &local);
    std::string out(buf, len);
    // strftime gives +0200, RFC 3339 wants +02:00
    if (out.size() >= 5 && (out[out.size() - 5] == '+' || out[out.size() - 5] == '-')) {
        out.insert(out.size() - 2, ":");
    }
    return out;
}

void echo_command_line(std::ostream &out, int argc, char *argv[]) {
    out << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        out << " \"" << argv[i] << '"';
    }
    out << std::endl;
}

} // namespace fastxfer

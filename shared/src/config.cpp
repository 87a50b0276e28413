#include "fastxfer/config.hpp"
#include "fastxfer/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace fastxfer {

namespace {

Mode parse_mode(const std::string &value) {
    if (value == "send") {
        return Mode::Send;
    }
    if (value == "receive") {
        return Mode::Receive;
    }
    throw TransferError(ErrorKind::Setup, "invalid mode '" + value + "', use 'send' or 'receive'");
}

int parse_buffer_size(const std::string &flag, const std::string &value) {
    char *end = nullptr;
    errno = 0;
    long n = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE || n < 0 || n > std::numeric_limits<int>::max()) {
        throw TransferError(ErrorKind::Setup, flag + " expects a non-negative byte count, got '" + value + "'");
    }
    return static_cast<int>(n);
}

template <typename T>
void read_key(const nlohmann::json &doc, const char *key, T &out) {
    if (doc.contains(key)) {
        out = doc.at(key).get<T>();
    }
}

} // namespace

const char *to_string(Mode mode) {
    return mode == Mode::Send ? "send" : "receive";
}

std::uint64_t parse_size(const std::string &text) {
    std::string s = text;
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

    std::uint64_t multiplier = 1;
    if (!s.empty()) {
        switch (s.back()) {
        case 'G':
            multiplier = 1024ull * 1024 * 1024;
            break;
        case 'M':
            multiplier = 1024ull * 1024;
            break;
        case 'K':
            multiplier = 1024ull;
            break;
        default:
            break;
        }
        if (multiplier != 1) {
            s.pop_back();
        }
    }

    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw TransferError(ErrorKind::Setup, "cannot parse size '" + text + "'");
    }
    errno = 0;
    unsigned long long n = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE || n > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw TransferError(ErrorKind::Setup, "size out of range '" + text + "'");
    }
    if (n == 0) {
        throw TransferError(ErrorKind::Setup, "size must be positive: '" + text + "'");
    }
    return static_cast<std::uint64_t>(n) * multiplier;
}

void load_config_file(const std::string &path, Config &config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TransferError(ErrorKind::Setup, "could not open config file '" + path + "'");
    }

    nlohmann::json doc;
    try {
        file >> doc;
        if (!doc.is_object()) {
            throw TransferError(ErrorKind::Setup, "config file '" + path + "' must hold a JSON object");
        }
        if (doc.contains("mode")) {
            config.mode = parse_mode(doc.at("mode").get<std::string>());
        }
        read_key(doc, "file", config.file);
        read_key(doc, "dir", config.dir);
        read_key(doc, "addr", config.addr);
        read_key(doc, "no_splice", config.no_splice);
        read_key(doc, "sndbuf", config.sndbuf);
        read_key(doc, "rcvbuf", config.rcvbuf);
        read_key(doc, "odirect", config.odirect);
        read_key(doc, "size", config.size);
        read_key(doc, "prewarm", config.prewarm);
        read_key(doc, "failure_log", config.failure_log);
    } catch (const nlohmann::json::exception &e) {
        throw TransferError(ErrorKind::Setup, "invalid config file '" + path + "': " + e.what());
    }
}

Config parse_args(int argc, char *argv[], Mode mode) {
    Config config;
    config.mode = mode;

    // config file first so that flags override it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw TransferError(ErrorKind::Setup, "--config requires a path");
            }
            load_config_file(argv[i + 1], config);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw TransferError(ErrorKind::Setup, arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--mode") {
            config.mode = parse_mode(value());
        } else if (arg == "--file") {
            config.file = value();
        } else if (arg == "--dir") {
            config.dir = value();
        } else if (arg == "--addr") {
            config.addr = value();
        } else if (arg == "--size") {
            config.size = value();
        } else if (arg == "--sndbuf") {
            config.sndbuf = parse_buffer_size(arg, value());
        } else if (arg == "--rcvbuf") {
            config.rcvbuf = parse_buffer_size(arg, value());
        } else if (arg == "--failure-log") {
            config.failure_log = value();
        } else if (arg == "--no-splice") {
            config.no_splice = true;
        } else if (arg == "--odirect") {
            config.odirect = true;
        } else if (arg == "--prewarm") {
            config.prewarm = true;
        } else {
            throw TransferError(ErrorKind::Setup, "unknown option: " + arg);
        }
    }

    if (config.mode != mode) {
        throw TransferError(ErrorKind::Setup, std::string("this executable only runs in ") + to_string(mode) +
                                                  " mode, got --mode " + to_string(config.mode));
    }
    return config;
}

void validate_config(const Config &config) {
    if (config.sndbuf < 0 || config.rcvbuf < 0) {
        throw TransferError(ErrorKind::Setup, "socket buffer sizes must be non-negative");
    }
    if (config.addr.empty()) {
        throw TransferError(ErrorKind::Setup, "--addr must not be empty");
    }

    if (config.mode == Mode::Send) {
        if (config.file.empty()) {
            throw TransferError(ErrorKind::Setup, "send mode requires --file");
        }
        if (config.file == kSyntheticSourcePath && config.size.empty()) {
            throw TransferError(ErrorKind::Setup, std::string("--size is required when sending ") + kSyntheticSourcePath);
        }
        if (!config.size.empty()) {
            parse_size(config.size);
        }
    } else {
        if (config.dir.empty()) {
            throw TransferError(ErrorKind::Setup, "receive mode requires --dir");
        }
        if (config.odirect && config.no_splice) {
            std::cerr << "[warning] --odirect with --no-splice: direct I/O alignment rules may make buffered writes fail"
                      << std::endl;
        }
    }
}

std::optional<std::uint64_t> declared_size(const Config &config) {
    if (config.size.empty()) {
        return std::nullopt;
    }
    return parse_size(config.size);
}

void print_usage(std::ostream &out, const char *program, Mode mode) {
    out << "Usage: " << program << " [options]\n";
    out << "  --config <file.json>   load options from a JSON object (flags override it)\n";
    out << "  --addr <host:port>     " << (mode == Mode::Send ? "receiver address" : "listen address")
        << " (default localhost:8080)\n";
    if (mode == Mode::Send) {
        out << "  --file <path>          file to send (" << kSyntheticSourcePath << " for a synthetic load)\n";
        out << "  --size <n[K|M|G]>      bytes to send, required with " << kSyntheticSourcePath << "\n";
        out << "  --sndbuf <bytes>       TCP send buffer size (0 = system default)\n";
        out << "  --prewarm              issue a read-ahead hint for the file before sending\n";
        out << "  --failure-log <path>   where device I/O failures are recorded (default failed_files.log)\n";
    } else {
        out << "  --dir <path>           destination directory (" << kDiscardTargetPath << " discards data)\n";
        out << "  --no-splice            use the buffered reader/writer pipeline instead of splice\n";
        out << "  --rcvbuf <bytes>       TCP receive buffer size (0 = system default)\n";
        out << "  --odirect              open destination files with O_DIRECT (alignment rules apply)\n";
    }
    out << "  --help                 show this message\n";
}

} // namespace fastxfer

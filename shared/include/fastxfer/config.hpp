#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace fastxfer {

enum class Mode { Send, Receive };

const char *to_string(Mode mode);

// source file selecting the synthetic zero-content generator
inline constexpr const char *kSyntheticSourcePath = "/dev/zero";
// destination directory selecting the discarding sink
inline constexpr const char *kDiscardTargetPath = "/dev/null";

// Built once at startup from defaults, an optional JSON file and the command
// line, then handed to the engines by value.
struct Config {
    Mode mode = Mode::Send;
    std::string file;
    std::string dir = ".";
    std::string addr = "localhost:8080";
    bool no_splice = false;
    int sndbuf = 0;
    int rcvbuf = 0;
    bool odirect = false;
    std::string size;
    bool prewarm = false;
    std::string failure_log = "failed_files.log";
    bool show_help = false;
};

// "10G", "500m", " 1024K " -> bytes (powers of 1024); throws TransferError(Setup)
std::uint64_t parse_size(const std::string &text);

// merges keys of a JSON object into `config`; throws TransferError(Setup)
void load_config_file(const std::string &path, Config &config);

// defaults <- --config file <- flags; `mode` is the mode of the running executable
Config parse_args(int argc, char *argv[], Mode mode);

// throws TransferError(Setup); prints warnings for questionable combinations
void validate_config(const Config &config);

std::optional<std::uint64_t> declared_size(const Config &config);

void print_usage(std::ostream &out, const char *program, Mode mode);

} // namespace fastxfer

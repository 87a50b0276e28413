#pragma once

#include <string>

namespace fastxfer {

// append-only "<timestamp> - <path> - <reason>" lines
class FailureLog {
public:
    explicit FailureLog(std::string path);

    // never throws; problems with the log itself go to stderr
    void append(const std::string &file_path, const std::string &reason) const;

    const std::string &path() const;

private:
    std::string log_path;
};

} // namespace fastxfer

#include "fastxfer/failure_log.hpp"
#include "fastxfer/helpers.hpp"

#include <fstream>
#include <iostream>

namespace fastxfer {

FailureLog::FailureLog(std::string path) : log_path(std::move(path)) {}

void FailureLog::append(const std::string &file_path, const std::string &reason) const {
    std::ofstream outfile(this->log_path, std::ios::binary | std::ios::app);
    if (!outfile) {
        std::cerr << "[error] could not open failure log " << this->log_path << std::endl;
        return;
    }
    outfile << rfc3339_now() << " - " << file_path << " - " << reason << "\n";
    if (!outfile) {
        std::cerr << "[error] could not write failure log " << this->log_path << std::endl;
    }
}

const std::string &FailureLog::path() const {
    return this->log_path;
}

} // namespace fastxfer

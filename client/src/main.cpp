#include "fastxfer/config.hpp"
#include "fastxfer/errors.hpp"
#include "fastxfer/failure_log.hpp"
#include "fastxfer/helpers.hpp"
#include "fastxfer/version.hpp"
#include "sender.hpp"

#include <csignal>
#include <iostream>

using namespace fastxfer;

int main(int argc, char *argv[]) {
    echo_command_line(std::cout, argc, argv);

    if (argc < 2) {
        print_usage(std::cerr, argv[0], Mode::Send);
        return 2;
    }

    Config config;
    try {
        config = parse_args(argc, argv, Mode::Send);
        if (config.show_help) {
            print_usage(std::cout, argv[0], Mode::Send);
            return 0;
        }
        validate_config(config);
    } catch (const TransferError &e) {
        std::cerr << "[error] " << e.what() << std::endl;
        print_usage(std::cerr, argv[0], Mode::Send);
        return 2;
    }

    // broken connections surface as EPIPE instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "fastxfer client (version " << version() << ")" << std::endl;

    if (config.prewarm && !is_synthetic_source(config.file)) {
        prewarm_file(config.file, platform_kernel_io());
    }

    try {
        SendResult result = send_file(make_send_options(config));
        double mbps = result.seconds > 0 ? static_cast<double>(result.bytes_sent) / result.seconds / kMebibyte : 0.0;
        std::cout << "file sent successfully: '" << result.name << "', " << format_with_commas(result.bytes_sent)
                  << " bytes" << (result.zero_copy ? " (sendfile)" : " (buffered)") << ", " << mbps << " MB/s"
                  << std::endl;
        return 0;
    } catch (const TransferError &e) {
        switch (e.kind()) {
        case ErrorKind::Setup:
            std::cerr << "[error] configuration: " << e.what() << std::endl;
            return 2;
        case ErrorKind::Connect:
            std::cerr << "[error] network: " << e.what() << std::endl;
            break;
        case ErrorKind::File:
            std::cerr << "[error] file: " << e.what() << std::endl;
            break;
        case ErrorKind::DeviceIo:
            std::cerr << "[error] transfer: " << e.what() << std::endl;
            FailureLog(config.failure_log).append(config.file, e.what());
            break;
        case ErrorKind::ConnectionLost:
            std::cerr << "[error] connection lost: " << e.what() << std::endl;
            break;
        case ErrorKind::Integrity:
            std::cerr << "[error] incomplete transfer: " << e.what() << std::endl;
            break;
        default:
            std::cerr << "[error] " << to_string(e.kind()) << ": " << e.what() << std::endl;
            break;
        }
        return 1;
    }
}

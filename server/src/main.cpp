#include "fastxfer/config.hpp"
#include "fastxfer/errors.hpp"
#include "fastxfer/helpers.hpp"
#include "fastxfer/version.hpp"
#include "simple_server.hpp"

#include <csignal>
#include <iostream>

using namespace fastxfer;

int main(int argc, char *argv[]) {
    echo_command_line(std::cout, argc, argv);

    Config config;
    try {
        config = parse_args(argc, argv, Mode::Receive);
        if (config.show_help) {
            print_usage(std::cout, argv[0], Mode::Receive);
            return 0;
        }
        validate_config(config);
    } catch (const TransferError &e) {
        std::cerr << "[error] " << e.what() << std::endl;
        print_usage(std::cerr, argv[0], Mode::Receive);
        return 2;
    }

    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "Starting fastxfer server (version " << version() << ") on " << config.addr << std::endl;
    int status = start_simple_server(config);
    std::cout << "Server exited." << std::endl;
    return status;
}

#include "bankit.hpp"
#include <iostream>
#include <string>

int main(int argc, char **argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << bankit::Config::usage(argv[0]);
            return 0;
        }
    }

    auto config = bankit::Config::fromArgs(argc, argv);
    if (!config.is_ok()) {
        std::cerr << config.error().message.c_str() << std::endl;
        std::cerr << bankit::Config::usage(argv[0]);
        return 2;
    }

    bankit::Bank bank;
    auto init = bank.initialize(config.value());
    if (!init.is_ok()) {
        std::cerr << "Failed to open ledger: " << init.error().message.c_str() << std::endl;
        return 1;
    }

    bankit::cli::Session session(bank, std::cin, std::cout);
    session.run();

    bank.shutdown();
    bankit::log::shutdown();
    return 0;
}

#include <iostream>
#include <memory>
#include <string>
#include "cli/sshgate_cli.hpp"
#include "cli/theme.hpp"
#include "ssh/ssh_connector.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    sshgate"
              << theme::color::RESET << theme::color::DIM
              << "                 Use ~/.sshgate/config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    sshgate "
              << theme::color::RESET << theme::color::AMBER << "<config>"
              << theme::color::RESET << theme::color::DIM
              << "        Use another config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sshgate --version       Show version\n"
              << "    sshgate --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::filesystem::path config_path = Config::get_config_path();
        bool explicit_path = false;

        if (argc >= 2) {
            std::string arg = argv[1];
            if (arg == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "sshgate"
                          << theme::color::RESET << theme::color::DIM
                          << " version 0.1.0" << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            }
            config_path = arg;
            explicit_path = true;
        }

        SshGateCLI cli(std::make_unique<SshConnector>());
        if (!cli.load_config(config_path, explicit_path)) {
            return 1;
        }
        cli.run_repl();
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

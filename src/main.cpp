#include <iostream>
#include <vector>
#include <string>
#include "cli/flx_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>

int main(int argc, char** argv) {
    try {
        FlxCLI cli(platform::working_dir());

        if (argc == 1) {
            cli.print_usage();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version" || cmd == "-v") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "flx"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << FLX_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            cli.print_usage();
            return 0;
        } else if (cmd == "gen") {
            return cli.run_gen(rest);
        } else if (cmd == "config") {
            return cli.run_config(rest);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            cli.print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

#include <iostream>
#include <vector>
#include <string>
#include "cli/pool_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        PoolCLI cli(parse_cli_args(args));
        return cli.execute();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

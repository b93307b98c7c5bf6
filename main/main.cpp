#include "cli/Commands.hpp"
#include "log/Registry.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const int rc = sp::cli::run(args, std::cout, std::cerr);
    sp::log::Registry::shutdown();
    return rc;
}

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace sp::cli {

// Runs one command line (without argv[0]) and returns the process exit code.
// Errors are reported on err; nothing is thrown.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

std::string usage();

}

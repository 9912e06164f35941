#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace pqc_bench {

// Process exit codes
constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_RUN_FAILED = 1;
constexpr int EXIT_CODE_USAGE = 2;

// Whole command-line program: parses args (args[0] is the program name), runs the
// benchmark and maps errors to exit codes. Never throws for a failed run.
int RunApplication(const std::vector<std::string>& args,
                   std::ostream& out = std::cout,
                   std::ostream& err = std::cerr);

} // namespace pqc_bench

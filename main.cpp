#include <string>
#include <vector>

#include "Application.hpp"

int main(int argc, char* argv[]) {
    // Usage:
    // ./pqc_benchmark [--iterations N] [--kem A,B] [--sig A,B] [--baseline]
    // ./pqc_benchmark --list

    std::vector<std::string> args(argv, argv + argc);
    return pqc_bench::RunApplication(args);
}

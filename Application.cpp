#include "Application.hpp"
#include "BenchmarkRunner.hpp"
#include "Clock.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "OpensslMechanism.hpp"
#include "OqsMechanism.hpp"

#include <stdexcept>

namespace pqc_bench {

namespace {

void ListMechanisms(const OqsProvider& oqs, std::ostream& out) {
    out << "liboqs " << OqsRuntime::Version() << std::endl;
    out << "Enabled KEMs:" << std::endl;
    for (const auto& name : oqs.EnabledKems()) {
        out << " - " << name << std::endl;
    }
    out << "Enabled signatures:" << std::endl;
    for (const auto& name : oqs.EnabledSignatures()) {
        out << " - " << name << std::endl;
    }
}

} // namespace

int RunApplication(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    const std::string program = args.empty() ? "pqc_benchmark" : args[0];

    BenchmarkConfig config;
    try {
        config = ParseArgs(args);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << std::endl;
        PrintUsage(err, program);
        return EXIT_CODE_USAGE;
    }

    if (config.show_help) {
        PrintUsage(out, program);
        return EXIT_CODE_OK;
    }

    OqsRuntime oqs_runtime;
    OqsProvider oqs;

    if (config.list_only) {
        ListMechanisms(oqs, out);
        return EXIT_CODE_OK;
    }

    OpensslProvider openssl;
    SteadyClock clock;
    Logger logger(config.log_level, out, err);

    try {
        BenchmarkRunner runner(config, oqs, &openssl, clock, logger);
        runner.Run();
    } catch (const std::exception& e) {
        err << "Benchmark failed: " << e.what() << std::endl;
        return EXIT_CODE_RUN_FAILED;
    }

    return EXIT_CODE_OK;
}

} // namespace pqc_bench

#include "benchmark/PerformanceTester.hpp"
#include "core/GuardConfig.hpp"
#include "engine/RequestProcessor.hpp"
#include "observability/PipelineTelemetry.hpp"
#include "security/DiagnosticSink.hpp"
#include "security/SecurityAwareLogger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#ifndef OVERFLOW_GUARD_BUILD_HASH
#define OVERFLOW_GUARD_BUILD_HASH "unknown"
#endif

namespace {

    constexpr std::size_t kDefaultBenchmarkRequests = 10000;

    enum class Mode { Interactive, PerformanceTest };

    struct CliOptions {
        Mode mode = Mode::Interactive;
        std::string config_path;
        std::size_t requests = kDefaultBenchmarkRequests;
    };

    void usage(const char* argv0) {
        std::cerr <<
            "Usage:\n"
            "  " << argv0 << " [--config FILE]                        read one line and sanitize it\n"
            "  " << argv0 << " [--config FILE] performancetest [N]    run N random requests (default 10000)\n"
            "  " << argv0 << " --help\n";
    }

    bool is_all_digits(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

    // A non-numeric request count keeps the default.
    bool parse_args(int argc, char** argv, CliOptions& opts) {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config") {
                if (++i >= argc) return false;
                opts.config_path = argv[i];
            } else if (a == "performancetest") {
                opts.mode = Mode::PerformanceTest;
                if (i + 1 < argc && is_all_digits(argv[i + 1])) {
                    try {
                        opts.requests = static_cast<std::size_t>(std::stoull(argv[++i]));
                    } catch (const std::out_of_range&) {
                        return false;
                    }
                } else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    ++i;
                }
            } else {
                return false;
            }
        }
        return true;
    }

    void verify_build_flags(security::SecurityAwareLogger& logger) {
#if !defined(__OPTIMIZE__)
        logger.log(security::Level::Warn, "[Build] Built without optimizations (-O2)");
#endif
#ifdef __SANITIZE_ADDRESS__
        logger.log(security::Level::Info, "[Build] AddressSanitizer is enabled");
#endif
        logger.log(security::Level::Info, "[Build] hash=", OVERFLOW_GUARD_BUILD_HASH);
    }

    int run_interactive(const guard::RequestProcessor& processor) {
        std::cout << "Enter data: " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cerr << "No input received.\n";
            return EXIT_FAILURE;
        }

        auto outcome = processor.process(line);
        if (auto* ok = std::get_if<guard::Accepted>(&outcome)) {
            std::cout << "Data processed successfully:\n" << ok->value << "\n";
            return EXIT_SUCCESS;
        }
        std::cout << "Input rejected. Check the logs for details.\n";
        return EXIT_FAILURE;
    }

    int run_performance_test(const guard::GuardConfig& config,
                             security::SecurityAwareLogger& logger,
                             std::size_t requests) {
        // Per-request records would dominate the timing; only the tester's own
        // summary goes to the real log.
        security::NullSink quiet;
        guard::RequestProcessor processor(config, quiet);
        benchmark::PerformanceTester tester(processor, logger);

        auto report = tester.run(requests);
        std::cout << "\n=== Performance test results ===\n"
                  << "Results written to " << logger.file_path().string() << "\n"
                  << report;
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        usage(argv[0]);
        return EXIT_SUCCESS;
    }

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return 2;
    }

    guard::GuardConfig config;
    try {
        if (!opts.config_path.empty()) config = guard::GuardConfig::load(opts.config_path);
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] Configuration error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    security::SecurityAwareLogger logger(config.logging);
    try {
        logger.open();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] Logging could not start: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    verify_build_flags(logger);

    int rc = EXIT_FAILURE;
    try {
        if (opts.mode == Mode::PerformanceTest) {
            logger.log(security::Level::Info, "[Startup] performance test, requests=", opts.requests);
            rc = run_performance_test(config, logger, opts.requests);
        } else {
            logger.log(security::Level::Info, "[Startup] OverflowGuard initialized, max_input_length=",
                       config.max_input_length);
            observability::PipelineTelemetry telemetry;
            guard::RequestProcessor processor(config, logger, &telemetry);
            rc = run_interactive(processor);
            logger.log(security::Level::Info, "[Shutdown] accepted=", telemetry.accepted.load(),
                       " rejected_length=", telemetry.rejected_length.load(),
                       " rejected_characters=", telemetry.rejected_characters.load());
        }
    } catch (const std::exception& e) {
        logger.log(security::Level::Error, "[Fatal] ", e.what());
        std::cerr << "[FATAL] " << e.what() << "\n";
    }

    logger.flush();
    logger.close();
    return rc;
}

#pragma once

#include "../engine/RequestProcessor.hpp"
#include "../security/CryptoHasher.hpp"
#include "../security/DiagnosticSink.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace benchmark {

    struct PerformanceReport {
        std::size_t num_requests = 0;
        std::size_t success_count = 0;
        std::size_t failure_count = 0;
        double total_seconds = 0.0;
        double requests_per_second = 0.0;

        double success_percent() const {
            return num_requests ? 100.0 * static_cast<double>(success_count) / static_cast<double>(num_requests) : 0.0;
        }

        double failure_percent() const {
            return num_requests ? 100.0 * static_cast<double>(failure_count) / static_cast<double>(num_requests) : 0.0;
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const PerformanceReport& r) {
        os << std::fixed
           << "Total time: " << std::setprecision(4) << r.total_seconds << " s\n"
           << "Requests/sec: " << std::setprecision(2) << r.requests_per_second << "\n"
           << "Succeeded: " << r.success_count << " (" << std::setprecision(1) << r.success_percent() << "%)\n"
           << "Failed: " << r.failure_count << " (" << std::setprecision(1) << r.failure_percent() << "%)\n";
        return os;
    }

    // Throughput harness for RequestProcessor::process. The workload is ~90% valid
    // strings and ~10% strings carrying "!@#" that may also overrun the length limit.
    class PerformanceTester {
        public:
            static constexpr std::string_view kAlphabet =
                "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 -_";
            static constexpr double kValidShare = 0.9;
            static constexpr std::size_t kLoggedFailures = 5;

            PerformanceTester(const guard::RequestProcessor& processor,
                              security::IDiagnosticSink& sink,
                              std::uint32_t seed = 42)
                : processor_(processor), sink_(sink), rng_(seed) {}

            std::string random_string(std::size_t length) {
                std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
                std::string out;
                out.reserve(length);
                for (std::size_t i = 0; i < length; ++i) out += kAlphabet[pick(rng_)];
                return out;
            }

            std::vector<std::string> generate_workload(std::size_t num_requests) {
                std::size_t max_len = processor_.input_filter().max_length();
                std::bernoulli_distribution valid(kValidShare);
                std::uniform_int_distribution<std::size_t> valid_len(1, max_len);
                std::uniform_int_distribution<std::size_t> invalid_len(1, max_len + 10);

                std::vector<std::string> workload;
                workload.reserve(num_requests);
                for (std::size_t i = 0; i < num_requests; ++i) {
                    if (valid(rng_)) {
                        workload.push_back(random_string(valid_len(rng_)));
                    } else {
                        workload.push_back(random_string(invalid_len(rng_)) + "!@#");
                    }
                }
                return workload;
            }

            PerformanceReport run(std::size_t num_requests = 10000) {
                sink_.record(security::Level::Info, "=== Performance test started ===");
                sink_.record(security::Level::Info, "[Benchmark] requests=" + std::to_string(num_requests));

                auto workload = generate_workload(num_requests);

                PerformanceReport report;
                report.num_requests = num_requests;

                auto start = std::chrono::steady_clock::now();
                for (const auto& input : workload) {
                    auto outcome = processor_.process(input);
                    if (guard::is_accepted(outcome)) {
                        ++report.success_count;
                        continue;
                    }
                    ++report.failure_count;
                    if (report.failure_count <= kLoggedFailures) {
                        const auto& rejected = std::get<guard::Rejected>(outcome);
                        sink_.record(security::Level::Debug,
                                     "[Benchmark Failure] fingerprint=" + security::CryptoHasher::fingerprint(input) +
                                     " kind=" + guard::to_string(rejected.reason) + " reason=" + rejected.message);
                    }
                }
                auto end = std::chrono::steady_clock::now();

                report.total_seconds = std::chrono::duration<double>(end - start).count();
                report.requests_per_second =
                    report.total_seconds > 0.0 ? static_cast<double>(num_requests) / report.total_seconds : 0.0;

                std::ostringstream summary;
                summary << std::fixed << std::setprecision(4) << report.total_seconds << "s throughput="
                        << std::setprecision(2) << report.requests_per_second << "/s succeeded="
                        << report.success_count << " (" << std::setprecision(1) << report.success_percent()
                        << "%) failed=" << report.failure_count << " (" << report.failure_percent() << "%)";
                sink_.record(security::Level::Info, "[Benchmark Results] time=" + summary.str());
                return report;
            }

        private:
            const guard::RequestProcessor& processor_;
            security::IDiagnosticSink& sink_;
            std::mt19937 rng_;
        };

} // namespace benchmark

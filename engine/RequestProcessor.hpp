#pragma once

#include "../core/GuardConfig.hpp"
#include "../core/Outcome.hpp"
#include "../filter/InputFilter.hpp"
#include "../filter/InputValidator.hpp"
#include "../observability/PipelineTelemetry.hpp"
#include "../security/CryptoHasher.hpp"
#include "../security/DiagnosticSink.hpp"

#include <string>
#include <utility>
#include <variant>

namespace guard {

    // Runs InputFilter then InputValidator, stopping at the first failure.
    // Every call emits exactly one record to the sink: INFO on acceptance, ERROR on
    // rejection. Rejected input is identified by fingerprint only.
    class RequestProcessor {
        public:
            RequestProcessor(const GuardConfig& config,
                             security::IDiagnosticSink& sink,
                             observability::PipelineTelemetry* telemetry = nullptr)
                : filter_(config.max_input_length),
                  validator_(config.allowed_pattern),
                  sink_(sink),
                  telemetry_(telemetry) {}

            Outcome process(const std::string& input) const {
                auto filtered = filter_.apply(input);
                if (auto* err = std::get_if<LengthExceeded>(&filtered)) {
                    return reject(RejectReason::LengthExceeded, err->message(), input);
                }

                auto validated = validator_.apply(std::get<std::string>(filtered));
                if (auto* err = std::get_if<InvalidCharacters>(&validated)) {
                    return reject(RejectReason::InvalidCharacters, err->message(), input);
                }

                auto& value = std::get<std::string>(validated);
                if (telemetry_) telemetry_->accepted.fetch_add(1, std::memory_order_relaxed);
                sink_.record(security::Level::Info,
                             "[Request Accepted] filter=ok validation=ok value='" + value + "'");
                return Accepted{std::move(value)};
            }

            // Empty string for rejected input. An accepted empty input looks the same;
            // use process() when the two must be told apart.
            std::string sanitize(const std::string& input) const {
                auto outcome = process(input);
                if (auto* ok = std::get_if<Accepted>(&outcome)) return std::move(ok->value);
                return {};
            }

            const filter::InputFilter& input_filter() const { return filter_; }
            const filter::InputValidator& input_validator() const { return validator_; }

        private:
            Outcome reject(RejectReason reason, std::string message, const std::string& raw) const {
                if (telemetry_) {
                    auto& counter = reason == RejectReason::LengthExceeded
                                        ? telemetry_->rejected_length
                                        : telemetry_->rejected_characters;
                    counter.fetch_add(1, std::memory_order_relaxed);
                }
                sink_.record(security::Level::Error,
                             "[Request Rejected] kind=" + to_string(reason) + " reason=" + message +
                             " fingerprint=" + security::CryptoHasher::fingerprint(raw));
                return Rejected{reason, std::move(message)};
            }

            filter::InputFilter filter_;
            filter::InputValidator validator_;
            security::IDiagnosticSink& sink_;
            observability::PipelineTelemetry* telemetry_;
        };

} // namespace guard

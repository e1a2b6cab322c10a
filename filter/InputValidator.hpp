#pragma once

#include "../core/Outcome.hpp"

#include <regex>
#include <stdexcept>
#include <string>

namespace filter {

    // Second pipeline stage: the whole string must match the allow-list pattern.
    // Matching does not modify the input. The compiled pattern is read-only after
    // construction, so one validator can serve concurrent callers.
    class InputValidator {
        public:
            explicit InputValidator(const std::string& pattern)
                : pattern_(pattern), regex_(compile(pattern)) {}

            guard::ValidationResult apply(const std::string& input) const {
                if (!std::regex_match(input, regex_)) {
                    return guard::InvalidCharacters{};
                }
                return input;
            }

            const std::string& pattern() const { return pattern_; }

        private:
            static std::regex compile(const std::string& pattern) {
                if (pattern.empty())
                    throw std::invalid_argument("InputValidator pattern must not be empty");
                try {
                    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
                } catch (const std::regex_error& e) {
                    throw std::invalid_argument("InputValidator pattern does not compile: " + std::string(e.what()));
                }
            }

            std::string pattern_;
            std::regex regex_;
        };

} // namespace filter

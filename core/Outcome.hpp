#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace guard {

    enum class RejectReason : std::uint8_t {
        LengthExceeded,
        InvalidCharacters
    };

    inline std::string to_string(RejectReason reason) {
        switch (reason) {
            case RejectReason::LengthExceeded: return "LengthExceeded";
            case RejectReason::InvalidCharacters: return "InvalidCharacters";
            default: return "Unknown";
        }
    }

    // Filter stage failure: raw input longer than the configured limit.
    struct LengthExceeded {
        std::size_t limit;
        std::size_t actual;

        std::string message() const {
            return "Input exceeds the maximum allowed length (" + std::to_string(limit) +
                   " characters, got " + std::to_string(actual) + ").";
        }
    };

    // Validator stage failure: trimmed input is not fully covered by the allow-list.
    struct InvalidCharacters {
        std::string message() const {
            return "Input contains disallowed characters.";
        }
    };

    struct Accepted {
        std::string value;
    };

    struct Rejected {
        RejectReason reason;
        std::string message;
    };

    using FilterResult = std::variant<std::string, LengthExceeded>;
    using ValidationResult = std::variant<std::string, InvalidCharacters>;
    using Outcome = std::variant<Accepted, Rejected>;

    inline bool is_accepted(const Outcome& outcome) noexcept {
        return std::holds_alternative<Accepted>(outcome);
    }

} // namespace guard

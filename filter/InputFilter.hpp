#pragma once

#include "../core/Outcome.hpp"
#include "../utils/Utf8.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace filter {

    // First pipeline stage: bounds the raw input length, then trims edge whitespace.
    // Length is measured in UTF-8 code points before trimming.
    class InputFilter {
        public:
            explicit InputFilter(std::size_t max_length) : max_length_(max_length) {
                if (max_length_ == 0)
                    throw std::invalid_argument("InputFilter::max_length must be positive");
            }

            guard::FilterResult apply(const std::string& input) const {
                std::size_t length = utils::utf8_length(input);
                if (length > max_length_) {
                    return guard::LengthExceeded{max_length_, length};
                }
                return utils::trim(input);
            }

            std::size_t max_length() const { return max_length_; }

        private:
            std::size_t max_length_;
        };

} // namespace filter

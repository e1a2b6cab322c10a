#pragma once

#include <atomic>
#include <cstdint>

namespace observability {

    struct PipelineTelemetry {
        std::atomic<std::uint64_t> accepted{0};
        std::atomic<std::uint64_t> rejected_length{0};
        std::atomic<std::uint64_t> rejected_characters{0};

        std::uint64_t rejected() const {
            return rejected_length.load() + rejected_characters.load();
        }

        std::uint64_t total() const {
            return accepted.load() + rejected();
        }
    };

}  // namespace observability

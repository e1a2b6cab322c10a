#include <cstddef>
#include <cstdint>
#include <string>
#include "../engine/RequestProcessor.hpp"
#include "../utils/Utf8.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static security::NullSink sink;
    static const guard::GuardConfig config{};
    static const guard::RequestProcessor processor(config, sink);

    std::string input(reinterpret_cast<const char*>(data), size);
    auto outcome = processor.process(input);

    if (auto* ok = std::get_if<guard::Accepted>(&outcome)) {
        const auto& v = ok->value;
        if (utils::utf8_length(v) > config.max_input_length) __builtin_trap();
        if (!v.empty() && (utils::is_ascii_space(v.front()) || utils::is_ascii_space(v.back()))) __builtin_trap();
        if (processor.sanitize(v) != v) __builtin_trap();
    }
    return 0;
}

#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>

namespace text_processing {

// Core data contracts for the emoji stripping pipeline.
// Stages exchange these types so each one can be tested on its own.

// A run of scalar values recognised as one emoji unit.
// Produced by the classifier while scanning, consumed immediately by the stripper.
struct CodepointSpan {
    std::size_t start = 0;                    // Offset in scalar values
    std::size_t length = 0;                   // Length in scalar values
    std::size_t byte_offset = 0;              // Offset of the first byte in the UTF-8 source
    std::size_t byte_length = 0;              // Encoded length of the whole span
};

// Output of a strip pass. Immutable once produced.
struct StripResult {
    std::string text;                         // Cleaned text
    std::size_t removed_spans = 0;            // Number of emoji units removed
    std::size_t removed_chars = 0;            // Scalar values removed across all spans
    std::size_t removed_bytes = 0;            // UTF-8 bytes removed across all spans
    std::size_t original_bytes = 0;           // Size of the input buffer

    [[nodiscard]] bool changed() const noexcept { return removed_spans != 0; }
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                               // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};    // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace text_processing

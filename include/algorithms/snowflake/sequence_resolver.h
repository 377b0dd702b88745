#pragma once

#include <cstdint>

namespace flakeid::algorithms {

// Hands out per-millisecond sequence numbers shared by every generator using the same
// backend. Values above kMaxSequence tell the caller the millisecond is saturated.
class SequenceResolver {
public:
    virtual ~SequenceResolver() = default;

    virtual bool IsAvailable() = 0;

    // May throw std::runtime_error when the backend fails mid-call.
    virtual std::int64_t Sequence(std::int64_t current_time_ms) = 0;
};

}  // namespace flakeid::algorithms

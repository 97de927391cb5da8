// ==============================================================================
// Layer 1: DSP Primitive - ChunkReplaySlot
// ==============================================================================
// Single-slot holder for the most recent audio chunk. A consumer that asks for
// a chunk when none has arrived since its last read gets the previous one
// again, so analysis never blocks on capture.
// ==============================================================================

#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

class ChunkReplaySlot {
public:
    /// Store a copy of chunk, replacing whatever was held.
    void store(std::span<const float> chunk) {
        slot_.assign(chunk.begin(), chunk.end());
        hasChunk_ = true;
        fresh_ = true;
    }

    /// @brief Newest chunk, or the previous one again when nothing new arrived.
    /// @return Empty span before the first store()
    [[nodiscard]] std::span<const float> take() noexcept {
        if (!hasChunk_) return {};
        if (!fresh_) ++replayCount_;
        fresh_ = false;
        return slot_;
    }

    void clear() noexcept {
        slot_.clear();
        hasChunk_ = false;
        fresh_ = false;
        replayCount_ = 0;
    }

    [[nodiscard]] bool hasChunk() const noexcept { return hasChunk_; }

    /// True when the held chunk has not been taken yet.
    [[nodiscard]] bool isFresh() const noexcept { return fresh_; }

    /// Number of take() calls that returned an already consumed chunk.
    [[nodiscard]] size_t replayCount() const noexcept { return replayCount_; }

private:
    std::vector<float> slot_;
    bool hasChunk_ = false;
    bool fresh_ = false;
    size_t replayCount_ = 0;
};

} // namespace DSP
} // namespace Lumina

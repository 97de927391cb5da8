// ==============================================================================
// Layer 1: DSP Primitive - OverlapWindow
// ==============================================================================
// Keeps the last K chunks of a stream and exposes them as one contiguous
// analysis window, oldest sample first. With K = overlap + 1, consecutive
// windows share `overlap` chunks.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <span>
#include <utility>
#include <vector>

namespace Lumina {
namespace DSP {

class OverlapWindow {
public:
    /// Maximum number of chunks held (overlap of 20 plus the newest chunk)
    static constexpr size_t kMaxChunks = 21;

    /// @param numChunks Chunks per window, clamped to [1, kMaxChunks]
    void prepare(size_t numChunks) {
        capacity_ = std::clamp(numChunks, size_t{1}, kMaxChunks);
        while (chunks_.size() > capacity_) chunks_.pop_front();
        rebuild();
    }

    /// Append a chunk, evicting the oldest once the window holds capacity().
    void push(std::span<const float> chunk) {
        if (chunks_.size() == capacity_) {
            // Recycle the evicted chunk's storage
            std::vector<float> recycled = std::move(chunks_.front());
            chunks_.pop_front();
            recycled.assign(chunk.begin(), chunk.end());
            chunks_.push_back(std::move(recycled));
        } else {
            chunks_.emplace_back(chunk.begin(), chunk.end());
        }
        rebuild();
    }

    void reset() {
        chunks_.clear();
        window_.clear();
    }

    /// Concatenation of the held chunks, oldest first.
    [[nodiscard]] std::span<const float> window() const noexcept { return window_; }

    [[nodiscard]] size_t chunkCount() const noexcept { return chunks_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool isFull() const noexcept { return chunks_.size() == capacity_; }

private:
    void rebuild() {
        window_.clear();
        for (const auto& c : chunks_) window_.insert(window_.end(), c.begin(), c.end());
    }

    size_t capacity_ = 1;
    std::deque<std::vector<float>> chunks_;
    std::vector<float> window_;
};

} // namespace DSP
} // namespace Lumina

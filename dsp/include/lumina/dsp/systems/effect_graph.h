// ==============================================================================
// Layer 4: System - EffectGraph
// ==============================================================================
// Owns a set of effect nodes and the connections between them, and runs one
// frame at a time: every node is updated and processed in topological order
// (Kahn), so each node sees this frame's upstream outputs.
//
// Structural errors (bad ids, port-kind mismatch, cycles) are reported to
// the caller as a GraphStatus; the graph is left unchanged.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/frame_context.h>
#include <lumina/dsp/effects/effect_node.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

using NodeId = size_t;

enum class GraphStatus : uint8_t {
    Ok = 0,
    UnknownNode,            ///< Node id not in the graph
    ChannelOutOfRange,      ///< Input or output channel index too large
    PortKindMismatch,       ///< Audio routed to a pixel port or vice versa
    CycleDetected           ///< Connection would make the graph cyclic
};

/// @brief Frame runner over a DAG of effect nodes.
///
/// @example
/// @code
/// EffectGraph graph;
/// const NodeId light = graph.addNode(std::make_unique<MovingLight>());
/// (void)graph.connectAudio(light, 0);
/// graph.prepare(ctx);
/// if (graph.tick(1.0 / 60.0, chunk) == GraphStatus::Ok) {
///     if (const auto& px = graph.output(light, 0)) send(px->toBytes());
/// }
/// @endcode
class EffectGraph {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// Add a node; it is prepared with the current context.
    NodeId addNode(std::unique_ptr<EffectNode> node) {
        Entry entry;
        entry.node = std::move(node);
        entry.inputs.resize(entry.node->numInputChannels());
        entry.outputs.resize(entry.node->numOutputChannels());
        entry.node->prepare(context_);
        entries_.push_back(std::move(entry));
        orderDirty_ = true;
        return entries_.size() - 1;
    }

    /// @brief Route output outChannel of from into input inChannel of to,
    ///        replacing any previous source of that input.
    [[nodiscard]] GraphStatus connect(NodeId from, size_t outChannel, NodeId to, size_t inChannel) {
        if (from >= entries_.size() || to >= entries_.size()) return GraphStatus::UnknownNode;
        if (outChannel >= entries_[from].outputs.size()) return GraphStatus::ChannelOutOfRange;
        const auto status = checkInput(to, inChannel, PortKind::Pixels);
        if (status != GraphStatus::Ok) return status;

        auto& slot = entries_[to].inputs[inChannel];
        const auto previous = slot;
        slot = Source{false, from, outChannel};
        if (!computeOrder()) {
            slot = previous;
            (void)computeOrder();
            return GraphStatus::CycleDetected;
        }
        return GraphStatus::Ok;
    }

    /// Route the frame's audio chunk into input inChannel of to.
    [[nodiscard]] GraphStatus connectAudio(NodeId to, size_t inChannel) {
        if (to >= entries_.size()) return GraphStatus::UnknownNode;
        const auto status = checkInput(to, inChannel, PortKind::Audio);
        if (status != GraphStatus::Ok) return status;
        entries_[to].inputs[inChannel] = Source{true, 0, 0};
        return GraphStatus::Ok;
    }

    /// Remove the source of an input.
    void disconnect(NodeId to, size_t inChannel) {
        if (to >= entries_.size() || inChannel >= entries_[to].inputs.size()) return;
        entries_[to].inputs[inChannel].reset();
        orderDirty_ = true;
    }

    // =========================================================================
    // Frame processing
    // =========================================================================

    /// Propagate a new context to every node.
    void prepare(const FrameContext& context) {
        context_ = context;
        for (auto& e : entries_) e.node->prepare(context_);
    }

    /// @brief Update and process every node once.
    /// @param dt    Seconds since the previous tick
    /// @param audio Newest capture chunk, nullopt when none is available
    [[nodiscard]] GraphStatus tick(double dt, std::optional<std::span<const float>> audio = std::nullopt) {
        if (orderDirty_ && !computeOrder()) return GraphStatus::CycleDetected;

        for (const NodeId id : order_) {
            auto& e = entries_[id];
            e.node->update(dt);

            e.slots.resize(e.inputs.size());
            for (size_t i = 0; i < e.inputs.size(); ++i) {
                const auto& src = e.inputs[i];
                if (!src) {
                    e.slots[i] = InputSlot::absent();
                } else if (src->isAudio) {
                    e.slots[i] = audio ? InputSlot::audio(*audio) : InputSlot::absent();
                } else {
                    const auto& upstream = entries_[src->node].outputs[src->channel];
                    e.slots[i] = upstream ? InputSlot::pixels(*upstream) : InputSlot::absent();
                }
            }
            e.node->process(e.slots, e.outputs);
        }
        return GraphStatus::Ok;
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// Output of the last tick; nullopt for "no data" or invalid ids.
    [[nodiscard]] const std::optional<PixelBuffer>& output(NodeId node, size_t channel) const noexcept {
        if (node >= entries_.size() || channel >= entries_[node].outputs.size()) return kNoOutput;
        return entries_[node].outputs[channel];
    }

    [[nodiscard]] EffectNode& node(NodeId id) noexcept { return *entries_[id].node; }
    [[nodiscard]] const EffectNode& node(NodeId id) const noexcept { return *entries_[id].node; }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    /// Processing order of the last successful ordering pass.
    [[nodiscard]] std::span<const NodeId> order() const noexcept { return order_; }

    [[nodiscard]] const FrameContext& context() const noexcept { return context_; }

private:
    struct Source {
        bool isAudio = false;
        NodeId node = 0;
        size_t channel = 0;
    };

    struct Entry {
        std::unique_ptr<EffectNode> node;
        std::vector<std::optional<Source>> inputs;
        FrameOutputs outputs;
        std::vector<InputSlot> slots;
    };

    [[nodiscard]] GraphStatus checkInput(NodeId to, size_t inChannel, PortKind kind) const noexcept {
        const auto ports = entries_[to].node->inputPorts();
        if (inChannel >= ports.size()) return GraphStatus::ChannelOutOfRange;
        if (ports[inChannel].kind != kind) return GraphStatus::PortKindMismatch;
        return GraphStatus::Ok;
    }

    /// Kahn's algorithm. @return false if the graph has a cycle
    bool computeOrder() {
        const size_t n = entries_.size();
        std::vector<size_t> inDegree(n, 0);
        std::vector<std::vector<NodeId>> downstream(n);
        for (NodeId to = 0; to < n; ++to) {
            for (const auto& src : entries_[to].inputs) {
                if (src && !src->isAudio) {
                    downstream[src->node].push_back(to);
                    ++inDegree[to];
                }
            }
        }

        std::vector<NodeId> ready;
        for (NodeId id = n; id-- > 0;) {
            if (inDegree[id] == 0) ready.push_back(id);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready.empty()) {
            const NodeId id = ready.back();
            ready.pop_back();
            order.push_back(id);
            for (const NodeId next : downstream[id]) {
                if (--inDegree[next] == 0) ready.push_back(next);
            }
        }

        if (order.size() != n) return false;
        order_ = std::move(order);
        orderDirty_ = false;
        return true;
    }

    static inline const std::optional<PixelBuffer> kNoOutput{};

    std::vector<Entry> entries_;
    std::vector<NodeId> order_;
    FrameContext context_;
    bool orderDirty_ = false;
};

} // namespace DSP
} // namespace Lumina

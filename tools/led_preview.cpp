// ==============================================================================
// LED Preview
// ==============================================================================
// Renders one effect against a synthetic audio stream and prints every frame
// as a row of ANSI true-colour blocks, so effects can be checked without LED
// hardware.
//
// Usage:
//   led_preview <effect> [pixels] [frames] [param=value ...]
//
// Example:
//   led_preview MovingLight 60 120 speed=150 dim_time=1.0
// ==============================================================================

#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/effects/bonfire.h>
#include <lumina/dsp/effects/falling_stars.h>
#include <lumina/dsp/effects/generate_waves.h>
#include <lumina/dsp/effects/keyboard_envelope.h>
#include <lumina/dsp/effects/moving_light.h>
#include <lumina/dsp/effects/oscilloscope.h>
#include <lumina/dsp/effects/pulse_effects.h>
#include <lumina/dsp/effects/sorting.h>
#include <lumina/dsp/effects/spectrum.h>
#include <lumina/dsp/effects/vu_meter.h>
#include <lumina/dsp/systems/effect_graph.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace Lumina::DSP;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr double kFrameRate = 60.0;
constexpr size_t kChunkSize = 735;   // kSampleRate / kFrameRate

struct EffectEntry {
    const char* name;
    std::function<std::unique_ptr<EffectNode>()> create;
};

const std::vector<EffectEntry>& effectTable() {
    static const std::vector<EffectEntry> table{
        {"MovingLight", [] { return std::make_unique<MovingLight>(); }},
        {"FallingStars", [] { return std::make_unique<FallingStars>(); }},
        {"IntervalStars", [] { return std::make_unique<IntervalStars>(); }},
        {"Spectrum", [] { return std::make_unique<Spectrum>(); }},
        {"VuMeterRms", [] { return std::make_unique<VuMeterRms>(); }},
        {"VuMeterPeak", [] { return std::make_unique<VuMeterPeak>(); }},
        {"Bonfire", [] { return std::make_unique<Bonfire>(); }},
        {"KeyboardEnvelope", [] { return std::make_unique<KeyboardEnvelope>(); }},
        {"Sorting", [] { return std::make_unique<Sorting>(); }},
        {"Breathing", [] { return std::make_unique<Breathing>(); }},
        {"Heartbeat", [] { return std::make_unique<Heartbeat>(); }},
        {"GenerateWaves", [] { return std::make_unique<GenerateWaves>(); }},
        {"Oscilloscope", [] { return std::make_unique<Oscilloscope>(); }},
    };
    return table;
}

const char* statusName(ParamStatus status) {
    switch (status) {
        case ParamStatus::Ok:               return "ok";
        case ParamStatus::UnknownParameter: return "unknown parameter";
        case ParamStatus::OutOfRange:       return "out of range (clamped)";
        case ParamStatus::InvalidChoice:    return "invalid choice";
        case ParamStatus::TypeMismatch:     return "type mismatch";
    }
    return "?";
}

void printUsage() {
    std::cerr << "Usage: led_preview <effect> [pixels] [frames] [param=value ...]\n"
              << "Effects:";
    for (const auto& e : effectTable()) std::cerr << ' ' << e.name;
    std::cerr << std::endl;
}

bool parseSize(std::string_view text, size_t& out) {
    const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size() && out > 0;
}

/// Apply "name=value": numbers, then true/false, then choice strings.
ParamStatus applyAssignment(EffectNode& node, std::string_view assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string_view::npos) return ParamStatus::TypeMismatch;
    const std::string_view name = assignment.substr(0, eq);
    const std::string value(assignment.substr(eq + 1));

    char* end = nullptr;
    const double number = std::strtod(value.c_str(), &end);
    if (!value.empty() && end == value.c_str() + value.size()) {
        return node.setParameter(name, number);
    }
    if (value == "true" || value == "false") {
        return node.setParameter(name, value == "true");
    }
    return node.setParameter(name, std::string_view(value));
}

/// Kick on every beat (120 bpm) over a slow melody line.
void synthesizeChunk(size_t frame, std::vector<float>& chunk) {
    chunk.resize(kChunkSize);
    for (size_t i = 0; i < kChunkSize; ++i) {
        const double t = static_cast<double>(frame * kChunkSize + i) / kSampleRate;
        const double beatPhase = std::fmod(t, 0.5);
        const double kick = std::exp(-beatPhase * 12.0) * std::sin(2.0 * kPiD * 70.0 * t);
        const double melodyHz = 440.0 * std::pow(2.0, std::floor(std::fmod(t, 4.0)) / 12.0);
        const double melody = 0.3 * std::sin(2.0 * kPiD * melodyHz * t);
        chunk[i] = static_cast<float>(0.7 * kick + melody);
    }
}

void printFrame(const PixelBuffer& pixels) {
    const auto bytes = pixels.toBytes();
    const size_t n = pixels.numPixels();
    std::string line;
    line.reserve(n * 24);
    for (size_t i = 0; i < n; ++i) {
        line += "\x1b[48;2;";
        line += std::to_string(bytes[i]) + ';';
        line += std::to_string(bytes[n + i]) + ';';
        line += std::to_string(bytes[2 * n + i]) + "m ";
    }
    line += "\x1b[0m";
    std::cout << line << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string_view effectName = argv[1];
    std::unique_ptr<EffectNode> effect;
    for (const auto& e : effectTable()) {
        if (effectName == e.name) effect = e.create();
    }
    if (!effect) {
        std::cerr << "Unknown effect: " << effectName << std::endl;
        printUsage();
        return 1;
    }

    size_t numPixels = 60;
    size_t numFrames = 120;
    if (argc > 2 && !parseSize(argv[2], numPixels)) {
        std::cerr << "Invalid pixel count: " << argv[2] << std::endl;
        return 1;
    }
    if (argc > 3 && !parseSize(argv[3], numFrames)) {
        std::cerr << "Invalid frame count: " << argv[3] << std::endl;
        return 1;
    }

    for (int arg = 4; arg < argc; ++arg) {
        const auto status = applyAssignment(*effect, argv[arg]);
        if (status != ParamStatus::Ok) {
            std::cerr << argv[arg] << ": " << statusName(status) << std::endl;
            if (!isApplied(status)) return 1;
        }
    }

    // Held notes give KeyboardEnvelope something to show
    if (auto* keys = dynamic_cast<KeyboardEnvelope*>(effect.get())) {
        keys->noteOn(36, 110);
        keys->noteOn(60, 90);
        keys->noteOn(96, 70);
    }

    EffectGraph graph;
    const NodeId node = graph.addNode(std::move(effect));
    const auto ports = graph.node(node).inputPorts();
    for (size_t p = 0; p < ports.size(); ++p) {
        if (ports[p].kind == PortKind::Audio && graph.connectAudio(node, p) != GraphStatus::Ok) {
            std::cerr << "Failed to route audio into port " << ports[p].name << std::endl;
            return 1;
        }
    }
    graph.prepare(FrameContext{kSampleRate, numPixels});

    std::vector<float> chunk;
    for (size_t frame = 0; frame < numFrames; ++frame) {
        synthesizeChunk(frame, chunk);
        if (graph.tick(1.0 / kFrameRate, std::span<const float>(chunk)) != GraphStatus::Ok) {
            std::cerr << "Graph tick failed at frame " << frame << std::endl;
            return 1;
        }
        if (const auto& out = graph.output(node, 0)) {
            printFrame(*out);
        } else {
            std::cout << "(no data)\n";
        }
    }
    std::cout.flush();
    return 0;
}

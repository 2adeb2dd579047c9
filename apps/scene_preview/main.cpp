/**
 * @file main.cpp
 * @brief scene_preview: play one scene through the sync bridge
 *
 * Loads a video with the FFmpeg element, waits for the bridge to become
 * ready (or fail, or time out), optionally seeks, then plays at 30 fps
 * ticks for the requested time and prints the bridge state.
 */

#include <scenebridge/core/config.hpp>
#include <scenebridge/core/event_loop.hpp>
#include <scenebridge/core/logger.hpp>
#include <scenebridge/engine/aspect_ratio.hpp>
#include <scenebridge/engine/scene_playhead.hpp>
#include <scenebridge/engine/software_engine.hpp>
#include <scenebridge/engine/sync_bridge.hpp>
#include <scenebridge/media/ffmpeg_media_element.hpp>

#include "preview_options.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace scenebridge;

namespace {

constexpr double kFrameRate = 30.0;

void printState(const char* label, const engine::SyncBridge& bridge) {
    auto state = bridge.getState();
    std::cout << std::left << std::setw(10) << label
              << " ready=" << (state.isReady ? "yes" : "no")
              << " duration=" << std::fixed << std::setprecision(3) << state.duration
              << " time=" << state.currentTime
              << " playing=" << (bridge.isPlaying() ? "yes" : "no")
              << " source=" << engine::sourceNodeStateToString(bridge.sourceState())
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = preview::parsePreviewOptions(argc, argv);
    if (!parsed) {
        preview::printUsage(std::cout, argv[0]);
        return 1;
    }
    const preview::PreviewOptions& options = *parsed;

    BridgeConfig config;
    if (!options.configPath.empty()) {
        auto loaded = loadConfigFile(options.configPath);
        if (!loaded) {
            std::cerr << "Config error: " << loaded.error().what() << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    initLogging("scene_preview", parseLogLevel(config.logLevel), config.logFile);

    double aspectHint = 0.0;
    if (!options.aspect.empty()) {
        auto ratio = engine::parseAspectRatio(options.aspect);
        if (!ratio) {
            std::cerr << "Invalid aspect ratio: " << options.aspect << std::endl;
            return 1;
        }
        aspectHint = *ratio;
    }

    EventLoop loop;
    engine::SoftwareEngine renderer(media::FfmpegMediaElement::factory(loop),
                                    {config.driftTolerance, config.fitMode});
    engine::RenderSurface surface;
    engine::SyncBridge bridge(renderer, config);
    bridge.attachSurface(&surface);

    bool ready = false;
    std::optional<Error> failure;
    bridge.setCallbacks({
        [&]() { ready = true; },
        [&](const Error& e) { failure = e; },
        [](Seconds d) { std::cout << "Duration: " << d << "s" << std::endl; },
        {},
    });

    std::unique_ptr<media::FfmpegMediaElement> narration;
    if (!options.narrationPath.empty()) {
        narration = std::make_unique<media::FfmpegMediaElement>(loop);
        narration->load(options.narrationPath);
    }

    bridge.initialize(options.mediaPath, MediaKind::Video, aspectHint);

    // The bridge has no load timeout of its own
    auto deadline = Clock::now() + Milliseconds(options.timeoutMs);
    while (!ready && !failure && Clock::now() < deadline) {
        loop.waitFor(Milliseconds(10));
        loop.runPending();
        bridge.tick(0.0);
    }

    if (failure) {
        std::cerr << "Failed: " << failure->what()
                  << " (" << errorCodeToString(failure->code()) << ")" << std::endl;
        return 2;
    }
    if (!ready) {
        std::cerr << "Timed out after " << options.timeoutMs << " ms" << std::endl;
        printState("timeout", bridge);
        return 3;
    }

    std::cout << "Surface: " << surface.width() << "x" << surface.height() << std::endl;
    printState("ready", bridge);

    engine::ScenePlayhead playhead(&bridge, MediaKind::Video, config.driftTolerance);
    playhead.setNarration(narration.get());

    if (options.seekTo) {
        playhead.seekTo(*options.seekTo);
        printState("seek", bridge);
    }

    playhead.play();

    const auto frameInterval = std::chrono::duration<double>(1.0 / kFrameRate);
    const int totalFrames = static_cast<int>(options.playSeconds * kFrameRate);
    for (int frame = 0; frame < totalFrames && playhead.isPlaying() && !failure; ++frame) {
        loop.runPending();
        playhead.tick(1.0 / kFrameRate);
        if ((frame + 1) % static_cast<int>(kFrameRate) == 0) {
            printState("playing", bridge);
        }
        std::this_thread::sleep_for(frameInterval);
    }

    playhead.pause();
    printState("final", bridge);
    std::cout << "Frames presented: " << surface.frameCount() << std::endl;

    bridge.release();
    return failure ? 2 : 0;
}

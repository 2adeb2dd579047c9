#include <gtest/gtest.h>
#include <scenebridge/engine/scene_playhead.hpp>
#include "fakes/fake_engine.hpp"

#include <vector>

using namespace scenebridge;
using namespace scenebridge::engine;
using namespace scenebridge::fakes;

namespace {

struct VideoScene {
    FakeEngine renderer;
    RenderSurface surface;
    SyncBridge bridge{renderer};
    ScenePlayhead playhead{&bridge, MediaKind::Video};
    FakeVideoNode* node = nullptr;

    void load(Seconds duration) {
        bridge.attachSurface(&surface);
        bridge.initialize("scene.mp4", MediaKind::Video, 9.0 / 16.0);
        node = renderer.lastNode();
        node->fireLoaded(duration);
    }
};

} // anonymous namespace

// ============================================================================
// Image scenes
// ============================================================================

TEST(ScenePlayheadTest, ImageAdvancesOwnClock) {
    ScenePlayhead playhead(nullptr, MediaKind::Image);
    EXPECT_DOUBLE_EQ(playhead.trim().end(), 30.0);

    std::vector<Seconds> seen;
    ScopedConnection c = playhead.timeChanged.connect([&](Seconds t) { seen.push_back(t); });

    ASSERT_TRUE(playhead.play());
    playhead.tick(1.0);
    playhead.tick(1.0);

    EXPECT_DOUBLE_EQ(playhead.currentTime(), 2.0);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_DOUBLE_EQ(seen[0], 1.0);
}

TEST(ScenePlayheadTest, StopsAtTrimEndAndRestartsFromStart) {
    ScenePlayhead playhead(nullptr, MediaKind::Image);
    playhead.trim().setEnd(2.0);

    int ended = 0;
    ScopedConnection c = playhead.reachedEnd.connect([&]() { ++ended; });

    ASSERT_TRUE(playhead.play());
    playhead.tick(1.5);
    playhead.tick(1.5);

    EXPECT_EQ(ended, 1);
    EXPECT_FALSE(playhead.isPlaying());
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 2.0);
    EXPECT_TRUE(playhead.resetPending());

    playhead.tick(1.0);
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 2.0);

    ASSERT_TRUE(playhead.play());
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 0.0);
    EXPECT_FALSE(playhead.resetPending());
}

TEST(ScenePlayheadTest, TrimHandles) {
    ScenePlayhead playhead(nullptr, MediaKind::Image);
    ASSERT_TRUE(playhead.play());
    playhead.tick(3.0);

    playhead.dragStartHandle(4.0);
    EXPECT_FALSE(playhead.isPlaying());
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 4.0);

    playhead.dragEndHandle(10.0);
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 10.0);
    EXPECT_DOUBLE_EQ(playhead.trim().end(), 10.0);

    playhead.endDrag();
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 4.0);
    EXPECT_TRUE(playhead.resetPending());

    ASSERT_TRUE(playhead.play());
    EXPECT_DOUBLE_EQ(playhead.currentTime(), 4.0);
    EXPECT_FALSE(playhead.resetPending());
}

TEST(ScenePlayheadTest, NarrationFollowsScene) {
    ScenePlayhead playhead(nullptr, MediaKind::Image);
    FakeMediaElement narration;
    narration.load("voice.mp3");
    narration.finishLoad(30.0);
    playhead.setNarration(&narration);

    ASSERT_TRUE(playhead.play());
    EXPECT_EQ(narration.playCount, 1);
    ASSERT_FALSE(narration.seeks.empty());
    EXPECT_DOUBLE_EQ(narration.seeks.back(), 0.0);

    // Narration clock stood still: more than the tolerance behind
    playhead.tick(1.0);
    EXPECT_DOUBLE_EQ(narration.currentTime(), 1.0);

    // Within tolerance: left alone
    size_t seeks = narration.seeks.size();
    narration.setPosition(1.95);
    playhead.tick(1.0);
    EXPECT_EQ(narration.seeks.size(), seeks);

    playhead.pause();
    EXPECT_EQ(narration.pauseCount, 1);
    EXPECT_TRUE(narration.paused());
}

// ============================================================================
// Video scenes
// ============================================================================

TEST(ScenePlayheadTest, VideoWaitsForBridge) {
    VideoScene scene;
    scene.bridge.attachSurface(&scene.surface);
    scene.bridge.initialize("scene.mp4", MediaKind::Video);

    EXPECT_FALSE(scene.playhead.play());
    EXPECT_FALSE(scene.playhead.isPlaying());
    EXPECT_FALSE(scene.bridge.isPlaying());
}

TEST(ScenePlayheadTest, VideoReadsPositionFromBridge) {
    VideoScene scene;
    scene.load(10.0);

    ASSERT_TRUE(scene.playhead.play());
    EXPECT_TRUE(scene.bridge.isPlaying());
    EXPECT_DOUBLE_EQ(scene.playhead.trim().end(), 10.0);

    scene.node->media.emitTime(3.0);
    scene.playhead.tick(1.0 / 30.0);
    EXPECT_DOUBLE_EQ(scene.playhead.currentTime(), 3.0);
}

TEST(ScenePlayheadTest, VideoStopsAtTrimEnd) {
    VideoScene scene;
    scene.load(10.0);
    scene.playhead.trim().setDuration(10.0);
    scene.playhead.trim().setEnd(5.0);

    int ended = 0;
    ScopedConnection c = scene.playhead.reachedEnd.connect([&]() { ++ended; });

    ASSERT_TRUE(scene.playhead.play());
    scene.node->media.emitTime(5.2);
    scene.playhead.tick(1.0 / 30.0);

    EXPECT_EQ(ended, 1);
    EXPECT_FALSE(scene.playhead.isPlaying());
    EXPECT_FALSE(scene.bridge.isPlaying());
    EXPECT_DOUBLE_EQ(scene.playhead.currentTime(), 5.0);

    ASSERT_TRUE(scene.playhead.play());
    EXPECT_DOUBLE_EQ(scene.playhead.currentTime(), 0.0);
    EXPECT_DOUBLE_EQ(scene.bridge.getState().currentTime, 0.0);
}

TEST(ScenePlayheadTest, SeekGoesThroughBridgeClamp) {
    VideoScene scene;
    scene.load(8.0);

    scene.playhead.seekTo(20.0);
    EXPECT_DOUBLE_EQ(scene.bridge.getState().currentTime, 8.0);
    EXPECT_DOUBLE_EQ(scene.playhead.currentTime(), 8.0);
}

TEST(ScenePlayheadTest, StopsWhenBridgeLosesReadiness) {
    VideoScene scene;
    scene.load(10.0);
    ASSERT_TRUE(scene.playhead.play());

    scene.bridge.initialize("next.mp4", MediaKind::Video);
    scene.playhead.tick(1.0 / 30.0);
    EXPECT_FALSE(scene.playhead.isPlaying());
}

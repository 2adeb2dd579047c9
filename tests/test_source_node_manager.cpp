#include <gtest/gtest.h>
#include <scenebridge/engine/source_node_manager.hpp>
#include "fakes/fake_engine.hpp"

#include <limits>
#include <string>

using namespace scenebridge;
using namespace scenebridge::engine;
using namespace scenebridge::fakes;

namespace {

struct ManagerHarness {
    FakeEngine renderer;
    RenderSurface surface{16, 16};
    std::unique_ptr<RenderingContext> context = renderer.createContext(surface);
    SourceNodeManager manager{120.0};
};

} // anonymous namespace

TEST(SourceNodeManagerTest, CreatesConnectsAndSequencesNode) {
    ManagerHarness h;
    auto created = h.manager.createNode(h.context.get(), "clip.mp4");
    ASSERT_TRUE(created.ok());

    FakeVideoNode* node = h.renderer.lastNode();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Pending);
    EXPECT_EQ(h.manager.url(), "clip.mp4");
    EXPECT_EQ(node->connectCount, 1);
    EXPECT_DOUBLE_EQ(node->startTime, 0.0);
    EXPECT_DOUBLE_EQ(node->stopTime, 120.0);
    EXPECT_EQ(h.manager.element(), &node->media);
}

TEST(SourceNodeManagerTest, SecondCreateIsRejected) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "a.mp4").ok());

    auto again = h.manager.createNode(h.context.get(), "b.mp4");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code(), ErrorCode::NodeCreationFailed);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Pending);
    EXPECT_EQ(h.renderer.lastRecord()->nodes.size(), 1u);
}

TEST(SourceNodeManagerTest, CreationFailures) {
    {
        SourceNodeManager manager;
        auto r = manager.createNode(nullptr, "a.mp4");
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error().code(), ErrorCode::NodeCreationFailed);
        EXPECT_EQ(manager.state(), SourceNodeState::Failed);
    }
    {
        ManagerHarness h;
        h.renderer.behavior.throwOnCreateNode = true;
        auto r = h.manager.createNode(h.context.get(), "a.mp4");
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error().code(), ErrorCode::NodeCreationFailed);
        EXPECT_EQ(h.manager.state(), SourceNodeState::Failed);
    }
    {
        ManagerHarness h;
        h.renderer.behavior.returnNullNode = true;
        auto r = h.manager.createNode(h.context.get(), "a.mp4");
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(h.manager.node(), nullptr);
    }
}

TEST(SourceNodeManagerTest, RefusedConnectionDestroysHalfBuiltNode) {
    ManagerHarness h;
    h.renderer.behavior.refuseConnect = true;

    auto r = h.manager.createNode(h.context.get(), "a.mp4");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code(), ErrorCode::NodeCreationFailed);

    FakeVideoNode* node = h.renderer.lastNode();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->destroyCount, 1);
    EXPECT_EQ(h.manager.node(), nullptr);
}

TEST(SourceNodeManagerTest, LoadedWithUsableDuration) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "a.mp4").ok());
    h.renderer.lastNode()->media.setMetadata(12.5);

    auto loaded = h.manager.onLoaded();
    ASSERT_TRUE(loaded.ok());
    EXPECT_DOUBLE_EQ(loaded.value(), 12.5);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Ready);
    EXPECT_DOUBLE_EQ(h.manager.duration(), 12.5);
}

TEST(SourceNodeManagerTest, UnusableDurationIsInvalidUntilALaterLoad) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "live.m3u8").ok());
    FakeVideoNode* node = h.renderer.lastNode();

    node->media.setMetadata(std::numeric_limits<double>::infinity());
    auto first = h.manager.onLoaded();
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.error().code(), ErrorCode::InvalidDuration);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Invalid);

    node->media.setMetadata(8.0);
    auto second = h.manager.onLoaded();
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(h.manager.state(), SourceNodeState::Ready);
}

TEST(SourceNodeManagerTest, LoadedBeforeCreateIsRejected) {
    SourceNodeManager manager;
    auto r = manager.onLoaded();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidArgument);
}

TEST(SourceNodeManagerTest, ErrorBecomesMediaDecodeError) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "broken.mp4").ok());

    Error e = h.manager.onError(Error(ErrorCode::DecoderError, "no decoder for stream"));
    EXPECT_EQ(e.code(), ErrorCode::MediaDecodeError);
    EXPECT_NE(std::string(e.what()).find("broken.mp4"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("no decoder for stream"), std::string::npos);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Failed);

    EXPECT_FALSE(h.manager.onLoaded().ok());
    EXPECT_EQ(h.manager.state(), SourceNodeState::Failed);
}

TEST(SourceNodeManagerTest, WatchForwardsNodeAndElementEvents) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "a.mp4").ok());
    FakeVideoNode* node = h.renderer.lastNode();

    int loaded = 0;
    int failed = 0;
    int ended = 0;
    Seconds lastTime = -1.0;
    h.manager.watch({
        [&]() { ++loaded; },
        [&](const Error&) { ++failed; },
        [&](Seconds t) { lastTime = t; },
        [&]() { ++ended; },
    });

    node->fireLoaded(4.0);
    node->media.emitTime(1.5);
    node->media.emitEnded();
    node->fireError("late");

    EXPECT_EQ(loaded, 1);
    EXPECT_EQ(failed, 1);
    EXPECT_EQ(ended, 1);
    EXPECT_DOUBLE_EQ(lastTime, 1.5);
}

TEST(SourceNodeManagerTest, DisposeIsIdempotentAndSilencesHandlers) {
    ManagerHarness h;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "a.mp4").ok());
    FakeVideoNode* node = h.renderer.lastNode();
    node->throwOnDestroy = true;

    int loaded = 0;
    h.manager.watch({[&]() { ++loaded; }, {}, {}, {}});

    h.manager.dispose();
    h.manager.dispose();

    node->fireLoaded(3.0);
    EXPECT_EQ(loaded, 0);
    EXPECT_EQ(node->destroyCount, 1);
    EXPECT_EQ(h.manager.state(), SourceNodeState::Disposed);
    EXPECT_EQ(h.manager.element(), nullptr);
}

TEST(SourceNodeManagerTest, EnsureStartedReissuesStart) {
    ManagerHarness h;
    h.renderer.behavior.startsLeftWaiting = 1;
    ASSERT_TRUE(h.manager.createNode(h.context.get(), "a.mp4").ok());
    FakeVideoNode* node = h.renderer.lastNode();
    EXPECT_EQ(node->state(), NodeState::Waiting);

    h.manager.ensureStarted();
    EXPECT_EQ(node->startCount, 2);
    EXPECT_EQ(node->state(), NodeState::Sequenced);

    h.manager.ensureStarted();
    EXPECT_EQ(node->startCount, 2);
}

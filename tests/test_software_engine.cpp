#include <gtest/gtest.h>
#include <scenebridge/engine/software_engine.hpp>
#include <scenebridge/engine/compositor.hpp>
#include <scenebridge/engine/sync_bridge.hpp>
#include "fakes/fake_media_element.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace scenebridge;
using namespace scenebridge::engine;
using namespace scenebridge::fakes;

namespace {

/// Factory that remembers every element it built
struct ElementPool {
    std::vector<FakeMediaElement*> created;

    media::MediaElementFactory factory() {
        return [this]() {
            auto element = std::make_unique<FakeMediaElement>();
            created.push_back(element.get());
            return std::unique_ptr<media::MediaElement>(std::move(element));
        };
    }
};

struct ContextHarness {
    ElementPool pool;
    RenderSurface surface{4, 4};
    SoftwareEngine renderer{pool.factory()};
    std::unique_ptr<RenderingContext> context = renderer.createContext(surface);

    SoftwareContext& ctx() { return static_cast<SoftwareContext&>(*context); }

    std::shared_ptr<SoftwareVideoNode> addNode(const std::string& url, Seconds stop) {
        auto node = std::static_pointer_cast<SoftwareVideoNode>(context->createVideoNode(url));
        EXPECT_TRUE(node->connect(context->destination()));
        node->start(0.0);
        node->stop(stop);
        return node;
    }
};

} // anonymous namespace

TEST(SoftwareEngineTest, RejectsEmptySurface) {
    ElementPool pool;
    SoftwareEngine renderer(pool.factory());
    RenderSurface empty;
    EXPECT_THROW(renderer.createContext(empty), std::invalid_argument);
}

TEST(SoftwareEngineTest, NodeLoadsItsElement) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);

    ASSERT_EQ(h.pool.created.size(), 1u);
    EXPECT_EQ(h.pool.created[0]->loadCount, 1);
    EXPECT_EQ(h.pool.created[0]->source(), "clip.mp4");
    EXPECT_EQ(node->element(), h.pool.created[0]);
    EXPECT_TRUE(node->isConnected());
    EXPECT_EQ(node->state(), NodeState::Sequenced);
    EXPECT_DOUBLE_EQ(h.context->duration(), 10.0);
}

TEST(SoftwareEngineTest, ForwardsElementSignals) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);
    FakeMediaElement* el = h.pool.created[0];

    int loaded = 0;
    int failed = 0;
    ScopedConnection a = node->loaded.connect([&]() { ++loaded; });
    ScopedConnection b = node->failed.connect([&](const Error&) { ++failed; });

    el->finishLoad(10.0, 4, 4);
    EXPECT_EQ(loaded, 1);

    el->failLoad("corrupt");
    EXPECT_EQ(failed, 1);
    EXPECT_EQ(node->state(), NodeState::Error);
}

TEST(SoftwareEngineTest, ClockAdvancesAndAlignsElement) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);
    FakeMediaElement* el = h.pool.created[0];
    el->finishLoad(10.0, 4, 4);

    h.context->play();
    h.context->update(0.5);

    EXPECT_DOUBLE_EQ(h.context->currentTime(), 0.5);
    EXPECT_EQ(h.context->state(), ContextState::Playing);
    EXPECT_EQ(node->state(), NodeState::Playing);
    EXPECT_FALSE(el->paused());
    ASSERT_FALSE(el->seeks.empty());
    EXPECT_DOUBLE_EQ(el->seeks.back(), 0.5);

    // Within tolerance: no realignment
    size_t seeksBefore = el->seeks.size();
    el->setPosition(0.55);
    h.context->update(0.05);
    EXPECT_EQ(el->seeks.size(), seeksBefore);

    h.context->pause();
    EXPECT_TRUE(el->paused());
    EXPECT_EQ(h.context->state(), ContextState::Paused);
}

TEST(SoftwareEngineTest, StallsWhileElementLoads) {
    ContextHarness h;
    h.addNode("clip.mp4", 10.0);

    h.context->play();
    h.context->update(0.5);
    EXPECT_EQ(h.context->state(), ContextState::Stalled);
    EXPECT_DOUBLE_EQ(h.context->currentTime(), 0.0);

    h.pool.created[0]->finishLoad(10.0);
    h.context->update(0.5);
    EXPECT_EQ(h.context->state(), ContextState::Playing);
    EXPECT_DOUBLE_EQ(h.context->currentTime(), 0.5);
}

TEST(SoftwareEngineTest, EndsAtLatestStop) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 1.0);
    FakeMediaElement* el = h.pool.created[0];
    el->finishLoad(5.0);

    h.context->play();
    h.context->update(0.6);
    h.context->update(0.6);

    EXPECT_DOUBLE_EQ(h.context->currentTime(), 1.0);
    EXPECT_EQ(h.context->state(), ContextState::Ended);
    EXPECT_EQ(node->state(), NodeState::Ended);
    EXPECT_TRUE(el->paused());

    h.context->setCurrentTime(0.25);
    EXPECT_EQ(h.context->state(), ContextState::Paused);
    EXPECT_DOUBLE_EQ(el->currentTime(), 0.25);
}

TEST(SoftwareEngineTest, PollDeliversElementTime) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);
    FakeMediaElement* el = h.pool.created[0];

    Seconds reported = -1.0;
    ScopedConnection c = el->timeUpdated.connect([&](Seconds t) { reported = t; });

    el->setPosition(2.0);
    h.context->update(0.0);
    EXPECT_DOUBLE_EQ(reported, 2.0);
    EXPECT_GE(el->pollCount, 1);
}

TEST(SoftwareEngineTest, RendersActiveFrames) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);
    FakeMediaElement* el = h.pool.created[0];

    auto frame = std::make_shared<media::VideoFrame>(2, 2);
    frame->fill(255, 0, 0);
    el->frame = frame;
    el->finishLoad(10.0, 2, 2);

    h.context->update(0.0);
    EXPECT_EQ(h.surface.frameCount(), 1u);

    const uint8_t* px = h.surface.pixels().pixel(3, 3);
    EXPECT_EQ(px[0], 255);
    EXPECT_EQ(px[1], 0);
    EXPECT_EQ(px[2], 0);
    EXPECT_EQ(px[3], 255);
}

TEST(SoftwareEngineTest, UnstartedNodeIsNotDrawn) {
    ContextHarness h;
    auto node = std::static_pointer_cast<SoftwareVideoNode>(h.context->createVideoNode("clip.mp4"));
    FakeMediaElement* el = h.pool.created[0];
    auto frame = std::make_shared<media::VideoFrame>(2, 2);
    frame->fill(255, 255, 255);
    el->frame = frame;
    el->finishLoad(10.0, 2, 2);

    h.context->update(0.0);
    EXPECT_EQ(node->state(), NodeState::Waiting);
    EXPECT_EQ(h.surface.pixels().pixel(0, 0)[0], 0);
    EXPECT_EQ(h.surface.frameCount(), 1u);
}

TEST(SoftwareEngineTest, DestroyAndDispose) {
    ContextHarness h;
    auto node = h.addNode("clip.mp4", 10.0);

    node->destroy();
    node->destroy();
    EXPECT_TRUE(node->isDestroyed());
    EXPECT_EQ(node->element(), nullptr);
    EXPECT_DOUBLE_EQ(h.context->duration(), 0.0);

    h.context->update(0.0);
    EXPECT_EQ(h.ctx().nodeCount(), 0u);

    auto second = h.addNode("other.mp4", 5.0);
    h.context->reset();
    EXPECT_TRUE(second->isDestroyed());
    EXPECT_DOUBLE_EQ(h.context->currentTime(), 0.0);

    h.context->dispose();
    EXPECT_TRUE(h.ctx().isDisposed());
    EXPECT_EQ(h.ctx().surface(), nullptr);
    EXPECT_THROW(h.context->createVideoNode("late.mp4"), std::logic_error);
}

TEST(SoftwareEngineTest, MissingFactoryFailsNodeCreation) {
    RenderSurface surface(4, 4);
    SoftwareEngine renderer(media::MediaElementFactory{});
    auto context = renderer.createContext(surface);
    EXPECT_THROW(context->createVideoNode("clip.mp4"), std::runtime_error);
}

// ============================================================================
// Compositor
// ============================================================================

TEST(CompositorTest, ContainFitsInside) {
    FitRect rect = Compositor::fitRect({1920, 1080}, {1080, 1920}, FitMode::Contain);
    EXPECT_EQ(rect.x, 0);
    EXPECT_EQ(rect.width, 1080);
    EXPECT_EQ(rect.height, 608);
    EXPECT_EQ(rect.y, 656);
}

TEST(CompositorTest, CoverFillsAndOverflows) {
    FitRect rect = Compositor::fitRect({1920, 1080}, {1080, 1920}, FitMode::Cover);
    EXPECT_EQ(rect.height, 1920);
    EXPECT_EQ(rect.width, 3413);
    EXPECT_EQ(rect.y, 0);
    EXPECT_LT(rect.x, 0);
}

TEST(CompositorTest, DegenerateSizes) {
    EXPECT_EQ(Compositor::fitRect({0, 10}, {100, 100}, FitMode::Contain), FitRect{});
    EXPECT_EQ(Compositor::fitRect({10, 10}, {0, 0}, FitMode::Cover), FitRect{});
}

TEST(CompositorTest, BlendOver) {
    uint8_t dst[4] = {0, 0, 0, 255};
    const uint8_t white[4] = {255, 255, 255, 255};

    Compositor::blendOver(dst, white, 0.5f);
    EXPECT_EQ(dst[0], 128);
    EXPECT_EQ(dst[3], 255);

    Compositor::blendOver(dst, white, 1.0f);
    EXPECT_EQ(dst[0], 255);
}

TEST(CompositorTest, ClearUsesBackground) {
    RenderSurface surface(2, 2);
    Compositor compositor;
    compositor.setBackgroundColor(10, 20, 30);
    compositor.clear(surface);

    const uint8_t* px = surface.pixels().pixel(1, 1);
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[1], 20);
    EXPECT_EQ(px[2], 30);
    EXPECT_EQ(px[3], 255);
}

// ============================================================================
// Bridge over the software engine
// ============================================================================

TEST(SoftwareEngineBridgeTest, EndedMediaStaysPausedAcrossSeekAndTick) {
    ElementPool pool;
    SoftwareEngine renderer(pool.factory());
    RenderSurface surface;
    BridgeConfig config;
    config.baseSize = 64;
    SyncBridge bridge(renderer, config);
    bridge.attachSurface(&surface);

    bridge.initialize("clip.mp4", MediaKind::Video);
    ASSERT_EQ(pool.created.size(), 1u);
    FakeMediaElement* el = pool.created[0];
    el->finishLoad(5.0, 4, 4);
    ASSERT_TRUE(bridge.getState().isReady);

    bridge.play();
    bridge.tick(0.1);
    ASSERT_FALSE(el->paused());

    el->emitTime(5.0);
    el->emitEnded();
    EXPECT_FALSE(bridge.isPlaying());
    EXPECT_EQ(bridge.context()->state(), ContextState::Paused);

    bridge.seek(1.0);
    bridge.tick(0.5);

    EXPECT_TRUE(el->paused());
    EXPECT_FALSE(bridge.isPlaying());
    EXPECT_EQ(bridge.context()->state(), ContextState::Paused);
    EXPECT_DOUBLE_EQ(bridge.context()->currentTime(), 1.0);
    EXPECT_DOUBLE_EQ(el->currentTime(), 1.0);
    EXPECT_DOUBLE_EQ(bridge.getState().currentTime, 1.0);

    // An explicit play resumes from the seek position
    bridge.play();
    EXPECT_TRUE(bridge.isPlaying());
    EXPECT_FALSE(el->paused());
    EXPECT_EQ(bridge.context()->state(), ContextState::Playing);
}

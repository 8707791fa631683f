#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_transfer_source.hpp"
#include "frame_utils.hpp"
#include "surge/render_loop.hpp"
#include "surge/terminal.hpp"

using namespace ::testing;
using namespace ::surge;
using namespace ::surge::test;

namespace
{
constexpr std::chrono::milliseconds kFastRedraw {5};

class RenderLoopTest : public Test
{
protected:
    RenderLoop& makeLoop()
    {
        loop_ = std::make_unique<RenderLoop>(source_, ProgressBar {62, 62}, out_, kFastRedraw);
        return *loop_;
    }

    // Publishes and waits for the loop to draw it.
    void publishAndWaitForFrame(RenderLoop& loop, std::uint64_t downloaded)
    {
        const auto before = loop.framesRendered();
        source_.publish(downloaded);
        ASSERT_TRUE(waitUntil([&] { return loop.framesRendered() == before + 1; }));
    }

    FakeTransferSource          source_;
    std::ostringstream          out_;
    std::unique_ptr<RenderLoop> loop_;
};
}  // namespace

TEST_F(RenderLoopTest, RendersEachObservedChange)
{
    source_.setTotal(1000);
    source_.setSpeed(100);
    auto& loop = makeLoop();
    loop.start();

    for (const std::uint64_t downloaded : {0U, 250U, 500U, 1000U})
    {
        publishAndWaitForFrame(loop, downloaded);
    }
    source_.close();
    loop.join();

    EXPECT_EQ(loop.state(), RenderLoop::State::Stopped);
    EXPECT_EQ(loop.framesRendered(), 4U);

    const auto frames = splitFrames(out_.str());
    ASSERT_EQ(frames.size(), 4U);

    std::vector<int> percents;
    std::size_t      previous_fill = 0;
    for (const auto& frame : frames)
    {
        percents.push_back(percentOf(frame));
        const auto fill = countBlocks(frame);
        EXPECT_GE(fill, previous_fill);
        previous_fill = fill;
        EXPECT_THAT(frame, HasSubstr("100.00 B/s"));
    }
    EXPECT_THAT(percents, ElementsAre(0, 25, 50, 100));
    EXPECT_EQ(previous_fill, 60U);
}

TEST_F(RenderLoopTest, FirstFrameIsPrintedWithoutErase)
{
    source_.setTotal(1000);
    auto& loop = makeLoop();
    loop.start();

    publishAndWaitForFrame(loop, 100);
    EXPECT_EQ(loop.state(), RenderLoop::State::FirstFrame);
    publishAndWaitForFrame(loop, 200);
    EXPECT_EQ(loop.state(), RenderLoop::State::Redrawing);

    source_.close();
    loop.join();

    const std::string output = out_.str();
    EXPECT_THAT(output, Not(StartsWith(terminal::erase_frame)));
    EXPECT_THAT(output, HasSubstr(std::string {"]"} + terminal::erase_frame));
    EXPECT_EQ(output.find(terminal::erase_frame), output.rfind(terminal::erase_frame));
}

TEST_F(RenderLoopTest, WaitsForTotalSize)
{
    auto& loop = makeLoop();
    loop.start();

    source_.publish(100);
    std::this_thread::sleep_for(std::chrono::milliseconds {30});
    source_.publish(200);
    std::this_thread::sleep_for(std::chrono::milliseconds {30});

    EXPECT_EQ(loop.framesRendered(), 0U);
    EXPECT_EQ(loop.state(), RenderLoop::State::Idle);

    source_.setTotal(400);
    publishAndWaitForFrame(loop, 300);

    source_.close();
    loop.join();

    const auto frames = splitFrames(out_.str());
    ASSERT_EQ(frames.size(), 1U);
    EXPECT_EQ(percentOf(frames[0]), 75);
}

TEST_F(RenderLoopTest, NoFramesWhenTotalNeverKnown)
{
    auto& loop = makeLoop();
    loop.start();

    for (const std::uint64_t downloaded : {10U, 20U, 30U})
    {
        source_.publish(downloaded);
        std::this_thread::sleep_for(std::chrono::milliseconds {10});
    }
    source_.close();
    loop.join();

    EXPECT_EQ(loop.framesRendered(), 0U);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(loop.state(), RenderLoop::State::Stopped);
}

TEST_F(RenderLoopTest, DrainsLastValueThenStopsOnClose)
{
    source_.setTotal(1000);
    auto& loop = makeLoop();
    loop.start();

    publishAndWaitForFrame(loop, 100);
    source_.publish(1000);
    source_.close();
    loop.join();

    EXPECT_EQ(loop.framesRendered(), 2U);
    const auto frames = splitFrames(out_.str());
    ASSERT_EQ(frames.size(), 2U);
    EXPECT_EQ(percentOf(frames.back()), 100);

    source_.publish(500);
    EXPECT_EQ(loop.framesRendered(), 2U);
}

TEST_F(RenderLoopTest, NoFrameWithoutChange)
{
    source_.setTotal(1000);
    auto& loop = makeLoop();
    loop.start();

    publishAndWaitForFrame(loop, 100);
    std::this_thread::sleep_for(std::chrono::milliseconds {50});
    EXPECT_EQ(loop.framesRendered(), 1U);

    source_.close();
    loop.join();
    EXPECT_EQ(loop.framesRendered(), 1U);
}

TEST_F(RenderLoopTest, CancelStopsWaitingLoop)
{
    auto& loop = makeLoop();
    loop.start();

    loop.cancel();
    loop.join();

    EXPECT_EQ(loop.state(), RenderLoop::State::Stopped);
    EXPECT_EQ(loop.framesRendered(), 0U);
    EXPECT_FALSE(source_.cancelled());
}

TEST_F(RenderLoopTest, DestructorCancelsRunningLoop)
{
    auto& loop = makeLoop();
    loop.start();
    loop_.reset();

    SUCCEED();
}

TEST_F(RenderLoopTest, WriteFailureIsFatal)
{
    source_.setTotal(1000);
    out_.setstate(std::ios::badbit);
    auto& loop = makeLoop();
    loop.start();

    source_.publish(100);
    ASSERT_TRUE(waitUntil([&] { return loop.state() == RenderLoop::State::Stopped; }));

    EXPECT_THROW(loop.join(), std::runtime_error);
    EXPECT_TRUE(source_.cancelled());
    EXPECT_EQ(loop.framesRendered(), 0U);
}

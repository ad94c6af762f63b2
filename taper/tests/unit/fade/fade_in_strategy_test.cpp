// ==============================================================================
// Tests for fade_in_strategy.h (Layer 2 Fade Component)
// ==============================================================================

#include <taper/fade/fade_in_strategy.h>

#include "test_helpers/byte_comparison.h"
#include "test_helpers/mp3_test_frames.h"
#include "test_helpers/stream_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace Taper::Mp3;
using namespace TestHelpers;

namespace {

std::vector<int> firstGains(const CollectingSink& sink) {
    std::vector<int> gains;
    for (const auto& item : sink.items) {
        if (item.isFrame()) {
            gains.push_back(item.frame().globalGain(0, 0));
        }
    }
    return gains;
}

} // namespace

TEST_CASE("The first frame gets the most attenuated argument", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(RampPlan(std::vector<int>{0, -1, -2}), GainStrategy::AddDelta);
    CollectingSink sink;

    for (uint64_t i = 0; i < 5; ++i) {
        REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), i), sink) == FadeError::Success);
        // nothing is held back
        REQUIRE(sink.items.size() == i + 1);
    }
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE(firstGains(sink) == std::vector<int>{148, 149, 150, 150, 150});
    REQUIRE(strategy.statistics().framesAdjusted == 3);
    REQUIRE(strategy.finished());
}

TEST_CASE("Frames after the window are byte-identical", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(planRamp(2, 3.0), GainStrategy::AddDelta);
    CollectingSink sink;

    std::vector<std::vector<uint8_t>> inputs;
    for (uint64_t i = 0; i < 6; ++i) {
        inputs.push_back(makeFrameBytes(kMpeg1Layer3StereoCrc, 100 + static_cast<int>(i)));
        REQUIRE(strategy.push(makeFrameItem(inputs.back(), i), sink) == FadeError::Success);
    }
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE_FALSE(compareBytes(inputs[0], sink.items[0].bytes()));
    for (size_t i = 2; i < inputs.size(); ++i) {
        const auto result = compareBytes(inputs[i], sink.items[i].bytes());
        INFO("frame " << i << ": " << result.message());
        REQUIRE(result);
    }

    const auto& first = sink.items[0].frame();
    REQUIRE(first.storedCrc() == first.computeCrc());
}

TEST_CASE("Other items pass through without consuming arguments", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(RampPlan(std::vector<int>{0, -4}), GainStrategy::AddDelta);
    CollectingSink sink;

    REQUIRE(strategy.push(makeOtherItem(makeId3v2Tag(20), 0, OtherData::Kind::Tag), sink) == FadeError::Success);
    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 1), sink) == FadeError::Success);
    REQUIRE(strategy.push(makeOtherItem(bytesOf("junk"), 2), sink) == FadeError::Success);
    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 3), sink) == FadeError::Success);
    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 4), sink) == FadeError::Success);
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE(sink.sequences() == std::vector<uint64_t>{0, 1, 2, 3, 4});
    REQUIRE(firstGains(sink) == std::vector<int>{146, 150, 150});
    REQUIRE(strategy.statistics().itemsOut == 5);
}

TEST_CASE("A leading VBR header frame is skipped", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(RampPlan(std::vector<int>{0, -1, -2}), GainStrategy::AddDelta);
    CollectingSink sink;

    const auto info = makeXingFrameBytes(kMpeg1Layer3Stereo, "Info");
    REQUIRE(strategy.push(makeFrameItem(info, 0), sink) == FadeError::Success);
    for (uint64_t i = 1; i < 5; ++i) {
        REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), i), sink) == FadeError::Success);
    }
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE(compareBytes(info, sink.items[0].bytes()));
    REQUIRE(sink.items[1].frame().globalGain(0, 0) == 148);
    REQUIRE(sink.items[2].frame().globalGain(0, 0) == 149);
    REQUIRE(sink.items[3].frame().globalGain(0, 0) == 150);
    REQUIRE(strategy.statistics().vbrFramesSkipped == 1);
}

TEST_CASE("Deltas clamp at the ends of the gain range", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(RampPlan(std::vector<int>{200, -200}), GainStrategy::AddDelta);
    CollectingSink sink;

    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(kMpeg1Layer3Stereo, 40), 0), sink) == FadeError::Success);
    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(kMpeg1Layer3Stereo, 100), 1), sink) == FadeError::Success);
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE(firstGains(sink) == std::vector<int>{0, 255});
}

TEST_CASE("A stream shorter than the fade-in window warns", "[fade_in_strategy][fade]") {
    WarningLog log;
    FadeInStrategy strategy(planRamp(4, 1.5), GainStrategy::AddDelta, log.callback());
    CollectingSink sink;

    REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 0), sink) == FadeError::Success);
    REQUIRE(strategy.finish(sink) == FadeError::Success);

    REQUIRE(log.messages.size() == 1);
    REQUIRE(log.messages[0].find("3 of 4") != std::string::npos);
}

TEST_CASE("An empty stream finishes quietly", "[fade_in_strategy][fade]") {
    WarningLog log;
    FadeInStrategy strategy(planRamp(4, 1.5), GainStrategy::AddDelta, log.callback());
    CollectingSink sink;

    REQUIRE(strategy.finish(sink) == FadeError::Success);
    REQUIRE(log.messages.empty());
    REQUIRE(sink.items.empty());
}

TEST_CASE("Explicit fade-in gains", "[fade_in_strategy][fade]") {
    SECTION("plan values are applied last-first") {
        FadeInStrategy strategy(RampPlan(std::vector<int>{150, 90, 30}), GainStrategy::SetExplicit);
        CollectingSink sink;
        for (uint64_t i = 0; i < 4; ++i) {
            REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), i), sink) == FadeError::Success);
        }
        REQUIRE(strategy.finish(sink) == FadeError::Success);
        REQUIRE(firstGains(sink) == std::vector<int>{30, 90, 150, 150});
    }

    SECTION("a negative value stops the strategy before the frame is written") {
        FadeInStrategy strategy(RampPlan(std::vector<int>{10, -1}), GainStrategy::SetExplicit);
        CollectingSink sink;
        REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 0), sink) == FadeError::InvalidGainValue);
        REQUIRE(sink.items.empty());
    }
}

TEST_CASE("Fade-in lifecycle errors", "[fade_in_strategy][fade]") {
    FadeInStrategy strategy(planRamp(2, 1.0), GainStrategy::AddDelta);

    SECTION("write failure") {
        CollectingSink sink(0);
        REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 0), sink) == FadeError::WriteError);
    }

    SECTION("push after abort") {
        CollectingSink sink;
        strategy.abort();
        REQUIRE(strategy.push(makeFrameItem(makeFrameBytes(), 0), sink) == FadeError::InvalidState);
    }

    SECTION("finish twice") {
        CollectingSink sink;
        REQUIRE(strategy.finish(sink) == FadeError::Success);
        REQUIRE(strategy.finish(sink) == FadeError::InvalidState);
    }
}

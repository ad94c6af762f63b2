// ==============================================================================
// Tests for frame_header.h (Layer 1 Frame Codec)
// ==============================================================================

#include <taper/codec/frame_header.h>

#include "test_helpers/mp3_test_frames.h"

#include <catch2/catch_test_macros.hpp>

#include <array>

using namespace Taper::Mp3;
using namespace TestHelpers;

TEST_CASE("Header fields of an MPEG-1 Layer III frame", "[frame_header][codec]") {
    const FrameHeader header(0xFFFB9064);

    REQUIRE(header.hasSync());
    REQUIRE(header.versionIndex() == kVersionMpeg1);
    REQUIRE(header.layerIndex() == kLayer3);
    REQUIRE(header.layer() == 3);
    REQUIRE(header.protectionBit() == 1);
    REQUIRE_FALSE(header.hasCrc());
    REQUIRE(header.bitrateIndex() == 9);
    REQUIRE(header.samplerateIndex() == 0);
    REQUIRE_FALSE(header.padded());
    REQUIRE(header.privateBit() == 0);
    REQUIRE(header.channelMode() == kChannelModeJointStereo);
    REQUIRE(header.modeExtension() == 2);
    REQUIRE(header.copyrightBit() == 0);
    REQUIRE(header.originalBit() == 1);
    REQUIRE(header.emphasis() == 0);

    REQUIRE(header.isValid());
    REQUIRE(header.isLayer3());
    REQUIRE(header.bitrateKbps() == 128);
    REQUIRE(header.sampleRateHz() == 44100);
    REQUIRE(header.frameSize() == 417);
    REQUIRE(header.prefixSize() == 4);
    REQUIRE(header.sideInfoSize() == 32);
    REQUIRE(header.channels() == 2);
    REQUIRE(header.granules() == 2);
}

TEST_CASE("Header decoded from bytes", "[frame_header][codec]") {
    const std::array<uint8_t, 4> bytes = {0xFF, 0xFA, 0x92, 0xC0};
    const auto header = FrameHeader::fromBytes(bytes);

    REQUIRE(header.raw() == 0xFFFA92C0u);
    REQUIRE(header.hasCrc());
    REQUIRE(header.prefixSize() == 6);
    REQUIRE(header.padded());
    REQUIRE(header.frameSize() == 418);
    REQUIRE(header.isMono());
    REQUIRE(header.channels() == 1);
    REQUIRE(header.sideInfoSize() == 17);
}

TEST_CASE("Low sampling frequency headers", "[frame_header][codec]") {
    SECTION("MPEG-2 stereo") {
        const FrameHeader header(kMpeg2Layer3Stereo);
        REQUIRE(header.versionIndex() == kVersionMpeg2);
        REQUIRE(header.sampleRateHz() == 22050);
        REQUIRE(header.frameSize() == 261);
        REQUIRE(header.sideInfoSize() == 17);
        REQUIRE(header.granules() == 1);
    }

    SECTION("MPEG-2.5 mono") {
        const FrameHeader header(kMpeg25Layer3Mono);
        REQUIRE(header.versionIndex() == kVersionMpeg25);
        REQUIRE(header.sampleRateHz() == 11025);
        REQUIRE(header.frameSize() == 208);
        REQUIRE(header.sideInfoSize() == 9);
        REQUIRE(header.channels() == 1);
        REQUIRE(header.granules() == 1);
    }
}

TEST_CASE("Other layers have no side info", "[frame_header][codec]") {
    const FrameHeader layer2(kMpeg1Layer2Stereo);
    REQUIRE(layer2.isValid());
    REQUIRE(layer2.layer() == 2);
    REQUIRE_FALSE(layer2.isLayer3());
    REQUIRE(layer2.frameSize() == 522);
    REQUIRE(layer2.sideInfoSize() == 0);

    const FrameHeader layer1(kMpeg1Layer1Stereo);
    REQUIRE(layer1.layer() == 1);
    REQUIRE(layer1.frameSize() == 136);
}

TEST_CASE("Reserved fields make a header invalid", "[frame_header][codec]") {
    REQUIRE_FALSE(FrameHeader(0x7FFB9000).isValid());  // broken sync
    REQUIRE_FALSE(FrameHeader(0xFFEB9000).isValid());  // reserved version
    REQUIRE_FALSE(FrameHeader(0xFFF99000).isValid());  // reserved layer
    REQUIRE_FALSE(FrameHeader(0xFFFBF000).isValid());  // bitrate index 15
    REQUIRE_FALSE(FrameHeader(0xFFFB9C00).isValid());  // samplerate index 3
}

TEST_CASE("Header validity is available at compile time", "[frame_header][codec]") {
    STATIC_REQUIRE(FrameHeader(kMpeg1Layer3Stereo).isValid());
    STATIC_REQUIRE(FrameHeader(kMpeg25Layer3Mono).isValid());
    STATIC_REQUIRE_FALSE(FrameHeader(0xFFFB9C00).isValid());
    STATIC_REQUIRE(FrameHeader(kMpeg1Layer3Stereo).sampleRateHz() == 44100);
}

TEST_CASE("Free format headers are valid with no fixed size", "[frame_header][codec]") {
    const FrameHeader header(kMpeg1Layer3FreeFormat);
    REQUIRE(header.isValid());
    REQUIRE(header.isFreeFormat());
    REQUIRE(header.frameSize() == 0);
}

TEST_CASE("matchesStream ignores padding and channel fields", "[frame_header][codec]") {
    const FrameHeader base(0xFFFB0000);

    REQUIRE(base.matchesStream(FrameHeader(0xFFFB0200)));  // padded
    REQUIRE(base.matchesStream(FrameHeader(0xFFFB00C4)));  // mono, original
    REQUIRE_FALSE(base.matchesStream(FrameHeader(0xFFFB0400)));  // samplerate
    REQUIRE_FALSE(base.matchesStream(FrameHeader(0xFFFA0000)));  // CRC
    REQUIRE_FALSE(base.matchesStream(FrameHeader(0xFFFB9000)));  // bitrate
}

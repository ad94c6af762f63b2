// ==============================================================================
// Tests for side_info.h (Layer 1 Frame Codec)
// ==============================================================================

#include <taper/codec/side_info.h>

#include "test_helpers/byte_comparison.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <vector>

using namespace Taper::Mp3;
using namespace TestHelpers;

TEST_CASE("global_gain sits 21 bits into each granule record", "[side_info][codec]") {
    const FrameHeader stereo(0xFFFB9000);
    std::array<uint8_t, 32> bytes{};
    SideInfo info(stereo, bytes);

    REQUIRE(info.isComplete());
    REQUIRE(info.globalGainBitOffset(0, 0) == 41);
    REQUIRE(info.globalGainBitOffset(0, 1) == 100);
    REQUIRE(info.globalGainBitOffset(1, 0) == 159);
    REQUIRE(info.globalGainBitOffset(1, 1) == 218);

    const FrameHeader lsfMono(0xFFE340C0);
    std::array<uint8_t, 9> lsfBytes{};
    SideInfo lsfInfo(lsfMono, lsfBytes);
    REQUIRE(lsfInfo.globalGainBitOffset(0, 0) == 30);
}

TEST_CASE("setGlobalGain writes exactly eight bits", "[side_info][codec]") {
    const FrameHeader stereo(0xFFFB9000);
    std::array<uint8_t, 32> bytes{};
    const std::array<uint8_t, 32> original = bytes;
    SideInfo info(stereo, bytes);

    REQUIRE(info.setGlobalGain(0, 0, 0xFF));

    // bits 41..48: low seven bits of byte 5, top bit of byte 6
    REQUIRE(bytes[5] == 0x7F);
    REQUIRE(bytes[6] == 0x80);
    REQUIRE(differingOffsets(original, bytes) == std::vector<size_t>{5, 6});
    REQUIRE(info.globalGain(0, 0) == 255);
    REQUIRE(info.globalGain(0, 1) == 0);
}

TEST_CASE("Granule records are independent", "[side_info][codec]") {
    const FrameHeader stereo(0xFFFB9000);
    std::array<uint8_t, 32> bytes{};
    SideInfo info(stereo, bytes);

    REQUIRE(info.setGlobalGain(0, 0, 10));
    REQUIRE(info.setGlobalGain(0, 1, 20));
    REQUIRE(info.setGlobalGain(1, 0, 30));
    REQUIRE(info.setGlobalGain(1, 1, 40));

    REQUIRE(info.globalGain(0, 0) == 10);
    REQUIRE(info.globalGain(0, 1) == 20);
    REQUIRE(info.globalGain(1, 0) == 30);
    REQUIRE(info.globalGain(1, 1) == 40);
    REQUIRE(info.part23Length(0, 0) == 0);
    REQUIRE(info.bigValues(1, 1) == 0);
}

TEST_CASE("Neighbouring fields survive a gain change", "[side_info][codec]") {
    const FrameHeader stereo(0xFFFB9000);
    std::array<uint8_t, 32> bytes{};
    bytes.fill(0xFF);
    SideInfo info(stereo, bytes);

    REQUIRE(info.mainDataBegin() == 511);
    REQUIRE(info.part23Length(0, 0) == 4095);
    REQUIRE(info.bigValues(0, 0) == 511);

    REQUIRE(info.setGlobalGain(0, 0, 0));
    REQUIRE(info.globalGain(0, 0) == 0);
    REQUIRE(info.part23Length(0, 0) == 4095);
    REQUIRE(info.bigValues(0, 0) == 511);
    REQUIRE(info.globalGain(0, 1) == 255);
}

TEST_CASE("Out-of-range granules and values are rejected", "[side_info][codec]") {
    const FrameHeader mono(0xFFFB90C0);
    std::array<uint8_t, 17> bytes{};
    SideInfo info(mono, bytes);

    REQUIRE(info.channels() == 1);
    REQUIRE(info.granules() == 2);
    REQUIRE_FALSE(info.setGlobalGain(0, 1, 10));
    REQUIRE_FALSE(info.setGlobalGain(2, 0, 10));
    REQUIRE_FALSE(info.setGlobalGain(0, 0, 256));
    REQUIRE_FALSE(info.setGlobalGain(0, 0, -1));
    REQUIRE(info.globalGain(0, 1) == 0);
}

TEST_CASE("Read-only view of side info", "[side_info][codec]") {
    const FrameHeader stereo(0xFFFB9000);
    std::array<uint8_t, 32> bytes{};
    SideInfo(stereo, bytes).setGlobalGain(1, 0, 77);

    const std::array<uint8_t, 32>& constBytes = bytes;
    const ConstSideInfo view(stereo, constBytes);
    REQUIRE(view.globalGain(1, 0) == 77);
}

TEST_CASE("part23Bytes sums the main data of every granule", "[side_info][codec]") {
    const FrameHeader mono(0xFFFB90C0);
    std::array<uint8_t, 17> bytes{};
    SideInfo info(mono, bytes);

    // part2_3_length is the first 12 bits of each record (offsets 18 and 77)
    REQUIRE(writeBits(bytes, 18, 12, 100));
    REQUIRE(writeBits(bytes, 77, 12, 13));
    REQUIRE(info.part23Length(0, 0) == 100);
    REQUIRE(info.part23Length(1, 0) == 13);
    REQUIRE(info.part23Bytes() == 15);
}

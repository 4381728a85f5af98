#include <gtest/gtest.h>

#include "audio/pcm_encoder.hpp"

using namespace Audio;

TEST(PcmEncoder, DownmixAveragesChannels) {
    const float stereo[] = { 0.5f, -0.5f, 1.0f, 0.0f };
    auto mono = downmixToMono(stereo, 2, 2);
    ASSERT_EQ(mono.size(), 2u);
    EXPECT_FLOAT_EQ(mono[0], 0.0f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);

    EXPECT_TRUE(downmixToMono(nullptr, 4, 2).empty());
}

TEST(PcmEncoder, ResampleLength) {
    std::vector<float> in(4800, 0.25f);
    auto out = resampleLinear(in, 48000, 16000);
    EXPECT_EQ(out.size(), 1600u);
    for (float v : out) EXPECT_FLOAT_EQ(v, 0.25f);

    EXPECT_EQ(resampleLinear(in, 16000, 16000).size(), in.size());
    EXPECT_EQ(resampleLinear({ 0.f, 1.f }, 8000, 16000).size(), 4u);
}

TEST(PcmEncoder, ResampleInterpolates) {
    // Upsampling 2x puts midpoints between neighbours
    auto out = resampleLinear({ 0.0f, 1.0f, 0.0f }, 8000, 16000);
    ASSERT_EQ(out.size(), 6u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_FLOAT_EQ(out[1], 0.5f);
    EXPECT_FLOAT_EQ(out[2], 1.0f);
    EXPECT_FLOAT_EQ(out[3], 0.5f);
}

TEST(PcmEncoder, Pcm16ClampsAndScales) {
    auto pcm = floatToPcm16({ -2.0f, -1.0f, 0.0f, 1.0f, 3.0f });
    EXPECT_EQ(pcm[0], -32768);
    EXPECT_EQ(pcm[1], -32768);
    EXPECT_EQ(pcm[2], 0);
    EXPECT_EQ(pcm[3], 32767);
    EXPECT_EQ(pcm[4], 32767);
}

TEST(PcmEncoder, PacksLittleEndian) {
    auto bytes = packLittleEndian({ 0x0102, -1 });
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0x02);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0x01);
    EXPECT_EQ(static_cast<unsigned char>(bytes[2]), 0xFF);
    EXPECT_EQ(static_cast<unsigned char>(bytes[3]), 0xFF);
}

TEST(PcmEncoder, EncodeProducesTwoBytesPerTargetSample) {
    PcmEncoder encoder(48000, 16000);
    std::vector<float> stereo(2 * 4800, 0.1f);
    auto frame = encoder.encode(stereo.data(), 4800, 2);
    EXPECT_EQ(frame.size(), 1600u * 2);
    EXPECT_EQ(encoder.toMono(stereo.data(), 4800, 2).size(), 1600u);
}

#include "test_helpers.hpp"
#include "elenccxx/RecordCodec.h"

using namespace elenc;

TEST(RecordCodecTests, DecodesEncoderRecord) {
    auto record = makeEncoderRecord(0x0000000500000007ull, 12, 34, 5, 0x0102);

    auto decoded = classify_and_decode(record);

    ASSERT_EQ(decoded.kind, RecordKind::ENCODER);
    ASSERT_TRUE(decoded.encoder.has_value());
    EXPECT_FALSE(decoded.irig.has_value());
    EXPECT_EQ(decoded.encoder->timestamp, 7ull + (5ull << 32));
    EXPECT_EQ(decoded.encoder->seconds, 12);
    EXPECT_EQ(decoded.encoder->minutes, 34);
    EXPECT_EQ(decoded.encoder->hours, 5);
    EXPECT_EQ(decoded.encoder->day, 0x0102);
    // status word is DATA[0..3] little-endian
    EXPECT_EQ(decoded.encoder->status, 0x0205220Cu);
}

TEST(RecordCodecTests, TimestampCombinesLowAndHighWords) {
    auto record = makeRecord(encoder_header, encoder_footer, 0);
    store_le32(&record[1], 0xFFFFFFFFu);
    store_le32(&record[5], 0x00000001u);

    auto decoded = classify_and_decode(record);

    ASSERT_EQ(decoded.kind, RecordKind::ENCODER);
    EXPECT_EQ(decoded.encoder->timestamp, 0xFFFFFFFFull + (1ull << 32));
}

TEST(RecordCodecTests, DecodesIrigRecordAsRawState) {
    auto record = makeIrigRecord(42, {0xDE, 0xAD, 0xBE, 0xEF});

    auto decoded = classify_and_decode(record);

    ASSERT_EQ(decoded.kind, RecordKind::IRIG);
    EXPECT_FALSE(decoded.encoder.has_value());
    ASSERT_TRUE(decoded.irig.has_value());
    std::array<uint8_t, 4> expected{0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(decoded.irig->state, expected);
    EXPECT_EQ(decoded.irig->reserved, 0x00);
}

TEST(RecordCodecTests, MismatchedMarkersAreUnknown) {
    const std::vector<std::pair<uint8_t, uint8_t>> markers = {
        {0x99, 0xAA},   // encoder header, IRIG footer
        {0x55, 0x66},   // IRIG header, encoder footer
        {0x00, 0x00},
        {0x66, 0x99},   // swapped
        {0x99, 0x67},
    };

    for (const auto& [header, footer] : markers) {
        auto decoded = classify_and_decode(makeRecord(header, footer, 123));
        EXPECT_EQ(decoded.kind, RecordKind::UNKNOWN)
            << "header 0x" << std::hex << int(header) << " footer 0x" << int(footer);
        EXPECT_FALSE(decoded.encoder.has_value());
        EXPECT_FALSE(decoded.irig.has_value());
    }
}

TEST(RecordCodecTests, ClassificationIsDeterministic) {
    auto record = makeEncoderRecord(987654321);
    auto first = classify_and_decode(record);
    auto second = classify_and_decode(record);

    EXPECT_EQ(first.kind, second.kind);
    EXPECT_EQ(first.encoder->timestamp, second.encoder->timestamp);
    EXPECT_EQ(first.encoder->status, second.encoder->status);
}

TEST(RecordCodecTests, AllZeroEncoderFrameDecodesToZero) {
    record_t record{};
    record[0] = 0x99;
    record[14] = 0x66;

    auto decoded = classify_and_decode(record);

    ASSERT_EQ(decoded.kind, RecordKind::ENCODER);
    EXPECT_EQ(decoded.encoder->timestamp, 0u);
    EXPECT_EQ(decoded.encoder->status, 0u);
}

TEST(RecordCodecTests, KindNames) {
    EXPECT_STREQ(to_string(RecordKind::ENCODER), "ENC");
    EXPECT_STREQ(to_string(RecordKind::IRIG), "IRIG");
    EXPECT_STREQ(to_string(RecordKind::UNKNOWN), "UNKNOWN");
}

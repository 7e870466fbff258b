#include <string>
#include <gtest/gtest.h>
#include "net/frame_reader.hpp"

namespace {

using facetmcp::net::FrameReader;

void feed(FrameReader& reader, const std::string& bytes) {
    reader.append(bytes.data(), bytes.size());
}

TEST(FrameReaderTest, SplitsOnNewlines) {
    FrameReader reader(1024);
    feed(reader, "one\ntwo\r\nthr");

    EXPECT_EQ(reader.next_frame().value(), "one");
    EXPECT_EQ(reader.next_frame().value(), "two");
    EXPECT_FALSE(reader.next_frame().has_value());
    EXPECT_EQ(reader.pending_bytes(), 3u);

    feed(reader, "ee\n");
    EXPECT_EQ(reader.next_frame().value(), "three");
    EXPECT_FALSE(reader.overflowed());
}

TEST(FrameReaderTest, PartialFrameOverLimitOverflows) {
    FrameReader reader(8);
    feed(reader, "123456789");
    EXPECT_TRUE(reader.overflowed());
    EXPECT_FALSE(reader.next_frame().has_value());
}

TEST(FrameReaderTest, CompleteFrameOverLimitOverflows) {
    FrameReader reader(4);
    feed(reader, "ok\n123456\n");
    EXPECT_EQ(reader.next_frame().value(), "ok");
    EXPECT_FALSE(reader.next_frame().has_value());
    EXPECT_TRUE(reader.overflowed());
}

TEST(FrameReaderTest, FrameAtLimitIsAccepted) {
    FrameReader reader(4);
    feed(reader, "1234\n");
    EXPECT_EQ(reader.next_frame().value(), "1234");
    EXPECT_FALSE(reader.overflowed());
}

}  // namespace

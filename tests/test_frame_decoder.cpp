#include "sync/frame_decoder.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace billsync {

namespace {

std::vector<Frame> FeedAll(FrameDecoder& dec, const std::vector<std::string>& chunks) {
    std::vector<Frame> out;
    for (const auto& c : chunks) {
        auto r = dec.Feed(c, out);
        EXPECT_TRUE(r.ok) << r.msg;
    }
    return out;
}

const std::string kTwoFrames =
    "event: start\ndata: {}\n\n"
    "event: progress\ndata: {\"supplier_name\":\"Enel\",\"status\":\"processing\"}\n\n";

} // namespace

TEST(FrameDecoderTests, DecodesCompleteFrames) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {kTwoFrames});

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], (Frame{"start", "{}"}));
    EXPECT_EQ(frames[1].event_type, "progress");
    EXPECT_EQ(frames[1].data, "{\"supplier_name\":\"Enel\",\"status\":\"processing\"}");
    EXPECT_EQ(dec.FramesEmitted(), 2u);
    EXPECT_FALSE(dec.HasPendingFrame());
}

TEST(FrameDecoderTests, SameFramesForEverySplitPoint) {
    for (size_t cut = 0; cut <= kTwoFrames.size(); ++cut) {
        FrameDecoder dec;
        auto frames = FeedAll(dec, {kTwoFrames.substr(0, cut), kTwoFrames.substr(cut)});
        ASSERT_EQ(frames.size(), 2u) << "cut at " << cut;
        EXPECT_EQ(frames[0].event_type, "start");
        EXPECT_EQ(frames[1].event_type, "progress");
    }
}

TEST(FrameDecoderTests, ByteAtATimeMatchesWholeInput) {
    FrameDecoder whole;
    const auto expected = FeedAll(whole, {kTwoFrames});

    FrameDecoder dec;
    std::vector<std::string> bytes;
    for (char c : kTwoFrames) bytes.emplace_back(1, c);
    EXPECT_EQ(FeedAll(dec, bytes), expected);
}

TEST(FrameDecoderTests, FrameSplitMidLineIsHeldUntilTerminated) {
    FrameDecoder dec;
    std::vector<Frame> out;

    ASSERT_TRUE(dec.Feed("event: progress\ndata: {\"supplier_na", out).ok);
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(dec.HasPendingFrame());

    ASSERT_TRUE(dec.Feed("me\":\"A2A\",\"status\":\"completed\"}\n", out).ok);
    EXPECT_TRUE(out.empty());

    ASSERT_TRUE(dec.Feed("\n", out).ok);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].data, "{\"supplier_name\":\"A2A\",\"status\":\"completed\"}");
}

TEST(FrameDecoderTests, HandlesCrLfLineEndings) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {"event: complete\r\ndata: {\"bills_created\":2}\r\n\r\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], (Frame{"complete", "{\"bills_created\":2}"}));
}

TEST(FrameDecoderTests, SkipsCommentsAndUnknownFields) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {": keep-alive\n\nid: 7\nretry: 1000\nevent: start\ndata: {}\n\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], (Frame{"start", "{}"}));
}

TEST(FrameDecoderTests, JoinsMultipleDataLines) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {"event: error\ndata: {\"error\":\ndata: \"boom\"}\n\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data, "{\"error\":\n\"boom\"}");
}

TEST(FrameDecoderTests, OnlyOneLeadingSpaceIsStripped) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {"event:cancelled\ndata:  x\n\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].event_type, "cancelled");
    EXPECT_EQ(frames[0].data, " x");
}

TEST(FrameDecoderTests, MissingEventNameDefaultsToMessage) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {"data: hello\n\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], (Frame{"message", "hello"}));
}

TEST(FrameDecoderTests, EventWithoutDataHasEmptyPayload) {
    FrameDecoder dec;
    auto frames = FeedAll(dec, {"event: cancelled\n\n"});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], (Frame{"cancelled", ""}));
}

TEST(FrameDecoderTests, BlankLinesAloneEmitNothing) {
    FrameDecoder dec;
    EXPECT_TRUE(FeedAll(dec, {"\n\n\r\n\n"}).empty());
}

TEST(FrameDecoderTests, FinishDropsPartialFrame) {
    FrameDecoder dec;
    std::vector<Frame> out;
    ASSERT_TRUE(dec.Feed("event: complete\ndata: {}\n", out).ok);
    EXPECT_TRUE(dec.Finish());

    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(dec.Finished());
    EXPECT_FALSE(dec.HasPendingFrame());
}

TEST(FrameDecoderTests, FinishAfterCompleteFramesDropsNothing) {
    FrameDecoder dec;
    std::vector<Frame> out;
    ASSERT_TRUE(dec.Feed("event: start\ndata: {}\n\n: ping\n\n", out).ok);
    EXPECT_FALSE(dec.Finish());
    EXPECT_FALSE(dec.Finish());
    EXPECT_EQ(out.size(), 1u);
}

TEST(FrameDecoderTests, InputAfterFinishIsRejected) {
    FrameDecoder dec;
    std::vector<Frame> out;
    EXPECT_FALSE(dec.Finish());
    auto r = dec.Feed("event: start\n\n", out);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(out.empty());
}

TEST(FrameDecoderTests, OverlongLineFails) {
    FrameDecoder dec(16);
    std::vector<Frame> out;
    auto r = dec.Feed("data: " + std::string(32, 'x'), out);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("exceeds 16 bytes"), std::string::npos);
}

TEST(FrameDecoderTests, OverlongLineAcrossChunksFails) {
    FrameDecoder dec(16);
    std::vector<Frame> out;
    ASSERT_TRUE(dec.Feed("data: 0123456", out).ok);
    EXPECT_FALSE(dec.Feed("789abcdef\n", out).ok);
}

} // namespace billsync

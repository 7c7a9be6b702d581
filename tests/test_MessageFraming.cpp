#include <gtest/gtest.h>
#include <string>

#include "transport/MessageFraming.h"
#include "core/Errors.h"

static std::string contentLengthFrame(const std::string& body) {
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

TEST(FrameCodec, ContentLengthFrameIsExtracted) {
  std::string buffer = contentLengthFrame(R"({"jsonrpc":"2.0","id":1})");
  auto frame = FrameCodec::extract(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, R"({"jsonrpc":"2.0","id":1})");
  EXPECT_EQ(frame->framing, Framing::ContentLength);
  EXPECT_TRUE(buffer.empty());
}

TEST(FrameCodec, EveryIncompletePrefixWaitsForMoreBytes) {
  const std::string full = contentLengthFrame(R"({"method":"ping"})");
  for (size_t cut = 1; cut < full.size(); ++cut) {
    std::string buffer = full.substr(0, cut);
    EXPECT_FALSE(FrameCodec::extract(buffer).has_value()) << "cut at " << cut;
  }
}

TEST(FrameCodec, ChunkedDeliveryYieldsOneMessage) {
  const std::string full = contentLengthFrame(R"({"id":7,"result":null})");
  std::string buffer;
  int frames = 0;
  for (char c : full) {
    buffer.push_back(c);
    if (auto frame = FrameCodec::extract(buffer)) {
      ++frames;
      EXPECT_EQ(frame->payload, R"({"id":7,"result":null})");
    }
  }
  EXPECT_EQ(frames, 1);
}

TEST(FrameCodec, TwoFramesInOneBuffer) {
  std::string buffer = contentLengthFrame(R"({"id":1})") + contentLengthFrame(R"({"id":2})");
  auto first = FrameCodec::extract(buffer);
  auto second = FrameCodec::extract(buffer);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->payload, R"({"id":1})");
  EXPECT_EQ(second->payload, R"({"id":2})");
  EXPECT_FALSE(FrameCodec::extract(buffer).has_value());
}

TEST(FrameCodec, HeaderNameIsCaseInsensitive) {
  std::string buffer = "content-length: 2\r\n\r\n{}";
  auto frame = FrameCodec::extract(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "{}");
  EXPECT_EQ(frame->framing, Framing::ContentLength);
}

TEST(FrameCodec, BareNewlineHeaderTerminatorAccepted) {
  std::string buffer = "Content-Length: 2\n\n{}";
  auto frame = FrameCodec::extract(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "{}");
}

TEST(FrameCodec, ExtraHeadersAreIgnored) {
  std::string buffer = "Content-Length: 2\r\nContent-Type: application/vscode-jsonrpc; charset=utf-8\r\n\r\n{}";
  auto frame = FrameCodec::extract(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "{}");
}

TEST(FrameCodec, InvalidLengthValueThrows) {
  std::string buffer = "Content-Length: abc\r\n\r\n{}";
  EXPECT_THROW(FrameCodec::extract(buffer), TransportError);
}

TEST(FrameCodec, EmptyLengthValueThrows) {
  std::string buffer = "Content-Length:\r\n\r\n{}";
  EXPECT_THROW(FrameCodec::extract(buffer), TransportError);
}

TEST(FrameCodec, InvalidUtf8BodyThrows) {
  std::string body = "{\"x\":\"\xC3\x28\"}";
  std::string buffer = contentLengthFrame(body);
  EXPECT_THROW(FrameCodec::extract(buffer), TransportError);
}

TEST(FrameCodec, JsonLinesAreSplitAndBlankLinesSkipped) {
  std::string buffer = "\n\n{\"id\":1}\r\n   \n{\"id\":2}\n";
  auto first = FrameCodec::extract(buffer);
  auto second = FrameCodec::extract(buffer);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->payload, "{\"id\":1}");
  EXPECT_EQ(first->framing, Framing::JsonLine);
  EXPECT_EQ(second->payload, "{\"id\":2}");
  EXPECT_FALSE(FrameCodec::extract(buffer).has_value());
}

TEST(FrameCodec, PartialJsonLineWaits) {
  std::string buffer = "{\"id\":1";
  EXPECT_FALSE(FrameCodec::extract(buffer).has_value());
  buffer += "}\n";
  auto frame = FrameCodec::extract(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "{\"id\":1}");
}

TEST(FrameCodec, MixedFramingsInOneStream) {
  std::string buffer = "{\"id\":1}\n" + contentLengthFrame("{\"id\":2}");
  auto first = FrameCodec::extract(buffer);
  auto second = FrameCodec::extract(buffer);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->framing, Framing::JsonLine);
  EXPECT_EQ(second->framing, Framing::ContentLength);
  EXPECT_EQ(second->payload, "{\"id\":2}");
}

TEST(FrameCodec, TrailingLineWithoutNewlineAtEof) {
  std::string buffer = "{\"id\":3}";
  auto frame = FrameCodec::extractAtEof(buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "{\"id\":3}");
  EXPECT_EQ(frame->framing, Framing::JsonLine);
  EXPECT_FALSE(FrameCodec::extractAtEof(buffer).has_value());
}

TEST(FrameCodec, TruncatedBodyAtEofThrows) {
  std::string buffer = "Content-Length: 10\r\n\r\n{}";
  EXPECT_THROW(FrameCodec::extractAtEof(buffer), TransportError);
}

TEST(FrameCodec, TruncatedHeaderAtEofThrows) {
  std::string buffer = "Content-Length: 10\r\n";
  EXPECT_THROW(FrameCodec::extractAtEof(buffer), TransportError);
}

TEST(FrameCodec, WhitespaceOnlyAtEofIsCleanEnd) {
  std::string buffer = " \r\n\t\n";
  EXPECT_FALSE(FrameCodec::extractAtEof(buffer).has_value());
}

TEST(FrameCodec, EncodeUsesByteLength) {
  std::string body = "{\"text\":\"h\xC3\xA9llo\"}";
  EXPECT_EQ(FrameCodec::encode(body, Framing::ContentLength),
            "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
  EXPECT_EQ(FrameCodec::encode("{}", Framing::JsonLine), "{}\n");
}

TEST(FrameCodec, Utf8Validation) {
  EXPECT_TRUE(FrameCodec::isValidUtf8("plain ascii"));
  EXPECT_TRUE(FrameCodec::isValidUtf8("\xE4\xB8\xAD\xE6\x96\x87"));
  EXPECT_TRUE(FrameCodec::isValidUtf8("\xF0\x9F\xA6\x80"));
  EXPECT_FALSE(FrameCodec::isValidUtf8("\xC0\xAF"));          // overlong
  EXPECT_FALSE(FrameCodec::isValidUtf8("\xED\xA0\x80"));      // surrogate
  EXPECT_FALSE(FrameCodec::isValidUtf8("\xE4\xB8"));          // truncated
  EXPECT_FALSE(FrameCodec::isValidUtf8("\xFF"));
}

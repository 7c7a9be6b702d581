#pragma once
#include <string>
#include <optional>

/** Wire encoding of a single message. */
enum class Framing {
    ContentLength,  // "Content-Length: N\r\n\r\n" + N bytes
    JsonLine        // one message per '\n'-terminated line
};

struct Frame {
    std::string payload;
    Framing framing = Framing::JsonLine;
};

/**
 * @brief Incremental frame extraction over a growing byte buffer.
 *
 * The framing is detected per message: after leading whitespace is dropped, a
 * buffer starting with "content-length:" (any case) is read as a
 * length-prefixed frame, anything else as a newline-delimited line.
 * Consumed bytes are erased from the front of the buffer.
 */
namespace FrameCodec {

/**
 * @brief Extract the next complete message.
 * @return the frame, or std::nullopt when more bytes are needed
 * @throws TransportError on a malformed header or invalid UTF-8
 */
std::optional<Frame> extract(std::string& buffer);

/**
 * @brief Final extraction once the stream has ended.
 *
 * Plain trailing text without a newline becomes one last JsonLine frame.
 * @throws TransportError when a length-prefixed frame is truncated
 */
std::optional<Frame> extractAtEof(std::string& buffer);

/** Serialize a payload the way `framing` expects it on the wire. */
std::string encode(const std::string& payload, Framing framing);

bool isValidUtf8(const std::string& text);

}  // namespace FrameCodec

#include "transport/MessageFraming.h"
#include "core/Errors.h"
#include <cctype>
#include <limits>

namespace {
const std::string CONTENT_LENGTH_TOKEN = "content-length:";

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

char lowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isAsciiSpace(s[begin])) ++begin;
    while (end > begin && isAsciiSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (lowerAscii(a[i]) != lowerAscii(b[i])) return false;
    }
    return true;
}

void trimLeadingWhitespace(std::string& buffer) {
    size_t count = 0;
    while (count < buffer.size() && isAsciiSpace(buffer[count])) ++count;
    if (count > 0) buffer.erase(0, count);
}

bool startsWithContentLength(const std::string& buffer) {
    if (buffer.size() < CONTENT_LENGTH_TOKEN.size()) return false;
    for (size_t i = 0; i < CONTENT_LENGTH_TOKEN.size(); ++i) {
        if (lowerAscii(buffer[i]) != CONTENT_LENGTH_TOKEN[i]) return false;
    }
    return true;
}

// Position of the blank line closing the header block and its length.
bool findHeaderEnd(const std::string& buffer, size_t& headerEnd, size_t& delimiterLen) {
    size_t crlf = buffer.find("\r\n\r\n");
    size_t lf = buffer.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) return false;
    if (lf == std::string::npos || (crlf != std::string::npos && crlf <= lf)) {
        headerEnd = crlf;
        delimiterLen = 4;
    } else {
        headerEnd = lf;
        delimiterLen = 2;
    }
    return true;
}

size_t parseLengthValue(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) {
        throw TransportError("Invalid Content-Length value: empty");
    }
    size_t parsed = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            throw TransportError("Invalid Content-Length value: " + value);
        }
        size_t digit = static_cast<size_t>(c - '0');
        if (parsed > (std::numeric_limits<size_t>::max() - digit) / 10) {
            throw TransportError("Invalid Content-Length value: " + value);
        }
        parsed = parsed * 10 + digit;
    }
    return parsed;
}

bool parseContentLength(const std::string& headers, size_t& length) {
    size_t start = 0;
    while (start <= headers.size()) {
        size_t end = headers.find('\n', start);
        std::string line = headers.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (!line.empty() && colon != std::string::npos) {
            if (equalsIgnoreCase(trim(line.substr(0, colon)), "Content-Length")) {
                length = parseLengthValue(line.substr(colon + 1));
                return true;
            }
        }

        if (end == std::string::npos) break;
        start = end + 1;
    }
    return false;
}

std::optional<std::string> tryExtractContentLength(std::string& buffer) {
    size_t headerEnd = 0;
    size_t delimiterLen = 0;
    if (!findHeaderEnd(buffer, headerEnd, delimiterLen)) return std::nullopt;

    size_t contentLength = 0;
    if (!parseContentLength(buffer.substr(0, headerEnd), contentLength)) {
        throw TransportError("Missing Content-Length header");
    }

    size_t bodyStart = headerEnd + delimiterLen;
    if (buffer.size() - bodyStart < contentLength) return std::nullopt;

    std::string message = buffer.substr(bodyStart, contentLength);
    if (!FrameCodec::isValidUtf8(message)) {
        throw TransportError("Content-Length framed message is not valid UTF-8");
    }
    buffer.erase(0, bodyStart + contentLength);
    return message;
}

std::optional<std::string> tryExtractLine(std::string& buffer) {
    while (true) {
        size_t newline = buffer.find('\n');
        if (newline == std::string::npos) return std::nullopt;

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (!FrameCodec::isValidUtf8(line)) {
            throw TransportError("Line framed message is not valid UTF-8");
        }
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;
        return trimmed;
    }
}
}  // namespace

namespace FrameCodec {

std::optional<Frame> extract(std::string& buffer) {
    trimLeadingWhitespace(buffer);
    if (buffer.empty()) return std::nullopt;

    if (startsWithContentLength(buffer)) {
        auto message = tryExtractContentLength(buffer);
        if (!message) return std::nullopt;
        return Frame{std::move(*message), Framing::ContentLength};
    }

    auto line = tryExtractLine(buffer);
    if (!line) return std::nullopt;
    return Frame{std::move(*line), Framing::JsonLine};
}

std::optional<Frame> extractAtEof(std::string& buffer) {
    if (auto frame = extract(buffer)) return frame;

    trimLeadingWhitespace(buffer);
    if (buffer.empty()) return std::nullopt;

    if (startsWithContentLength(buffer)) {
        throw TransportError("Unexpected EOF while reading Content-Length framed message");
    }

    if (!isValidUtf8(buffer)) {
        throw TransportError("Trailing message is not valid UTF-8");
    }
    std::string trailing = trim(buffer);
    buffer.clear();
    if (trailing.empty()) return std::nullopt;
    return Frame{std::move(trailing), Framing::JsonLine};
}

std::string encode(const std::string& payload, Framing framing) {
    switch (framing) {
        case Framing::JsonLine:
            return payload + "\n";
        case Framing::ContentLength:
            return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
    }
    return payload;
}

bool isValidUtf8(const std::string& text) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t extra = 0;
        unsigned int codepoint = 0;
        if ((c & 0xE0) == 0xC0) { extra = 1; codepoint = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; codepoint = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; codepoint = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && codepoint < 0x80) ||
            (extra == 2 && codepoint < 0x800) ||
            (extra == 3 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace FrameCodec

#pragma once
#include <string>
#include <optional>
#include <functional>
#include "transport/MessageFraming.h"

/**
 * @brief Framed message reader/writer over a pair of file descriptors.
 *
 * Does not own the descriptors. Reads accumulate in an internal buffer so a
 * single read(2) may yield several frames, or only part of one.
 */
class StdioTransport {
public:
    StdioTransport(int readFd, int writeFd);

    /** Polled when a read is interrupted by a signal; true ends reading. */
    void setInterruptCheck(std::function<bool()> check) { interrupted = std::move(check); }

    /**
     * @return next frame, or std::nullopt at clean end of input
     * @throws TransportError on malformed input or a failed read
     */
    std::optional<Frame> readMessage();

    /** Write one message using the given framing and flush it completely. */
    void writeMessage(const std::string& payload, Framing framing);

    static void writeAll(int fd, const std::string& data);

private:
    int readFd;
    int writeFd;
    std::string readBuffer;
    std::function<bool()> interrupted;
};

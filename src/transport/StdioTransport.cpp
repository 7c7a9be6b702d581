#include "transport/StdioTransport.h"
#include "core/Errors.h"
#include <cerrno>
#include <cstring>
#include <unistd.h>

StdioTransport::StdioTransport(int readFd, int writeFd)
    : readFd(readFd), writeFd(writeFd) {
    readBuffer.reserve(8192);
}

std::optional<Frame> StdioTransport::readMessage() {
    char temp[8192];
    while (true) {
        if (auto frame = FrameCodec::extract(readBuffer)) {
            return frame;
        }

        ssize_t n = read(readFd, temp, sizeof(temp));
        if (n < 0) {
            if (errno == EINTR) {
                if (interrupted && interrupted()) return std::nullopt;
                continue;
            }
            throw TransportError(std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            return FrameCodec::extractAtEof(readBuffer);
        }
        readBuffer.append(temp, static_cast<size_t>(n));
    }
}

void StdioTransport::writeMessage(const std::string& payload, Framing framing) {
    writeAll(writeFd, FrameCodec::encode(payload, framing));
}

void StdioTransport::writeAll(int fd, const std::string& data) {
    if (fd < 0) throw TransportError("write failed: stream closed");
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("write failed: ") + std::strerror(errno));
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
}

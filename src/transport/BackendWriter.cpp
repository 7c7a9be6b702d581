#include "transport/BackendWriter.h"
#include "transport/MessageFraming.h"
#include "transport/StdioTransport.h"
#include "core/Errors.h"

void FramedFdWriter::writeMessage(const nlohmann::json& message) {
    std::string frame = FrameCodec::encode(message.dump(), Framing::ContentLength);

    std::unique_lock<std::mutex> lock(mtx);
    const uint64_t ticket = nextTicket++;
    turn.wait(lock, [&] { return serving == ticket; });

    // Hand the turn to the next ticket however this write ends.
    struct TurnRelease {
        FramedFdWriter& self;
        std::unique_lock<std::mutex>& lock;
        ~TurnRelease() {
            if (!lock.owns_lock()) lock.lock();
            ++self.serving;
            self.turn.notify_all();
        }
    } release{*this, lock};

    if (closed) {
        throw TransportError("write failed: backend input closed");
    }
    lock.unlock();
    StdioTransport::writeAll(fd, frame);
}

void FramedFdWriter::close() {
    std::lock_guard<std::mutex> lock(mtx);
    closed = true;
}

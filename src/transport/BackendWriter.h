#pragma once
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <nlohmann/json.hpp>

/**
 * @brief Write channel into the backend's stdin.
 *
 * Every message is sent length-prefixed. Implementations must admit one
 * write at a time.
 */
class IBackendWriter {
public:
    virtual ~IBackendWriter() = default;
    virtual void writeMessage(const nlohmann::json& message) = 0;
};

/**
 * @brief IBackendWriter over a pipe descriptor.
 *
 * Writers are served strictly in the order they called writeMessage (ticket
 * order), so concurrent callers never interleave bytes or overtake each other.
 */
class FramedFdWriter : public IBackendWriter {
public:
    explicit FramedFdWriter(int fd) : fd(fd) {}

    void writeMessage(const nlohmann::json& message) override;

    /** Later writes fail with TransportError. Does not close the descriptor. */
    void close();

private:
    int fd;
    bool closed = false;
    std::mutex mtx;
    std::condition_variable turn;
    uint64_t nextTicket = 0;
    uint64_t serving = 0;
};

#pragma once

#include "message.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace pqoidc {

class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual void send(const Message &msg) = 0;

    // Blocks until one complete message is available.
    virtual Message receive() = 0;
};

// Framed messages over a connected stream socket. Does not own the
// descriptor. Reads exactly one frame per receive(), so bytes that follow the
// handshake stay in the socket for the caller.
class FdChannel : public MessageChannel {
public:
    explicit FdChannel(int fd) : fd_(fd) {}

    void send(const Message &msg) override;
    Message receive() override;

private:
    void read_exact(std::uint8_t *buf, std::size_t len);

    int fd_;
};

// In-process peer pair. Each side's send() feeds the other side's receive().
// Messages pass through serialize/deserialize so framing is exercised.
class MemoryChannel : public MessageChannel {
public:
    static std::pair<std::unique_ptr<MemoryChannel>, std::unique_ptr<MemoryChannel>>
    make_pair(std::chrono::milliseconds receive_timeout = std::chrono::seconds(5));

    void send(const Message &msg) override;

    // Throws ProtocolError if nothing arrives within the timeout.
    Message receive() override;

private:
    struct Queue {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<Bytes> frames;
    };

    struct PairTag {};

public:
    // Use make_pair(); the tag keeps construction inside this class.
    MemoryChannel(PairTag, std::shared_ptr<Queue> inbound, std::shared_ptr<Queue> outbound,
                  std::chrono::milliseconds timeout)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound)), timeout_(timeout) {}

private:
    std::shared_ptr<Queue> inbound_;
    std::shared_ptr<Queue> outbound_;
    std::chrono::milliseconds timeout_;
};

} // namespace pqoidc

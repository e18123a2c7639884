#include "channel.hpp"
#include "errors.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace pqoidc {

void FdChannel::send(const Message &msg) {
    const Bytes frame = msg.serialize();
    std::size_t off = 0;
    while (off < frame.size()) {
        ssize_t n = ::send(fd_, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "send");
        }
        off += static_cast<std::size_t>(n);
    }
}

void FdChannel::read_exact(std::uint8_t *buf, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::read(fd_, buf + off, len - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "read");
        }
        if (n == 0) {
            throw ProtocolError("connection closed during handshake");
        }
        off += static_cast<std::size_t>(n);
    }
}

Message FdChannel::receive() {
    Bytes frame(kMessageHeaderSize);
    read_exact(frame.data(), frame.size());

    std::size_t len = Message::frame_length(frame);
    frame.resize(kMessageHeaderSize + len);
    if (len > 0) {
        read_exact(frame.data() + kMessageHeaderSize, len);
    }
    return Message::deserialize(frame);
}

std::pair<std::unique_ptr<MemoryChannel>, std::unique_ptr<MemoryChannel>>
MemoryChannel::make_pair(std::chrono::milliseconds receive_timeout) {
    auto a_to_b = std::make_shared<Queue>();
    auto b_to_a = std::make_shared<Queue>();
    auto a = std::make_unique<MemoryChannel>(PairTag{}, b_to_a, a_to_b, receive_timeout);
    auto b = std::make_unique<MemoryChannel>(PairTag{}, a_to_b, b_to_a, receive_timeout);
    return {std::move(a), std::move(b)};
}

void MemoryChannel::send(const Message &msg) {
    Bytes frame = msg.serialize();
    {
        std::lock_guard<std::mutex> lock(outbound_->mu);
        outbound_->frames.push_back(std::move(frame));
    }
    outbound_->cv.notify_one();
}

Message MemoryChannel::receive() {
    std::unique_lock<std::mutex> lock(inbound_->mu);
    if (!inbound_->cv.wait_for(lock, timeout_, [this] { return !inbound_->frames.empty(); })) {
        throw ProtocolError("timed out waiting for handshake message");
    }
    Bytes frame = std::move(inbound_->frames.front());
    inbound_->frames.pop_front();
    lock.unlock();
    return Message::deserialize(frame);
}

} // namespace pqoidc

#include "wire.hpp"
#include "errors.hpp"

namespace pqoidc {

void ByteWriter::put_u32(std::uint32_t v) {
    out_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out_.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void ByteWriter::put_field(const Bytes &data) {
    put_u32(static_cast<std::uint32_t>(data.size()));
    out_.insert(out_.end(), data.begin(), data.end());
}

void ByteWriter::put_field(const std::string &data) {
    put_u32(static_cast<std::uint32_t>(data.size()));
    out_.insert(out_.end(), data.begin(), data.end());
}

std::uint8_t ByteReader::get_u8() {
    if (remaining() < 1) {
        throw ProtocolError("truncated field");
    }
    return data_[pos_++];
}

std::uint32_t ByteReader::get_u32() {
    if (remaining() < 4) {
        throw ProtocolError("truncated length prefix");
    }
    std::uint32_t v = (static_cast<std::uint32_t>(data_[pos_]) << 24) |
                      (static_cast<std::uint32_t>(data_[pos_ + 1]) << 16) |
                      (static_cast<std::uint32_t>(data_[pos_ + 2]) << 8) |
                      static_cast<std::uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return v;
}

Bytes ByteReader::get_field() {
    std::uint32_t len = get_u32();
    if (remaining() < len) {
        throw ProtocolError("field length exceeds payload");
    }
    Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
              data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
    pos_ += len;
    return out;
}

std::string ByteReader::get_string() {
    Bytes raw = get_field();
    return std::string(raw.begin(), raw.end());
}

void ByteReader::expect_end() const {
    if (remaining() != 0) {
        throw ProtocolError("trailing bytes after payload");
    }
}

} // namespace pqoidc

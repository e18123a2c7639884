#pragma once

#include "../crypto/algorithms.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace pqoidc {

// Length-prefixed binary fields: every variable field is a u32 big-endian
// length followed by that many bytes.
class ByteWriter {
public:
    void put_u8(std::uint8_t v) { out_.push_back(v); }
    void put_u32(std::uint32_t v);
    void put_field(const Bytes &data);
    void put_field(const std::string &data);

    const Bytes &bytes() const { return out_; }
    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

// Reads fields written by ByteWriter. Any short read or trailing data throws
// ProtocolError.
class ByteReader {
public:
    explicit ByteReader(const Bytes &data) : data_(data) {}

    std::uint8_t get_u8();
    std::uint32_t get_u32();
    Bytes get_field();
    std::string get_string();

    std::size_t remaining() const { return data_.size() - pos_; }
    void expect_end() const;

private:
    const Bytes &data_;
    std::size_t pos_{0};
};

} // namespace pqoidc

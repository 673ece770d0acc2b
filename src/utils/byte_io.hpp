#pragma once

#include "brightchain/common.hpp"
#include <string>
#include <algorithm>

namespace brightchain::utils {

/**
 * Appends big-endian fields to a growing buffer
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buffer_.reserve(reserve); }

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_bytes(const byte* data, size_t len);
    void write_bytes(const bytes& data);
    void write_string(const std::string& value);

    template<size_t N>
    void write_bytes(const fixed_bytes<N>& data) {
        write_bytes(data.data(), N);
    }

    void write_zeros(size_t count);

    size_t size() const { return buffer_.size(); }
    const bytes& data() const { return buffer_; }
    bytes take() { return std::move(buffer_); }

private:
    bytes buffer_;
};

/**
 * Reads big-endian fields from a buffer
 * Reading past the end throws BrightChainException(DataTooShort); callers
 * check remaining() first where truncation is an expected input.
 */
class ByteReader {
public:
    ByteReader(const byte* data, size_t len, size_t offset = 0)
        : data_(data), len_(len), offset_(offset) {}
    explicit ByteReader(const bytes& data, size_t offset = 0)
        : ByteReader(data.data(), data.size(), offset) {}

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    uint64_t read_u64();
    bytes read_bytes(size_t len);
    std::string read_string(size_t len);

    template<size_t N>
    fixed_bytes<N> read_fixed() {
        fixed_bytes<N> out;
        require(N);
        std::copy(data_ + offset_, data_ + offset_ + N, out.begin());
        offset_ += N;
        return out;
    }

    void skip(size_t len);

    size_t offset() const { return offset_; }
    size_t remaining() const { return len_ - offset_; }

private:
    void require(size_t len) const;

    const byte* data_;
    size_t len_;
    size_t offset_;
};

} // namespace brightchain::utils

#include "byte_io.hpp"
#include "brightchain/error.hpp"
#include <algorithm>

namespace brightchain::utils {

void ByteWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u16(uint16_t value) {
    buffer_.push_back(static_cast<byte>(value >> 8));
    buffer_.push_back(static_cast<byte>(value));
}

void ByteWriter::write_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<byte>(value >> shift));
    }
}

void ByteWriter::write_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<byte>(value >> shift));
    }
}

void ByteWriter::write_bytes(const byte* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

void ByteWriter::write_bytes(const bytes& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::write_string(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::write_zeros(size_t count) {
    buffer_.resize(buffer_.size() + count, 0);
}

void ByteReader::require(size_t len) const {
    if (len > remaining()) {
        throw BrightChainException(ErrorCode::DataTooShort,
            "Read of " + std::to_string(len) + " bytes at offset " + std::to_string(offset_) +
            " exceeds buffer of " + std::to_string(len_));
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[offset_++];
}

uint16_t ByteReader::read_u16() {
    require(2);
    uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
}

uint32_t ByteReader::read_u32() {
    require(4);
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 4;
    return value;
}

uint64_t ByteReader::read_u64() {
    require(8);
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 8;
    return value;
}

bytes ByteReader::read_bytes(size_t len) {
    require(len);
    bytes out(data_ + offset_, data_ + offset_ + len);
    offset_ += len;
    return out;
}

std::string ByteReader::read_string(size_t len) {
    require(len);
    std::string out(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return out;
}

void ByteReader::skip(size_t len) {
    require(len);
    offset_ += len;
}

} // namespace brightchain::utils

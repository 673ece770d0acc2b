#include "secure_buffer.hpp"
#include "brightchain/error.hpp"
#include "crypto/blake3.hpp"
#include "crypto/random.hpp"
#include <sodium.h>

namespace brightchain::utils {

SecureBuffer::SecureBuffer() {
    crypto::Random::generate_into(id_.data(), id_.size());
}

SecureBuffer::SecureBuffer(const bytes& secret)
    : SecureBuffer(secret.data(), secret.size()) {}

SecureBuffer::SecureBuffer(const byte* secret, size_t len) : SecureBuffer() {
    obfuscated_.assign(secret, secret + len);
    length_ = len;
    obfuscate(obfuscated_);
}

SecureBuffer::~SecureBuffer() {
    dispose();
}

SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    id_ = other.id_;
    obfuscated_ = std::move(other.obfuscated_);
    length_ = other.length_;
    disposed_ = other.disposed_;
    other.obfuscated_.clear();
    other.length_ = 0;
    other.disposed_ = true;
}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept {
    if (this != &other) {
        dispose();
        std::scoped_lock lock(mutex_, other.mutex_);
        id_ = other.id_;
        obfuscated_ = std::move(other.obfuscated_);
        length_ = other.length_;
        disposed_ = other.disposed_;
        other.obfuscated_.clear();
        other.length_ = 0;
        other.disposed_ = true;
    }
    return *this;
}

void SecureBuffer::obfuscate(bytes& data) const {
    if (data.empty()) {
        return;
    }
    bytes stream = crypto::Blake3::keystream(id_, data.size());
    xor_into(data, stream);
    sodium_memzero(stream.data(), stream.size());
}

void SecureBuffer::check_not_disposed() const {
    if (disposed_) {
        throw BrightChainException(ErrorCode::SecureBufferDisposed, "Secure buffer has been disposed");
    }
}

bytes SecureBuffer::value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_not_disposed();
    bytes plain = obfuscated_;
    obfuscate(plain);
    return plain;
}

bool SecureBuffer::equals(const bytes& candidate) const {
    bytes plain = value();
    bool same = plain.size() == candidate.size() &&
                (plain.empty() || sodium_memcmp(plain.data(), candidate.data(), plain.size()) == 0);
    sodium_memzero(plain.data(), plain.size());
    return same;
}

void SecureBuffer::dispose() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return;
    }
    if (!obfuscated_.empty()) {
        sodium_memzero(obfuscated_.data(), obfuscated_.size());
    }
    obfuscated_.clear();
    length_ = 0;
    disposed_ = true;
}

bool SecureBuffer::disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

size_t SecureBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_not_disposed();
    return length_;
}

SecureString::SecureString(const std::string& secret)
    : buffer_(reinterpret_cast<const byte*>(secret.data()), secret.size()) {}

std::string SecureString::value() const {
    bytes raw = buffer_.value();
    std::string out(raw.begin(), raw.end());
    sodium_memzero(raw.data(), raw.size());
    return out;
}

bool SecureString::equals(const std::string& candidate) const {
    return buffer_.equals(bytes(candidate.begin(), candidate.end()));
}

} // namespace brightchain::utils

#pragma once

#include "brightchain/common.hpp"
#include <mutex>
#include <string>

namespace brightchain::utils {

/**
 * Holds secret bytes XOR-obfuscated with a per-instance keystream
 *
 * Reads return a de-obfuscated copy. After dispose() every read throws
 * BrightChainException(SecureBufferDisposed). Destruction disposes.
 */
class SecureBuffer {
public:
    SecureBuffer();
    explicit SecureBuffer(const bytes& secret);
    SecureBuffer(const byte* secret, size_t len);
    ~SecureBuffer();

    BRIGHTCHAIN_DISALLOW_COPY(SecureBuffer);
    SecureBuffer(SecureBuffer&& other) noexcept;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    /**
     * De-obfuscated copy of the secret
     * @return Secret bytes
     */
    bytes value() const;

    /**
     * Constant-time comparison against candidate bytes
     */
    bool equals(const bytes& candidate) const;

    /**
     * Zero the storage and mark disposed; idempotent
     */
    void dispose();

    bool disposed() const;
    size_t size() const;

    const fixed_bytes<16>& id() const { return id_; }

private:
    void obfuscate(bytes& data) const;
    void check_not_disposed() const;

    fixed_bytes<16> id_{};
    bytes obfuscated_;
    size_t length_ = 0;
    bool disposed_ = false;
    mutable std::mutex mutex_;
};

/**
 * SecureBuffer holding UTF-8 text (mnemonics, passphrases)
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(const std::string& secret);

    std::string value() const;
    bool equals(const std::string& candidate) const;
    void dispose() { buffer_.dispose(); }
    bool disposed() const { return buffer_.disposed(); }
    size_t size() const { return buffer_.size(); }

private:
    SecureBuffer buffer_;
};

} // namespace brightchain::utils

#pragma once

#include "brightchain/error.hpp"
#include "utils/secure_buffer.hpp"
#include <optional>
#include <string>

namespace brightchain::services {
class ECIESService;
struct Recipient;
}

namespace brightchain::identity {

struct GeneratedMember;

/**
 * Participant identity: id, display name, secp256k1 keys
 * The private key, when loaded, lives in a SecureBuffer.
 */
class Member {
public:
    /**
     * New member with a fresh 24-word mnemonic
     */
    static Result<GeneratedMember> generate(const services::ECIESService& ecies, const std::string& name);

    /**
     * Rebuild a member's keys from its mnemonic
     * @return Member, InvalidMnemonic on a bad mnemonic
     */
    static Result<Member> from_mnemonic(const services::ECIESService& ecies, const MemberId& id,
                                        const std::string& name, const std::string& mnemonic);

    /**
     * Public-only member, e.g. a remote recipient
     * @return Member, InvalidSenderPublicKey on a malformed key
     */
    static Result<Member> from_public_key(const services::ECIESService& ecies, const MemberId& id,
                                          const std::string& name, const bytes& public_key);

    Member(Member&&) noexcept = default;
    Member& operator=(Member&&) noexcept = default;
    BRIGHTCHAIN_DISALLOW_COPY(Member);

    const MemberId& id() const { return id_; }
    const std::string& name() const { return name_; }
    const bytes& public_key() const { return public_key_; }

    bool has_private_key() const { return private_key_.has_value() && !private_key_->disposed(); }

    /**
     * @return Private key, PrivateKeyNotLoaded when absent or unloaded
     */
    Result<PrivateKeyBytes> private_key() const;

    /**
     * Dispose the private key; the member stays usable as a recipient
     */
    void unload_private_key();

    services::Recipient as_recipient() const;

    Result<SignatureBytes> sign(const services::ECIESService& ecies, const bytes& data) const;
    Result<bool> verify(const services::ECIESService& ecies, const bytes& data, const bytes& signature) const;

private:
    Member(MemberId id, std::string name, bytes public_key)
        : id_(id), name_(std::move(name)), public_key_(std::move(public_key)) {}

    MemberId id_;
    std::string name_;
    bytes public_key_;
    std::optional<utils::SecureBuffer> private_key_;
};

struct GeneratedMember {
    Member member;
    utils::SecureString mnemonic;
};

} // namespace brightchain::identity

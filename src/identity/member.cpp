#include "member.hpp"
#include "services/ecies_service.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace brightchain::identity {

Result<GeneratedMember> Member::generate(const services::ECIESService& ecies, const std::string& name) {
    BRIGHTCHAIN_TRY_UNWRAP(mnemonic, ecies.generate_new_mnemonic());
    auto member = from_mnemonic(ecies, MemberId::generate(), name, mnemonic);
    utils::SecureString secret(mnemonic);
    OPENSSL_cleanse(&mnemonic[0], mnemonic.size());
    BRIGHTCHAIN_TRY(member);
    return Result<GeneratedMember>::Ok(GeneratedMember{member.take(), std::move(secret)});
}

Result<Member> Member::from_mnemonic(const services::ECIESService& ecies, const MemberId& id,
                                     const std::string& name, const std::string& mnemonic) {
    BRIGHTCHAIN_TRY_UNWRAP(pair, ecies.mnemonic_to_key_pair(mnemonic));
    Member member(id, name, pair.public_key);
    member.private_key_.emplace(pair.private_key.data(), pair.private_key.size());
    OPENSSL_cleanse(pair.private_key.data(), pair.private_key.size());
    return Result<Member>::Ok(std::move(member));
}

Result<Member> Member::from_public_key(const services::ECIESService& ecies, const MemberId& id,
                                       const std::string& name, const bytes& public_key) {
    BRIGHTCHAIN_TRY_UNWRAP(normalized, ecies.normalize_public_key(public_key));
    return Result<Member>::Ok(Member(id, name, std::move(normalized)));
}

Result<PrivateKeyBytes> Member::private_key() const {
    if (!has_private_key()) {
        return Result<PrivateKeyBytes>::Err(ErrorCode::PrivateKeyNotLoaded,
            "Member " + id_.to_string() + " has no private key loaded");
    }
    bytes raw = private_key_->value();
    PrivateKeyBytes key;
    std::copy(raw.begin(), raw.end(), key.begin());
    OPENSSL_cleanse(raw.data(), raw.size());
    return Result<PrivateKeyBytes>::Ok(key);
}

void Member::unload_private_key() {
    if (private_key_) {
        private_key_->dispose();
        private_key_.reset();
    }
}

services::Recipient Member::as_recipient() const {
    return services::Recipient{id_, public_key_};
}

Result<SignatureBytes> Member::sign(const services::ECIESService& ecies, const bytes& data) const {
    BRIGHTCHAIN_TRY_UNWRAP(key, private_key());
    SignatureBytes signature = ecies.sign_message(key, data);
    OPENSSL_cleanse(key.data(), key.size());
    return Result<SignatureBytes>::Ok(signature);
}

Result<bool> Member::verify(const services::ECIESService& ecies, const bytes& data, const bytes& signature) const {
    return ecies.verify_message(public_key_, data, signature);
}

} // namespace brightchain::identity

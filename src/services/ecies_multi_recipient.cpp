#include "ecies_service.hpp"
#include "blocks/block_type.hpp"
#include "crypto/aes_gcm.hpp"
#include "crypto/random.hpp"
#include "identity/member.hpp"
#include "utils/byte_io.hpp"
#include "utils/crc.hpp"
#include "utils/logger.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace brightchain::services {

using namespace constants::ecies;
using utils::ByteReader;
using utils::ByteWriter;

size_t MultiRecipientMessage::serialized_size() const {
    return multiple::DATA_LENGTH_SIZE + multiple::RECIPIENT_COUNT_SIZE +
           recipient_ids.size() * (multiple::RECIPIENT_ID_SIZE + multiple::ENCRYPTED_KEY_SIZE) +
           IV_LENGTH + AUTH_TAG_LENGTH + encrypted_message.size();
}

bytes MultiRecipientMessage::serialize() const {
    ByteWriter writer(serialized_size());
    writer.write_u64(data_length);
    writer.write_u16(static_cast<uint16_t>(recipient_ids.size()));
    for (const auto& id : recipient_ids) {
        writer.write_bytes(id.id);
    }
    for (const auto& key : recipient_keys) {
        writer.write_bytes(key);
    }
    writer.write_bytes(iv);
    writer.write_bytes(auth_tag);
    writer.write_bytes(encrypted_message);
    return writer.take();
}

Result<MultiRecipientMessage> MultiRecipientMessage::parse(const byte* data, size_t len) {
    constexpr size_t fixed_header = multiple::DATA_LENGTH_SIZE + multiple::RECIPIENT_COUNT_SIZE;
    if (len < fixed_header) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::DataTooShort, "Multi-recipient header truncated");
    }

    ByteReader reader(data, len);
    MultiRecipientMessage message;
    message.data_length = reader.read_u64();
    const uint16_t count = reader.read_u16();
    if (count == 0) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::InvalidMultiRecipientHeader,
                                                  "Recipient count is zero");
    }

    const size_t keys_size = static_cast<size_t>(count) * (multiple::RECIPIENT_ID_SIZE + multiple::ENCRYPTED_KEY_SIZE);
    if (reader.remaining() < keys_size + IV_LENGTH + AUTH_TAG_LENGTH) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::DataTooShort,
            "Multi-recipient header for " + std::to_string(count) + " recipients truncated");
    }
    // Ciphertext covers the CRC and the plaintext
    const size_t after_header = reader.remaining() - keys_size - IV_LENGTH - AUTH_TAG_LENGTH;
    if (message.data_length > after_header || after_header - message.data_length < multiple::CRC16_SIZE) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::DataTooShort,
            "Declared data length " + std::to_string(message.data_length) + " exceeds the payload");
    }

    message.recipient_ids.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        message.recipient_ids.emplace_back(reader.read_fixed<multiple::RECIPIENT_ID_SIZE>());
    }
    message.recipient_keys.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        message.recipient_keys.push_back(reader.read_bytes(multiple::ENCRYPTED_KEY_SIZE));
    }
    message.iv = reader.read_fixed<IV_LENGTH>();
    message.auth_tag = reader.read_fixed<AUTH_TAG_LENGTH>();
    message.encrypted_message = reader.read_bytes(multiple::CRC16_SIZE + static_cast<size_t>(message.data_length));
    return Result<MultiRecipientMessage>::Ok(std::move(message));
}

size_t ECIESService::multi_recipient_overhead(size_t recipient_count) {
    return multiple::DATA_LENGTH_SIZE + multiple::RECIPIENT_COUNT_SIZE +
           recipient_count * (multiple::RECIPIENT_ID_SIZE + multiple::ENCRYPTED_KEY_SIZE) +
           IV_LENGTH + AUTH_TAG_LENGTH + multiple::CRC16_SIZE;
}

Result<MultiRecipientMessage> ECIESService::encrypt_multiple(const std::vector<Recipient>& recipients,
                                                             const bytes& message) const {
    if (recipients.empty()) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::InvalidArgument, "At least one recipient required");
    }
    if (recipients.size() > max_recipients_) {
        return Result<MultiRecipientMessage>::Err(ErrorCode::TooManyRecipients,
            std::to_string(recipients.size()) + " recipients exceed the maximum of " +
            std::to_string(max_recipients_));
    }

    bytes symmetric_key = crypto::Random::generate(SYMMETRIC_KEY_LENGTH);

    MultiRecipientMessage out;
    out.data_length = message.size();
    out.recipient_ids.reserve(recipients.size());
    out.recipient_keys.reserve(recipients.size());
    for (const auto& recipient : recipients) {
        auto wrapped = encrypt(recipient.public_key, symmetric_key);
        if (wrapped.is_err()) {
            OPENSSL_cleanse(symmetric_key.data(), symmetric_key.size());
            return wrapped.error();
        }
        out.recipient_ids.push_back(recipient.id);
        out.recipient_keys.push_back(wrapped.take());
    }

    bytes framed;
    framed.reserve(multiple::CRC16_SIZE + message.size());
    const uint16_t crc = utils::crc16(message);
    framed.push_back(static_cast<byte>(crc >> 8));
    framed.push_back(static_cast<byte>(crc));
    framed.insert(framed.end(), message.begin(), message.end());

    crypto::Random::generate_into(out.iv.data(), out.iv.size());
    auto sealed = crypto::AesGcm::encrypt(symmetric_key.data(), out.iv.data(), framed.data(), framed.size());
    OPENSSL_cleanse(symmetric_key.data(), symmetric_key.size());
    OPENSSL_cleanse(framed.data(), framed.size());

    out.auth_tag = sealed.tag;
    out.encrypted_message = std::move(sealed.ciphertext);

    BRIGHTCHAIN_LOG_DEBUG("Encrypted {} bytes for {} recipients", message.size(), recipients.size());
    return Result<MultiRecipientMessage>::Ok(std::move(out));
}

Result<bytes> ECIESService::decrypt_multiple_for_recipient(const MultiRecipientMessage& message,
                                                           const MemberId& recipient_id,
                                                           const PrivateKeyBytes* private_key) const {
    auto it = std::find(message.recipient_ids.begin(), message.recipient_ids.end(), recipient_id);
    if (it == message.recipient_ids.end()) {
        return Result<bytes>::Err(ErrorCode::RecipientNotFound,
            "Recipient " + recipient_id.to_string() + " is not addressed by this message");
    }
    if (private_key == nullptr) {
        return Result<bytes>::Err(ErrorCode::PrivateKeyNotLoaded, "Recipient private key is not loaded");
    }
    const size_t index = static_cast<size_t>(it - message.recipient_ids.begin());
    if (index >= message.recipient_keys.size()) {
        return Result<bytes>::Err(ErrorCode::InvalidMultiRecipientHeader, "Recipient key list is shorter than ids");
    }

    BRIGHTCHAIN_TRY_UNWRAP(symmetric_key, decrypt(*private_key, message.recipient_keys[index]));
    if (symmetric_key.size() != SYMMETRIC_KEY_LENGTH) {
        OPENSSL_cleanse(symmetric_key.data(), symmetric_key.size());
        return Result<bytes>::Err(ErrorCode::DecryptionFailed, "Unwrapped key has the wrong length");
    }

    auto framed = crypto::AesGcm::decrypt(symmetric_key.data(), message.iv.data(), message.encrypted_message.data(),
                                          message.encrypted_message.size(), message.auth_tag.data());
    OPENSSL_cleanse(symmetric_key.data(), symmetric_key.size());
    if (!framed) {
        return Result<bytes>::Err(ErrorCode::DecryptionFailed, "Authentication failed");
    }
    if (framed->size() < multiple::CRC16_SIZE) {
        return Result<bytes>::Err(ErrorCode::InvalidMessageCrc, "Payload too short for its CRC");
    }

    const uint16_t expected = static_cast<uint16_t>(((*framed)[0] << 8) | (*framed)[1]);
    bytes plaintext(framed->begin() + multiple::CRC16_SIZE, framed->end());
    if (utils::crc16(plaintext) != expected) {
        return Result<bytes>::Err(ErrorCode::InvalidMessageCrc, "Payload CRC mismatch");
    }
    return Result<bytes>::Ok(std::move(plaintext));
}

Result<bytes> ECIESService::decrypt_multiple_for_recipient(const MultiRecipientMessage& message,
                                                           const identity::Member& recipient) const {
    if (!recipient.has_private_key()) {
        return decrypt_multiple_for_recipient(message, recipient.id(), nullptr);
    }
    BRIGHTCHAIN_TRY_UNWRAP(key, recipient.private_key());
    auto plaintext = decrypt_multiple_for_recipient(message, recipient.id(), &key);
    OPENSSL_cleanse(key.data(), key.size());
    return plaintext;
}

Result<bytes> ECIESService::encrypt_multiple_to_block(const std::vector<Recipient>& recipients, const bytes& message,
                                                      uint32_t block_size) const {
    if (recipients.size() > max_recipients_) {
        return Result<bytes>::Err(ErrorCode::TooManyRecipients,
            std::to_string(recipients.size()) + " recipients exceed the maximum of " +
            std::to_string(max_recipients_));
    }
    const size_t needed = constants::block_header::PREFIX_SIZE + multi_recipient_overhead(recipients.size()) +
                          message.size();
    if (needed > block_size) {
        return Result<bytes>::Err(ErrorCode::DataTooLarge,
            std::to_string(message.size()) + " bytes for " + std::to_string(recipients.size()) +
            " recipients do not fit a " + std::to_string(block_size) + " byte block");
    }

    BRIGHTCHAIN_TRY_UNWRAP(encrypted, encrypt_multiple(recipients, message));

    ByteWriter writer(block_size);
    writer.write_bytes(blocks::make_structured_prefix(blocks::StructuredBlockType::MultiEncrypted,
                                                      multiple::LAYOUT_VERSION));
    writer.write_bytes(encrypted.serialize());
    bytes block = writer.take();

    const size_t used = block.size();
    block.resize(block_size);
    crypto::Random::generate_into(block.data() + used, block_size - used);
    return Result<bytes>::Ok(std::move(block));
}

Result<bytes> ECIESService::decrypt_multiple_block_for_recipient(const bytes& block,
                                                                 const identity::Member& recipient) const {
    BRIGHTCHAIN_TRY_UNWRAP(prefix, blocks::parse_structured_prefix(block));
    if (prefix.type != blocks::StructuredBlockType::MultiEncrypted) {
        return Result<bytes>::Err(ErrorCode::InvalidBlockType, "Block is not multi-encrypted");
    }
    if (prefix.version != multiple::LAYOUT_VERSION) {
        return Result<bytes>::Err(ErrorCode::UnsupportedLayoutVersion,
            "Multi-recipient layout version " + std::to_string(prefix.version) + " is not supported");
    }
    BRIGHTCHAIN_TRY_UNWRAP(message, MultiRecipientMessage::parse(block.data() + constants::block_header::PREFIX_SIZE,
                                                                 block.size() - constants::block_header::PREFIX_SIZE));
    return decrypt_multiple_for_recipient(message, recipient);
}

} // namespace brightchain::services

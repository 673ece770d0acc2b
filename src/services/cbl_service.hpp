#pragma once

#include "checksum_service.hpp"
#include "ecies_service.hpp"
#include "utils/config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace brightchain::identity {
class Member;
}

namespace brightchain::services {

/**
 * File metadata carried by an extended CBL
 */
struct ExtendedCblMetadata {
    std::string file_name;
    std::string mime_type;
};

/**
 * Parsed CBL header fields
 */
struct CblHeader {
    MemberId creator_id;
    uint64_t date_created_ms = 0;
    uint32_t address_count = 0;
    uint8_t tuple_size = 0;
    uint64_t original_data_length = 0;
    Checksum original_data_checksum;
    std::optional<ExtendedCblMetadata> extended;
    SignatureBytes signature{};
    size_t signature_offset = 0;
    size_t header_length = 0;

    bool is_extended() const { return extended.has_value(); }
};

/**
 * Parsed SuperCBL header fields
 */
struct SuperCblHeader {
    MemberId creator_id;
    uint64_t date_created_ms = 0;
    uint32_t sub_cbl_count = 0;
    uint32_t total_block_count = 0;
    uint16_t depth = 0;
    uint64_t original_data_length = 0;
    Checksum original_data_checksum;
    SignatureBytes signature{};
    size_t signature_offset = 0;
    size_t header_length = 0;
};

/**
 * Builds and parses CBL and SuperCBL blocks
 *
 * CBL: prefix | creatorId | date u64 | addressCount u32 | tupleSize u8 | originalDataLength u64
 *      | originalDataChecksum | isExtended u8 | [nameLen u16 | name | mimeLen u8 | mime]
 *      | signature | addresses
 * SuperCBL: prefix | creatorId | date u64 | subCblCount u32 | totalBlockCount u32 | depth u16
 *      | originalDataLength u64 | originalDataChecksum | signature | sub-CBL checksums
 *
 * The signature covers SHA3-512(header before the signature | blockSize u32 | addresses).
 */
class CBLService {
public:
    static constexpr size_t BASE_HEADER_SIZE = constants::block_header::PREFIX_SIZE + constants::MEMBER_ID_LENGTH +
        constants::UINT64_SIZE + constants::UINT32_SIZE + constants::UINT8_SIZE + constants::UINT64_SIZE +
        constants::CHECKSUM_LENGTH + constants::UINT8_SIZE + constants::ecies::SIGNATURE_LENGTH;
    static constexpr size_t SUPER_HEADER_SIZE = constants::block_header::PREFIX_SIZE + constants::MEMBER_ID_LENGTH +
        constants::UINT64_SIZE + constants::UINT32_SIZE + constants::UINT32_SIZE + constants::UINT16_SIZE +
        constants::UINT64_SIZE + constants::CHECKSUM_LENGTH + constants::ecies::SIGNATURE_LENGTH;

    CBLService(const ECIESService& ecies, const ChecksumService& checksums, const utils::EngineSettings& settings);

    static size_t header_size(const std::optional<ExtendedCblMetadata>& extended = std::nullopt);

    /**
     * Addresses one CBL can carry, aligned down to the tuple size
     * @param encryption_overhead Bytes the block's encryption consumes
     * @return Capacity, 0 when fewer than 4 addresses fit
     */
    size_t calculate_cbl_address_capacity(uint32_t block_size, size_t encryption_overhead = 0,
                                          const std::optional<ExtendedCblMetadata>& extended = std::nullopt) const;

    /**
     * Sub-CBL checksums one SuperCBL can carry
     */
    size_t calculate_super_cbl_capacity(uint32_t block_size, size_t encryption_overhead = 0) const;

    Result<void> validate_file_name(const std::string& file_name) const;
    Result<void> validate_mime_type(const std::string& mime_type) const;

    /**
     * Build and sign a CBL; returns header followed by the addresses
     */
    Result<bytes> make_cbl_header(const identity::Member& creator, uint64_t date_created_ms,
                                  uint32_t address_count, uint8_t tuple_size, uint64_t original_data_length,
                                  const Checksum& original_data_checksum, const bytes& address_list,
                                  uint32_t block_size,
                                  const std::optional<ExtendedCblMetadata>& extended = std::nullopt) const;

    /**
     * Build and sign a SuperCBL; returns header followed by the sub-CBL checksums
     */
    Result<bytes> make_super_cbl_header(const identity::Member& creator, uint64_t date_created_ms,
                                        uint32_t sub_cbl_count, uint32_t total_block_count, uint32_t depth,
                                        uint64_t original_data_length, const Checksum& original_data_checksum,
                                        const std::vector<Checksum>& sub_cbl_checksums, uint32_t block_size) const;

    /**
     * Structural parse; with creator and block size the signature is checked too
     * @return Header, InvalidSignature when the signature does not match
     */
    Result<CblHeader> parse_cbl_header(const bytes& data, const identity::Member* creator = nullptr,
                                       std::optional<uint32_t> block_size = std::nullopt) const;
    Result<SuperCblHeader> parse_super_cbl_header(const bytes& data, const identity::Member* creator = nullptr,
                                                  std::optional<uint32_t> block_size = std::nullopt) const;

    /**
     * Addresses of a CBL or sub-CBL checksums of a SuperCBL, in stored order
     */
    Result<std::vector<Checksum>> address_list(const bytes& data) const;

    static bool is_super_cbl(const bytes& data);
    static bool is_extended(const bytes& data);

private:
    Result<void> check_file_size(uint64_t original_data_length) const;
    bytes signed_digest(const byte* header, size_t header_len, uint32_t block_size,
                        const byte* addresses, size_t addresses_len) const;
    Result<void> verify_signature(const bytes& data, size_t signature_offset, size_t header_length,
                                  size_t address_count, const SignatureBytes& signature,
                                  const identity::Member& creator, uint32_t block_size) const;

    const ECIESService& ecies_;
    const ChecksumService& checksums_;
    size_t tuple_size_;
    size_t tuple_min_size_;
    size_t tuple_max_size_;
    uint64_t max_file_size_;
};

} // namespace brightchain::services

#include "cbl_service.hpp"
#include "blocks/block_type.hpp"
#include "identity/member.hpp"
#include "utils/byte_io.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace brightchain::services {

using blocks::StructuredBlockType;
using utils::ByteReader;
using utils::ByteWriter;

namespace {

constexpr const char* FORBIDDEN_FILE_NAME_CHARS = "<>:\"/\\|?*";

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool mime_token(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    return std::all_of(token.begin(), token.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

} // namespace

CBLService::CBLService(const ECIESService& ecies, const ChecksumService& checksums,
                       const utils::EngineSettings& settings)
    : ecies_(ecies),
      checksums_(checksums),
      tuple_size_(settings.tuple_size),
      tuple_min_size_(settings.tuple_min_size),
      tuple_max_size_(settings.tuple_max_size),
      max_file_size_(settings.max_file_size) {}

size_t CBLService::header_size(const std::optional<ExtendedCblMetadata>& extended) {
    size_t size = BASE_HEADER_SIZE;
    if (extended) {
        size += constants::UINT16_SIZE + extended->file_name.size() + constants::UINT8_SIZE +
                extended->mime_type.size();
    }
    return size;
}

size_t CBLService::calculate_cbl_address_capacity(uint32_t block_size, size_t encryption_overhead,
                                                  const std::optional<ExtendedCblMetadata>& extended) const {
    const size_t overhead = header_size(extended) + encryption_overhead;
    if (block_size <= overhead || tuple_size_ == 0) {
        return 0;
    }
    size_t capacity = (block_size - overhead) / constants::CHECKSUM_LENGTH;
    capacity -= capacity % tuple_size_;
    return capacity < constants::cbl::MIN_ADDRESS_CAPACITY ? 0 : capacity;
}

size_t CBLService::calculate_super_cbl_capacity(uint32_t block_size, size_t encryption_overhead) const {
    const size_t overhead = SUPER_HEADER_SIZE + encryption_overhead;
    if (block_size <= overhead) {
        return 0;
    }
    return (block_size - overhead) / constants::CHECKSUM_LENGTH;
}

Result<void> CBLService::validate_file_name(const std::string& file_name) const {
    if (file_name.empty()) {
        return Result<void>::Err(ErrorCode::InvalidFileName, "File name is required");
    }
    if (is_space(file_name.front()) || is_space(file_name.back())) {
        return Result<void>::Err(ErrorCode::InvalidFileName, "File name has surrounding whitespace");
    }
    if (file_name.size() > constants::cbl::MAX_FILE_NAME_LENGTH) {
        return Result<void>::Err(ErrorCode::InvalidFileName,
            "File name exceeds " + std::to_string(constants::cbl::MAX_FILE_NAME_LENGTH) + " characters");
    }
    if (file_name.find_first_of(FORBIDDEN_FILE_NAME_CHARS) != std::string::npos) {
        return Result<void>::Err(ErrorCode::InvalidFileName, "File name contains a reserved character");
    }
    for (char c : file_name) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) {
            return Result<void>::Err(ErrorCode::InvalidFileName, "File name contains a control character");
        }
    }
    if (file_name == "..") {
        return Result<void>::Err(ErrorCode::InvalidFileName, "File name is a path traversal");
    }
    return Result<void>::Ok();
}

Result<void> CBLService::validate_mime_type(const std::string& mime_type) const {
    if (mime_type.empty()) {
        return Result<void>::Err(ErrorCode::InvalidMimeType, "MIME type is required");
    }
    if (is_space(mime_type.front()) || is_space(mime_type.back())) {
        return Result<void>::Err(ErrorCode::InvalidMimeType, "MIME type has surrounding whitespace");
    }
    if (std::any_of(mime_type.begin(), mime_type.end(), [](char c) { return c >= 'A' && c <= 'Z'; })) {
        return Result<void>::Err(ErrorCode::InvalidMimeType, "MIME type must be lowercase");
    }
    if (mime_type.size() > constants::cbl::MAX_MIME_TYPE_LENGTH) {
        return Result<void>::Err(ErrorCode::InvalidMimeType,
            "MIME type exceeds " + std::to_string(constants::cbl::MAX_MIME_TYPE_LENGTH) + " characters");
    }
    const auto slash = mime_type.find('/');
    if (slash == std::string::npos || !mime_token(mime_type.substr(0, slash)) ||
        !mime_token(mime_type.substr(slash + 1))) {
        return Result<void>::Err(ErrorCode::InvalidMimeType, "MIME type must look like type/subtype");
    }
    return Result<void>::Ok();
}

Result<void> CBLService::check_file_size(uint64_t original_data_length) const {
    if (original_data_length > constants::cbl::MAX_INPUT_FILE_SIZE) {
        return Result<void>::Err(ErrorCode::FileSizeTooLarge,
            "File size " + std::to_string(original_data_length) + " exceeds 2^53 - 1");
    }
    if (original_data_length > max_file_size_) {
        return Result<void>::Err(ErrorCode::FileSizeTooLargeForNode,
            "File size " + std::to_string(original_data_length) + " exceeds this node's limit of " +
            std::to_string(max_file_size_));
    }
    return Result<void>::Ok();
}

bytes CBLService::signed_digest(const byte* header, size_t header_len, uint32_t block_size,
                                const byte* addresses, size_t addresses_len) const {
    ByteWriter writer(header_len + constants::UINT32_SIZE + addresses_len);
    writer.write_bytes(header, header_len);
    writer.write_u32(block_size);
    writer.write_bytes(addresses, addresses_len);
    return checksums_.calculate(writer.data()).to_bytes();
}

Result<bytes> CBLService::make_cbl_header(const identity::Member& creator, uint64_t date_created_ms,
                                          uint32_t address_count, uint8_t tuple_size, uint64_t original_data_length,
                                          const Checksum& original_data_checksum, const bytes& address_list,
                                          uint32_t block_size,
                                          const std::optional<ExtendedCblMetadata>& extended) const {
    if (tuple_size < tuple_min_size_ || tuple_size > tuple_max_size_) {
        return Result<bytes>::Err(ErrorCode::InvalidTupleSize,
            "Tuple size " + std::to_string(tuple_size) + " outside [" + std::to_string(tuple_min_size_) + ", " +
            std::to_string(tuple_max_size_) + "]");
    }
    if (address_list.size() != static_cast<size_t>(address_count) * constants::CHECKSUM_LENGTH) {
        return Result<bytes>::Err(ErrorCode::InvalidCBLAddressCount,
            "Address list holds " + std::to_string(address_list.size()) + " bytes for " +
            std::to_string(address_count) + " addresses");
    }
    if (address_count % tuple_size != 0) {
        return Result<bytes>::Err(ErrorCode::InvalidCBLAddressCount,
            "Address count " + std::to_string(address_count) + " is not a multiple of tuple size " +
            std::to_string(tuple_size));
    }
    BRIGHTCHAIN_TRY(check_file_size(original_data_length));
    if (extended) {
        BRIGHTCHAIN_TRY(validate_file_name(extended->file_name));
        BRIGHTCHAIN_TRY(validate_mime_type(extended->mime_type));
    }
    const size_t total = header_size(extended) + address_list.size();
    if (total > block_size) {
        return Result<bytes>::Err(ErrorCode::InsufficientCapacity,
            "CBL of " + std::to_string(total) + " bytes exceeds block size " + std::to_string(block_size));
    }

    const auto type = extended ? StructuredBlockType::ExtendedConstituentBlockList
                               : StructuredBlockType::ConstituentBlockList;
    ByteWriter writer(total);
    writer.write_bytes(blocks::make_structured_prefix(type));
    writer.write_bytes(creator.id().id);
    writer.write_u64(date_created_ms);
    writer.write_u32(address_count);
    writer.write_u8(tuple_size);
    writer.write_u64(original_data_length);
    writer.write_bytes(original_data_checksum.value);
    writer.write_u8(extended ? 1 : 0);
    if (extended) {
        writer.write_u16(static_cast<uint16_t>(extended->file_name.size()));
        writer.write_string(extended->file_name);
        writer.write_u8(static_cast<uint8_t>(extended->mime_type.size()));
        writer.write_string(extended->mime_type);
    }

    SignatureBytes signature{};
    if (creator.has_private_key()) {
        bytes digest = signed_digest(writer.data().data(), writer.size(), block_size,
                                     address_list.data(), address_list.size());
        BRIGHTCHAIN_TRY_UNWRAP(signed_value, creator.sign(ecies_, digest));
        signature = signed_value;
    }
    writer.write_bytes(signature);
    writer.write_bytes(address_list);

    BRIGHTCHAIN_LOG_DEBUG("Built CBL with {} addresses for {} bytes", address_count, original_data_length);
    return Result<bytes>::Ok(writer.take());
}

Result<bytes> CBLService::make_super_cbl_header(const identity::Member& creator, uint64_t date_created_ms,
                                                uint32_t sub_cbl_count, uint32_t total_block_count, uint32_t depth,
                                                uint64_t original_data_length,
                                                const Checksum& original_data_checksum,
                                                const std::vector<Checksum>& sub_cbl_checksums,
                                                uint32_t block_size) const {
    if (depth < 1 || depth > constants::cbl::MAX_DEPTH) {
        return Result<bytes>::Err(ErrorCode::InvalidDepth,
            "Depth " + std::to_string(depth) + " outside [1, 65535]");
    }
    if (sub_cbl_count != sub_cbl_checksums.size()) {
        return Result<bytes>::Err(ErrorCode::SubCBLCountChecksumMismatch,
            "Sub-CBL count " + std::to_string(sub_cbl_count) + " but " +
            std::to_string(sub_cbl_checksums.size()) + " checksums");
    }
    BRIGHTCHAIN_TRY(check_file_size(original_data_length));

    const size_t total = SUPER_HEADER_SIZE + sub_cbl_checksums.size() * constants::CHECKSUM_LENGTH;
    if (total > block_size) {
        return Result<bytes>::Err(ErrorCode::InsufficientCapacity,
            "SuperCBL of " + std::to_string(total) + " bytes exceeds block size " + std::to_string(block_size));
    }

    ByteWriter addresses(sub_cbl_checksums.size() * constants::CHECKSUM_LENGTH);
    for (const auto& checksum : sub_cbl_checksums) {
        addresses.write_bytes(checksum.value);
    }

    ByteWriter writer(total);
    writer.write_bytes(blocks::make_structured_prefix(StructuredBlockType::SuperConstituentBlockList));
    writer.write_bytes(creator.id().id);
    writer.write_u64(date_created_ms);
    writer.write_u32(sub_cbl_count);
    writer.write_u32(total_block_count);
    writer.write_u16(static_cast<uint16_t>(depth));
    writer.write_u64(original_data_length);
    writer.write_bytes(original_data_checksum.value);

    SignatureBytes signature{};
    if (creator.has_private_key()) {
        bytes digest = signed_digest(writer.data().data(), writer.size(), block_size,
                                     addresses.data().data(), addresses.size());
        BRIGHTCHAIN_TRY_UNWRAP(signed_value, creator.sign(ecies_, digest));
        signature = signed_value;
    }
    writer.write_bytes(signature);
    writer.write_bytes(addresses.data());
    return Result<bytes>::Ok(writer.take());
}

Result<void> CBLService::verify_signature(const bytes& data, size_t signature_offset, size_t header_length,
                                          size_t address_count, const SignatureBytes& signature,
                                          const identity::Member& creator, uint32_t block_size) const {
    bytes digest = signed_digest(data.data(), signature_offset, block_size, data.data() + header_length,
                                 address_count * constants::CHECKSUM_LENGTH);
    BRIGHTCHAIN_TRY_UNWRAP(valid, creator.verify(ecies_, digest, bytes(signature.begin(), signature.end())));
    if (!valid) {
        return Result<void>::Err(ErrorCode::InvalidSignature, "CBL signature does not match creator");
    }
    return Result<void>::Ok();
}

Result<CblHeader> CBLService::parse_cbl_header(const bytes& data, const identity::Member* creator,
                                               std::optional<uint32_t> block_size) const {
    using R = Result<CblHeader>;
    BRIGHTCHAIN_TRY_UNWRAP(prefix, blocks::parse_structured_prefix(data));
    if (prefix.type != StructuredBlockType::ConstituentBlockList &&
        prefix.type != StructuredBlockType::ExtendedConstituentBlockList) {
        return R::Err(ErrorCode::InvalidBlockType, "Block is not a CBL");
    }
    if (data.size() < BASE_HEADER_SIZE) {
        return R::Err(ErrorCode::DataTooShort, "CBL header truncated");
    }

    ByteReader reader(data, constants::block_header::PREFIX_SIZE);
    CblHeader header;
    header.creator_id = MemberId(reader.read_fixed<constants::MEMBER_ID_LENGTH>());
    header.date_created_ms = reader.read_u64();
    header.address_count = reader.read_u32();
    header.tuple_size = reader.read_u8();
    header.original_data_length = reader.read_u64();
    header.original_data_checksum = Checksum(reader.read_fixed<constants::CHECKSUM_LENGTH>());
    const uint8_t extended_flag = reader.read_u8();

    if (header.tuple_size < tuple_min_size_ || header.tuple_size > tuple_max_size_) {
        return R::Err(ErrorCode::InvalidTupleSize,
            "CBL tuple size " + std::to_string(header.tuple_size) + " is out of range");
    }
    if (header.address_count % header.tuple_size != 0) {
        return R::Err(ErrorCode::InvalidCBLAddressCount,
            "Address count " + std::to_string(header.address_count) + " is not a multiple of the tuple size");
    }
    if (header.original_data_length > constants::cbl::MAX_INPUT_FILE_SIZE) {
        return R::Err(ErrorCode::FileSizeTooLarge, "Declared file size exceeds 2^53 - 1");
    }
    const bool extended_type = prefix.type == StructuredBlockType::ExtendedConstituentBlockList;
    if (extended_flag > 1 || (extended_flag == 1) != extended_type) {
        return R::Err(ErrorCode::InvalidCBLHeader, "Extended flag disagrees with the block type");
    }

    if (extended_flag == 1) {
        if (reader.remaining() < constants::UINT16_SIZE) {
            return R::Err(ErrorCode::DataTooShort, "Extended CBL header truncated");
        }
        ExtendedCblMetadata metadata;
        const uint16_t name_length = reader.read_u16();
        if (reader.remaining() < static_cast<size_t>(name_length) + constants::UINT8_SIZE) {
            return R::Err(ErrorCode::DataTooShort, "Extended CBL file name truncated");
        }
        metadata.file_name = reader.read_string(name_length);
        const uint8_t mime_length = reader.read_u8();
        if (reader.remaining() < mime_length) {
            return R::Err(ErrorCode::DataTooShort, "Extended CBL MIME type truncated");
        }
        metadata.mime_type = reader.read_string(mime_length);
        BRIGHTCHAIN_TRY(validate_file_name(metadata.file_name));
        BRIGHTCHAIN_TRY(validate_mime_type(metadata.mime_type));
        header.extended = std::move(metadata);
    }

    const size_t addresses_size = static_cast<size_t>(header.address_count) * constants::CHECKSUM_LENGTH;
    if (reader.remaining() < constants::ecies::SIGNATURE_LENGTH + addresses_size) {
        return R::Err(ErrorCode::DataTooShort,
            "CBL declares " + std::to_string(header.address_count) + " addresses beyond its length");
    }
    header.signature_offset = reader.offset();
    header.signature = reader.read_fixed<constants::ecies::SIGNATURE_LENGTH>();
    header.header_length = reader.offset();

    if (creator != nullptr && block_size) {
        if (creator->id() != header.creator_id) {
            return R::Err(ErrorCode::InvalidSignature, "CBL creator id does not match the supplied creator");
        }
        BRIGHTCHAIN_TRY(verify_signature(data, header.signature_offset, header.header_length, header.address_count,
                                         header.signature, *creator, *block_size));
    }
    return R::Ok(std::move(header));
}

Result<SuperCblHeader> CBLService::parse_super_cbl_header(const bytes& data, const identity::Member* creator,
                                                          std::optional<uint32_t> block_size) const {
    using R = Result<SuperCblHeader>;
    BRIGHTCHAIN_TRY_UNWRAP(prefix, blocks::parse_structured_prefix(data));
    if (prefix.type != StructuredBlockType::SuperConstituentBlockList) {
        return R::Err(ErrorCode::InvalidBlockType, "Block is not a SuperCBL");
    }
    if (data.size() < SUPER_HEADER_SIZE) {
        return R::Err(ErrorCode::DataTooShort, "SuperCBL header truncated");
    }

    ByteReader reader(data, constants::block_header::PREFIX_SIZE);
    SuperCblHeader header;
    header.creator_id = MemberId(reader.read_fixed<constants::MEMBER_ID_LENGTH>());
    header.date_created_ms = reader.read_u64();
    header.sub_cbl_count = reader.read_u32();
    header.total_block_count = reader.read_u32();
    header.depth = reader.read_u16();
    header.original_data_length = reader.read_u64();
    header.original_data_checksum = Checksum(reader.read_fixed<constants::CHECKSUM_LENGTH>());

    if (header.depth == 0) {
        return R::Err(ErrorCode::InvalidDepth, "SuperCBL depth must be at least 1");
    }
    if (header.original_data_length > constants::cbl::MAX_INPUT_FILE_SIZE) {
        return R::Err(ErrorCode::FileSizeTooLarge, "Declared file size exceeds 2^53 - 1");
    }
    const size_t addresses_size = static_cast<size_t>(header.sub_cbl_count) * constants::CHECKSUM_LENGTH;
    if (reader.remaining() < constants::ecies::SIGNATURE_LENGTH + addresses_size) {
        return R::Err(ErrorCode::DataTooShort,
            "SuperCBL declares " + std::to_string(header.sub_cbl_count) + " sub-CBLs beyond its length");
    }
    header.signature_offset = reader.offset();
    header.signature = reader.read_fixed<constants::ecies::SIGNATURE_LENGTH>();
    header.header_length = reader.offset();

    if (creator != nullptr && block_size) {
        if (creator->id() != header.creator_id) {
            return R::Err(ErrorCode::InvalidSignature, "SuperCBL creator id does not match the supplied creator");
        }
        BRIGHTCHAIN_TRY(verify_signature(data, header.signature_offset, header.header_length, header.sub_cbl_count,
                                         header.signature, *creator, *block_size));
    }
    return R::Ok(std::move(header));
}

Result<std::vector<Checksum>> CBLService::address_list(const bytes& data) const {
    size_t offset = 0;
    size_t count = 0;
    if (is_super_cbl(data)) {
        BRIGHTCHAIN_TRY_UNWRAP(header, parse_super_cbl_header(data));
        offset = header.header_length;
        count = header.sub_cbl_count;
    } else {
        BRIGHTCHAIN_TRY_UNWRAP(header, parse_cbl_header(data));
        offset = header.header_length;
        count = header.address_count;
    }

    std::vector<Checksum> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Checksum checksum;
        std::memcpy(checksum.value.data(), data.data() + offset + i * constants::CHECKSUM_LENGTH,
                    constants::CHECKSUM_LENGTH);
        out.push_back(checksum);
    }
    return Result<std::vector<Checksum>>::Ok(std::move(out));
}

bool CBLService::is_super_cbl(const bytes& data) {
    return data.size() > 1 && data[0] == constants::block_header::MAGIC_PREFIX &&
           data[1] == static_cast<byte>(StructuredBlockType::SuperConstituentBlockList);
}

bool CBLService::is_extended(const bytes& data) {
    return data.size() > 1 && data[0] == constants::block_header::MAGIC_PREFIX &&
           data[1] == static_cast<byte>(StructuredBlockType::ExtendedConstituentBlockList);
}

} // namespace brightchain::services

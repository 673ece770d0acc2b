#include "block_service.hpp"
#include "brightchain/time_utils.hpp"
#include "crypto/random.hpp"
#include "identity/member.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace brightchain::services {

using blocks::Block;
using blocks::BlockType;

BlockService::BlockService(const ECIESService& ecies, const ChecksumService& checksums,
                           const XorTupleService& tuples, const CBLService& cbl, storage::IBlockStore& store)
    : ecies_(ecies), checksums_(checksums), tuples_(tuples), cbl_(cbl), store_(store) {}

size_t BlockService::chunk_capacity(size_t recipient_count) const {
    const size_t overhead = ECIESService::multi_recipient_overhead(recipient_count) +
                            constants::block_header::PREFIX_SIZE;
    return block_bytes() > overhead ? block_bytes() - overhead : 0;
}

Result<std::vector<Checksum>> BlockService::store_chunks(const bytes& data, const std::vector<Recipient>& recipients,
                                                         const EncodeOptions& options) const {
    using R = Result<std::vector<Checksum>>;
    const size_t capacity = chunk_capacity(recipients.size());
    const size_t tuple_size = tuples_.tuple_size();
    const size_t chunk_count = std::max<size_t>(1, (data.size() + capacity - 1) / capacity);
    const auto size_class = store_.block_size();

    std::vector<Checksum> addresses;
    addresses.reserve(chunk_count * tuple_size);
    for (size_t c = 0; c < chunk_count; ++c) {
        const size_t offset = c * capacity;
        const size_t length = std::min(capacity, data.size() - std::min(offset, data.size()));
        bytes chunk(capacity, 0);
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), length, chunk.begin());

        std::vector<Block> members;
        members.reserve(tuple_size);
        BRIGHTCHAIN_TRY_UNWRAP(data_block, Block::create(size_class, BlockType::RawData, std::move(chunk)));
        members.push_back(std::move(data_block));
        for (size_t r = 1; r < tuple_size; ++r) {
            BRIGHTCHAIN_TRY_UNWRAP(randomizer,
                Block::create(size_class, BlockType::Random, crypto::Random::generate(capacity)));
            members.push_back(std::move(randomizer));
        }
        BRIGHTCHAIN_TRY_UNWRAP(whitened, tuples_.whiten(members));
        // The tuple stored is the whitened block followed by the randomizers
        members[0] = std::move(whitened);

        std::vector<Checksum> tuple_ids;
        tuple_ids.reserve(tuple_size);
        for (const auto& member : members) {
            BRIGHTCHAIN_TRY_UNWRAP(sealed, ecies_.encrypt_multiple_to_block(recipients, member.data(), block_bytes()));
            BRIGHTCHAIN_TRY_UNWRAP(block, Block::create(size_class, BlockType::MultiEncrypted, std::move(sealed)));
            BRIGHTCHAIN_TRY_UNWRAP(id, store_.put(block));
            tuple_ids.push_back(id);
        }
        if (options.register_tuples) {
            BRIGHTCHAIN_TRY(store_.register_tuple(tuple_ids, options.tuple_parity_count));
        }
        addresses.insert(addresses.end(), tuple_ids.begin(), tuple_ids.end());
    }
    return R::Ok(std::move(addresses));
}

Result<EncodeResult> BlockService::encode(const bytes& data, const identity::Member& creator,
                                          const std::vector<Recipient>& recipients,
                                          const EncodeOptions& options) const {
    using R = Result<EncodeResult>;
    if (recipients.empty()) {
        return R::Err(ErrorCode::InvalidArgument, "At least one recipient required");
    }
    if (recipients.size() > ecies_.max_recipients()) {
        return R::Err(ErrorCode::TooManyRecipients,
            std::to_string(recipients.size()) + " recipients exceed the maximum of " +
            std::to_string(ecies_.max_recipients()));
    }
    const size_t capacity = chunk_capacity(recipients.size());
    if (capacity == 0) {
        return R::Err(ErrorCode::InsufficientCapacity,
            std::to_string(recipients.size()) + " recipients leave no room in a " + std::to_string(block_bytes()) +
            " byte block");
    }
    if (options.metadata) {
        BRIGHTCHAIN_TRY(cbl_.validate_file_name(options.metadata->file_name));
        BRIGHTCHAIN_TRY(cbl_.validate_mime_type(options.metadata->mime_type));
    }

    const size_t tuple_size = tuples_.tuple_size();
    const size_t chunk_count = std::max<size_t>(1, (data.size() + capacity - 1) / capacity);
    const size_t address_count = chunk_count * tuple_size;
    const size_t root_capacity = cbl_.calculate_cbl_address_capacity(block_bytes(), constants::UINT32_SIZE,
                                                                      options.metadata);
    const size_t sub_capacity = cbl_.calculate_cbl_address_capacity(block_bytes());
    const size_t super_capacity = cbl_.calculate_super_cbl_capacity(block_bytes(), constants::UINT32_SIZE);
    if (address_count > root_capacity) {
        const size_t sub_cbls = sub_capacity == 0 ? 0 : (address_count + sub_capacity - 1) / sub_capacity;
        if (sub_capacity == 0 || sub_cbls > super_capacity) {
            return R::Err(ErrorCode::InsufficientCapacity,
                std::to_string(address_count) + " addresses exceed what one SuperCBL can reach in a " +
                std::to_string(block_bytes()) + " byte block");
        }
    }

    time::Timer timer;
    const Checksum original_checksum = checksums_.calculate(data);
    BRIGHTCHAIN_TRY_UNWRAP(addresses, store_chunks(data, recipients, options));
    const uint64_t now_ms = time::timestamp_milliseconds();

    EncodeResult result;
    result.data_block_count = addresses.size();
    if (addresses.size() <= root_capacity) {
        bytes address_list;
        address_list.reserve(addresses.size() * constants::CHECKSUM_LENGTH);
        for (const auto& address : addresses) {
            address_list.insert(address_list.end(), address.value.begin(), address.value.end());
        }
        BRIGHTCHAIN_TRY_UNWRAP(root, cbl_.make_cbl_header(creator, now_ms, static_cast<uint32_t>(addresses.size()),
            static_cast<uint8_t>(tuple_size), data.size(), original_checksum, address_list, block_bytes(),
            options.metadata));
        result.root = std::move(root);
    } else {
        std::vector<Checksum> sub_ids;
        for (size_t start = 0; start < addresses.size(); start += sub_capacity) {
            const size_t count = std::min(sub_capacity, addresses.size() - start);
            const size_t first_chunk = start / tuple_size;
            const size_t data_begin = std::min(first_chunk * capacity, data.size());
            const size_t data_end = std::min((first_chunk + count / tuple_size) * capacity, data.size());
            const bytes portion(data.begin() + static_cast<std::ptrdiff_t>(data_begin),
                                data.begin() + static_cast<std::ptrdiff_t>(data_end));

            bytes address_list;
            address_list.reserve(count * constants::CHECKSUM_LENGTH);
            for (size_t i = start; i < start + count; ++i) {
                address_list.insert(address_list.end(), addresses[i].value.begin(), addresses[i].value.end());
            }
            BRIGHTCHAIN_TRY_UNWRAP(sub_cbl, cbl_.make_cbl_header(creator, now_ms, static_cast<uint32_t>(count),
                static_cast<uint8_t>(tuple_size), portion.size(), checksums_.calculate(portion), address_list,
                block_bytes()));
            BRIGHTCHAIN_TRY_UNWRAP(sub_block,
                Block::create(store_.block_size(), BlockType::ConstituentBlockList, std::move(sub_cbl)));
            BRIGHTCHAIN_TRY_UNWRAP(sub_id, store_.put(sub_block));
            sub_ids.push_back(sub_id);
        }
        BRIGHTCHAIN_TRY_UNWRAP(root, cbl_.make_super_cbl_header(creator, now_ms, static_cast<uint32_t>(sub_ids.size()),
            static_cast<uint32_t>(addresses.size()), 1, data.size(), original_checksum, sub_ids, block_bytes()));
        result.root = std::move(root);
        result.super_cbl = true;
        result.sub_cbl_count = sub_ids.size();
    }

    storage::CblWhiteningOptions whitening;
    whitening.parity_count = options.root_parity_count;
    BRIGHTCHAIN_TRY_UNWRAP(stored, store_.store_cbl_with_whitening(result.root, whitening));
    result.magnet = stored.magnet;
    result.magnet_url = stored.magnet_url;

    BRIGHTCHAIN_LOG_INFO("Encoded {} bytes into {} blocks for {} recipients in {} ms{}", data.size(),
                         result.data_block_count, recipients.size(), timer.elapsed_milliseconds(),
                         result.super_cbl ? " (SuperCBL)" : "");
    return R::Ok(std::move(result));
}

Result<bytes> BlockService::fetch_root(const std::string& magnet_url) const {
    BRIGHTCHAIN_TRY_UNWRAP(magnet, storage::CblMagnet::parse(magnet_url));
    if (magnet.block_size != block_bytes()) {
        return Result<bytes>::Err(ErrorCode::BlockSizeMismatch,
            "Magnet names " + std::to_string(magnet.block_size) + " byte blocks, store holds " +
            std::to_string(block_bytes()));
    }
    return store_.retrieve_cbl(magnet.block1, magnet.block2, magnet.block1_parity, magnet.block2_parity);
}

Result<bytes> BlockService::fetch_member(const Checksum& address, const identity::Member& recipient) const {
    BRIGHTCHAIN_TRY_UNWRAP(block, store_.get(address));
    return ecies_.decrypt_multiple_block_for_recipient(block.data(), recipient);
}

Result<bytes> BlockService::decode_cbl(const bytes& cbl, const identity::Member& recipient,
                                       const identity::Member* creator) const {
    using R = Result<bytes>;
    std::optional<uint32_t> verify_size;
    if (creator != nullptr) {
        verify_size = block_bytes();
    }
    BRIGHTCHAIN_TRY_UNWRAP(header, cbl_.parse_cbl_header(cbl, creator, verify_size));
    BRIGHTCHAIN_TRY_UNWRAP(addresses, cbl_.address_list(cbl));

    const size_t tuple_size = header.tuple_size;
    const auto size_class = store_.block_size();
    bytes out;
    for (size_t start = 0; start < addresses.size(); start += tuple_size) {
        std::vector<Block> members;
        members.reserve(tuple_size);
        for (size_t i = start; i < start + tuple_size; ++i) {
            BRIGHTCHAIN_TRY_UNWRAP(plain, fetch_member(addresses[i], recipient));
            BRIGHTCHAIN_TRY_UNWRAP(member, Block::create(size_class, BlockType::Random, std::move(plain)));
            members.push_back(std::move(member));
        }
        const Block whitened = members.front();
        members.erase(members.begin());
        BRIGHTCHAIN_TRY_UNWRAP(chunk, tuples_.unwhiten(whitened, members, tuple_size));
        out.insert(out.end(), chunk.data().begin(), chunk.data().end());
    }

    if (out.size() < header.original_data_length) {
        return R::Err(ErrorCode::DataTooShort,
            "CBL yields " + std::to_string(out.size()) + " bytes, header declares " +
            std::to_string(header.original_data_length));
    }
    out.resize(header.original_data_length);
    if (!checksums_.validate(out, header.original_data_checksum)) {
        return R::Err(ErrorCode::OriginalDataChecksumMismatch,
            "Reassembled data does not match checksum " + header.original_data_checksum.to_hex().substr(0, 16));
    }
    return R::Ok(std::move(out));
}

Result<bytes> BlockService::decode(const std::string& magnet_url, const identity::Member& recipient,
                                   const identity::Member* creator) const {
    using R = Result<bytes>;
    time::Timer timer;
    BRIGHTCHAIN_TRY_UNWRAP(root, fetch_root(magnet_url));

    if (!CBLService::is_super_cbl(root)) {
        BRIGHTCHAIN_TRY_UNWRAP(data, decode_cbl(root, recipient, creator));
        BRIGHTCHAIN_LOG_INFO("Decoded {} bytes in {} ms", data.size(), timer.elapsed_milliseconds());
        return R::Ok(std::move(data));
    }

    std::optional<uint32_t> verify_size;
    if (creator != nullptr) {
        verify_size = block_bytes();
    }
    BRIGHTCHAIN_TRY_UNWRAP(header, cbl_.parse_super_cbl_header(root, creator, verify_size));
    BRIGHTCHAIN_TRY_UNWRAP(sub_ids, cbl_.address_list(root));

    bytes out;
    out.reserve(header.original_data_length);
    for (const auto& sub_id : sub_ids) {
        BRIGHTCHAIN_TRY_UNWRAP(sub_block, store_.get(sub_id));
        if (CBLService::is_super_cbl(sub_block.data())) {
            return R::Err(ErrorCode::InvalidDepth, "Nested SuperCBLs are not supported at depth 1");
        }
        BRIGHTCHAIN_TRY_UNWRAP(portion, decode_cbl(sub_block.data(), recipient, creator));
        out.insert(out.end(), portion.begin(), portion.end());
    }

    if (out.size() != header.original_data_length) {
        return R::Err(ErrorCode::OriginalDataChecksumMismatch,
            "Sub-CBLs yield " + std::to_string(out.size()) + " bytes, SuperCBL declares " +
            std::to_string(header.original_data_length));
    }
    if (!checksums_.validate(out, header.original_data_checksum)) {
        return R::Err(ErrorCode::OriginalDataChecksumMismatch, "Reassembled data does not match the SuperCBL checksum");
    }
    BRIGHTCHAIN_LOG_INFO("Decoded {} bytes from {} sub-CBLs in {} ms", out.size(), sub_ids.size(),
                         timer.elapsed_milliseconds());
    return R::Ok(std::move(out));
}

} // namespace brightchain::services

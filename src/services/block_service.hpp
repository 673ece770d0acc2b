#pragma once

#include "cbl_service.hpp"
#include "checksum_service.hpp"
#include "ecies_service.hpp"
#include "xor_tuple_service.hpp"
#include "storage/block_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace brightchain::services {

struct EncodeOptions {
    // File name and MIME type recorded in a single-CBL root
    std::optional<ExtendedCblMetadata> metadata;
    // FEC parity for the two halves of the whitened root
    size_t root_parity_count = 0;
    // Record every tuple in the store for XOR and Reed-Solomon recovery
    bool register_tuples = false;
    size_t tuple_parity_count = 0;
};

struct EncodeResult {
    std::string magnet_url;
    storage::CblMagnet magnet;
    bytes root;
    bool super_cbl = false;
    size_t data_block_count = 0;
    size_t sub_cbl_count = 0;
};

/**
 * End-to-end pipeline: chunk, whiten, encrypt for every recipient, index by CBL, store
 *
 * Each chunk becomes a tuple [chunk ^ r1 ^ .. ^ r(k-1), r1, .., r(k-1)]; every member is
 * multi-recipient encrypted into its own block. The CBL lists the encrypted block checksums
 * tuple by tuple. Roots that need more addresses than one CBL holds become a depth 1 SuperCBL
 * over stored sub-CBLs.
 */
class BlockService {
public:
    BlockService(const ECIESService& ecies, const ChecksumService& checksums, const XorTupleService& tuples,
                 const CBLService& cbl, storage::IBlockStore& store);

    /**
     * Payload bytes one encrypted block carries for recipient_count recipients
     */
    size_t chunk_capacity(size_t recipient_count) const;

    /**
     * @return Magnet and root, InsufficientCapacity when the data exceeds one SuperCBL
     */
    Result<EncodeResult> encode(const bytes& data, const identity::Member& creator,
                                const std::vector<Recipient>& recipients, const EncodeOptions& options = {}) const;

    /**
     * Rebuild the data behind a magnet for one recipient
     * @param creator When given, every CBL signature is verified against it
     * @return Data, OriginalDataChecksumMismatch when the result does not hash to the recorded checksum
     */
    Result<bytes> decode(const std::string& magnet_url, const identity::Member& recipient,
                         const identity::Member* creator = nullptr) const;

    /**
     * Root CBL or SuperCBL bytes behind a magnet
     */
    Result<bytes> fetch_root(const std::string& magnet_url) const;

private:
    Result<std::vector<Checksum>> store_chunks(const bytes& data, const std::vector<Recipient>& recipients,
                                               const EncodeOptions& options) const;
    Result<bytes> decode_cbl(const bytes& cbl, const identity::Member& recipient,
                             const identity::Member* creator) const;
    Result<bytes> fetch_member(const Checksum& address, const identity::Member& recipient) const;

    uint32_t block_bytes() const { return blocks::block_size_bytes(store_.block_size()); }

    const ECIESService& ecies_;
    const ChecksumService& checksums_;
    const XorTupleService& tuples_;
    const CBLService& cbl_;
    storage::IBlockStore& store_;
};

} // namespace brightchain::services

#include <iostream>
#include <memory>
#include <filesystem>
#include <fstream>
#include <iterator>

// Crypto services
#include "services/checksum_service.hpp"
#include "services/ecies_service.hpp"
#include "services/xor_tuple_service.hpp"
#include "services/cbl_service.hpp"
#include "services/block_service.hpp"
#include "fec/fec_service.hpp"

// Storage
#include "storage/block_store.hpp"

// Identity
#include "identity/member.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "brightchain/common.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input-file> [config.json]\n"
              << "Encodes the file for a fresh member and a second recipient, prints the magnet URI,\n"
              << "then decodes it for both recipients and verifies the result.\n";
}

brightchain::bytes read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open input file: " + path.string());
    }
    return brightchain::bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv) {
    using namespace brightchain;

    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        const std::filesystem::path input_path = argv[1];

        // Load configuration (or use defaults if no file is given)
        utils::Config config;
        if (argc > 2 && std::filesystem::exists(argv[2])) {
            config = utils::Config::load_from_file(argv[2]);
        }
        const auto settings = utils::EngineSettings::from_config(config);
        utils::Logger::init(settings.log_level, settings.log_to_file);

        BRIGHTCHAIN_LOG_INFO("BrightChain engine v{}.{}.{}",
            BRIGHTCHAIN_VERSION_MAJOR,
            BRIGHTCHAIN_VERSION_MINOR,
            BRIGHTCHAIN_VERSION_PATCH
        );

        auto valid = settings.validate();
        if (valid.is_err()) {
            BRIGHTCHAIN_LOG_ERROR("Invalid configuration: {}", valid.error().to_string());
            return 1;
        }

        // Services are built once and handed to their consumers
        services::ChecksumService checksums;
        services::ECIESService ecies(settings.max_recipients);
        auto fec = std::make_shared<fec::ReedSolomonFecService>();
        services::XorTupleService tuples(settings, fec);
        services::CBLService cbl(ecies, checksums, settings);
        storage::MemoryBlockStore store(blocks::block_size_from_length(settings.block_size), checksums, tuples, fec);
        services::BlockService block_service(ecies, checksums, tuples, cbl, store);

        auto creator = identity::Member::generate(ecies, "creator");
        auto second = identity::Member::generate(ecies, "recipient");
        if (creator.is_err() || second.is_err()) {
            const auto& error = creator.is_err() ? creator.error() : second.error();
            BRIGHTCHAIN_LOG_ERROR("Member generation failed: {}", error.to_string());
            return 1;
        }
        const auto& owner = creator.value().member;
        const auto& other = second.value().member;
        BRIGHTCHAIN_LOG_INFO("Creator {} and recipient {}", owner.id().to_string(), other.id().to_string());

        const bytes data = read_file(input_path);
        services::EncodeOptions options;
        options.metadata = services::ExtendedCblMetadata{input_path.filename().string(), "application/octet-stream"};
        options.register_tuples = true;
        options.tuple_parity_count = settings.parity_count;
        options.root_parity_count = settings.parity_count;

        auto encoded = block_service.encode(data, owner, {owner.as_recipient(), other.as_recipient()}, options);
        if (encoded.is_err()) {
            BRIGHTCHAIN_LOG_ERROR("Encode failed: {}", encoded.error().to_string());
            return 1;
        }
        std::cout << encoded.value().magnet_url << std::endl;
        BRIGHTCHAIN_LOG_INFO("Store holds {} blocks", store.size());

        for (const auto* member : {&owner, &other}) {
            auto decoded = block_service.decode(encoded.value().magnet_url, *member, &owner);
            if (decoded.is_err()) {
                BRIGHTCHAIN_LOG_ERROR("Decode for {} failed: {}", member->name(), decoded.error().to_string());
                return 1;
            }
            if (decoded.value() != data) {
                BRIGHTCHAIN_LOG_ERROR("Decoded data for {} differs from the input", member->name());
                return 1;
            }
            BRIGHTCHAIN_LOG_INFO("Round trip verified for {}", member->name());
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

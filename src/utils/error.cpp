#include "brightchain/error.hpp"
#include <sstream>

namespace brightchain {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotImplemented: return "Not implemented";

        case ErrorCode::InvalidHexString: return "Invalid hex string";
        case ErrorCode::InvalidHexStringLength: return "Invalid hex string length";
        case ErrorCode::InvalidBlockSize: return "Invalid block size";
        case ErrorCode::InvalidBlockHeader: return "Invalid block header";
        case ErrorCode::InvalidBlockType: return "Invalid block type";
        case ErrorCode::DataTooShort: return "Data too short";
        case ErrorCode::InvalidEncryptedDataLength: return "Invalid encrypted data length";
        case ErrorCode::InvalidMultiRecipientHeader: return "Invalid multi-recipient header";
        case ErrorCode::UnsupportedLayoutVersion: return "Unsupported layout version";
        case ErrorCode::InvalidTupleSize: return "Invalid tuple size";
        case ErrorCode::InvalidDepth: return "Invalid depth";
        case ErrorCode::InvalidCBLHeader: return "Invalid CBL header";
        case ErrorCode::InvalidFileName: return "Invalid file name";
        case ErrorCode::InvalidMimeType: return "Invalid MIME type";
        case ErrorCode::InvalidDerivationPath: return "Invalid derivation path";
        case ErrorCode::InvalidMagnetURL: return "Invalid magnet URL";
        case ErrorCode::InvalidMagnetURLXT: return "Invalid magnet URL exact topic";
        case ErrorCode::InvalidMagnetURLMissing: return "Magnet URL missing parameter";
        case ErrorCode::InvalidMagnetURLInvalidBlockSize: return "Magnet URL has invalid block size";
        case ErrorCode::NoBlocksToXor: return "No blocks to XOR";
        case ErrorCode::InvalidConfiguration: return "Invalid configuration";

        case ErrorCode::InvalidMnemonic: return "Invalid mnemonic";
        case ErrorCode::InvalidPrivateKey: return "Invalid private key";
        case ErrorCode::InvalidSenderPublicKey: return "Invalid sender public key";
        case ErrorCode::InvalidEphemeralPublicKey: return "Invalid ephemeral public key";
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::InvalidSignature: return "Invalid signature";
        case ErrorCode::InvalidMessageCrc: return "Invalid message CRC";
        case ErrorCode::RecipientNotFound: return "Recipient not found";
        case ErrorCode::PrivateKeyNotLoaded: return "Private key not loaded";
        case ErrorCode::SecureBufferDisposed: return "Secure buffer disposed";
        case ErrorCode::CryptoOperationFailed: return "Crypto operation failed";

        case ErrorCode::TooManyRecipients: return "Too many recipients";
        case ErrorCode::InsufficientCapacity: return "Insufficient capacity";
        case ErrorCode::DataTooLarge: return "Data too large";
        case ErrorCode::FileSizeTooLarge: return "File size too large";
        case ErrorCode::FileSizeTooLargeForNode: return "File size too large for node";

        case ErrorCode::BlockSizeMismatch: return "Block size mismatch";
        case ErrorCode::InvalidCBLAddressCount: return "Invalid CBL address count";
        case ErrorCode::SubCBLCountChecksumMismatch: return "Sub-CBL count does not match checksums";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::OriginalDataChecksumMismatch: return "Original data checksum mismatch";
        case ErrorCode::BlockAlreadyExists: return "Block already exists";

        case ErrorCode::ParityBlocksRequired: return "Parity blocks required";
        case ErrorCode::DamagedBlockRequired: return "Damaged block required";
        case ErrorCode::InvalidParityBlockSize: return "Invalid parity block size";
        case ErrorCode::InvalidRecoveredBlockSize: return "Invalid recovered block size";
        case ErrorCode::RecoveryFailedInsufficientParityData: return "Recovery failed, insufficient parity data";
        case ErrorCode::BlockNotFound: return "Block not found";
        case ErrorCode::BlockMetadataNotFound: return "Block metadata not found";
        case ErrorCode::Block1NotFound: return "Block 1 not found";
        case ErrorCode::Block2NotFound: return "Block 2 not found";
        case ErrorCode::UnknownRecoveryError: return "Unknown recovery error";
    }
    return "Unknown error code";
}

ErrorCategory error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
        case ErrorCode::Unknown:
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotImplemented:
            return ErrorCategory::Generic;

        case ErrorCode::InvalidHexString:
        case ErrorCode::InvalidHexStringLength:
        case ErrorCode::InvalidBlockSize:
        case ErrorCode::InvalidBlockHeader:
        case ErrorCode::InvalidBlockType:
        case ErrorCode::DataTooShort:
        case ErrorCode::InvalidEncryptedDataLength:
        case ErrorCode::InvalidMultiRecipientHeader:
        case ErrorCode::UnsupportedLayoutVersion:
        case ErrorCode::InvalidTupleSize:
        case ErrorCode::InvalidDepth:
        case ErrorCode::InvalidCBLHeader:
        case ErrorCode::InvalidFileName:
        case ErrorCode::InvalidMimeType:
        case ErrorCode::InvalidDerivationPath:
        case ErrorCode::InvalidMagnetURL:
        case ErrorCode::InvalidMagnetURLXT:
        case ErrorCode::InvalidMagnetURLMissing:
        case ErrorCode::InvalidMagnetURLInvalidBlockSize:
        case ErrorCode::NoBlocksToXor:
        case ErrorCode::InvalidConfiguration:
            return ErrorCategory::Structural;

        case ErrorCode::InvalidMnemonic:
        case ErrorCode::InvalidPrivateKey:
        case ErrorCode::InvalidSenderPublicKey:
        case ErrorCode::InvalidEphemeralPublicKey:
        case ErrorCode::DecryptionFailed:
        case ErrorCode::InvalidSignature:
        case ErrorCode::InvalidMessageCrc:
        case ErrorCode::RecipientNotFound:
        case ErrorCode::PrivateKeyNotLoaded:
        case ErrorCode::SecureBufferDisposed:
        case ErrorCode::CryptoOperationFailed:
            return ErrorCategory::Cryptographic;

        case ErrorCode::TooManyRecipients:
        case ErrorCode::InsufficientCapacity:
        case ErrorCode::DataTooLarge:
        case ErrorCode::FileSizeTooLarge:
        case ErrorCode::FileSizeTooLargeForNode:
            return ErrorCategory::Capacity;

        case ErrorCode::BlockSizeMismatch:
        case ErrorCode::InvalidCBLAddressCount:
        case ErrorCode::SubCBLCountChecksumMismatch:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::OriginalDataChecksumMismatch:
        case ErrorCode::BlockAlreadyExists:
            return ErrorCategory::Consistency;

        case ErrorCode::ParityBlocksRequired:
        case ErrorCode::DamagedBlockRequired:
        case ErrorCode::InvalidParityBlockSize:
        case ErrorCode::InvalidRecoveredBlockSize:
        case ErrorCode::RecoveryFailedInsufficientParityData:
        case ErrorCode::BlockNotFound:
        case ErrorCode::BlockMetadataNotFound:
        case ErrorCode::Block1NotFound:
        case ErrorCode::Block2NotFound:
        case ErrorCode::UnknownRecoveryError:
            return ErrorCategory::Recovery;
    }
    return ErrorCategory::Generic;
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Generic: return "generic";
        case ErrorCategory::Structural: return "structural";
        case ErrorCategory::Cryptographic: return "cryptographic";
        case ErrorCategory::Capacity: return "capacity";
        case ErrorCategory::Consistency: return "consistency";
        case ErrorCategory::Recovery: return "recovery";
    }
    return "generic";
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace brightchain

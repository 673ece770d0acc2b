#pragma once

#include "brightchain/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace brightchain {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    NotImplemented,

    // Structural errors (malformed lengths and formats)
    InvalidHexString,
    InvalidHexStringLength,
    InvalidBlockSize,
    InvalidBlockHeader,
    InvalidBlockType,
    DataTooShort,
    InvalidEncryptedDataLength,
    InvalidMultiRecipientHeader,
    UnsupportedLayoutVersion,
    InvalidTupleSize,
    InvalidDepth,
    InvalidCBLHeader,
    InvalidFileName,
    InvalidMimeType,
    InvalidDerivationPath,
    InvalidMagnetURL,
    InvalidMagnetURLXT,
    InvalidMagnetURLMissing,
    InvalidMagnetURLInvalidBlockSize,
    NoBlocksToXor,
    InvalidConfiguration,

    // Cryptographic errors
    InvalidMnemonic,
    InvalidPrivateKey,
    InvalidSenderPublicKey,
    InvalidEphemeralPublicKey,
    DecryptionFailed,
    InvalidSignature,
    InvalidMessageCrc,
    RecipientNotFound,
    PrivateKeyNotLoaded,
    SecureBufferDisposed,
    CryptoOperationFailed,

    // Capacity errors
    TooManyRecipients,
    InsufficientCapacity,
    DataTooLarge,
    FileSizeTooLarge,
    FileSizeTooLargeForNode,

    // Consistency errors
    BlockSizeMismatch,
    InvalidCBLAddressCount,
    SubCBLCountChecksumMismatch,
    ChecksumMismatch,
    OriginalDataChecksumMismatch,
    BlockAlreadyExists,

    // Recovery errors
    ParityBlocksRequired,
    DamagedBlockRequired,
    InvalidParityBlockSize,
    InvalidRecoveredBlockSize,
    RecoveryFailedInsufficientParityData,
    BlockNotFound,
    BlockMetadataNotFound,
    Block1NotFound,
    Block2NotFound,
    UnknownRecoveryError
};

// Coarse classification callers can branch on
enum class ErrorCategory {
    Generic,
    Structural,
    Cryptographic,
    Capacity,
    Consistency,
    Recovery
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Category of an error code
ErrorCategory error_category(ErrorCode code);
const char* error_category_to_string(ErrorCategory category);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return error_category(code_); }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling: a value or an Error
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Errors convert implicitly so they propagate across result types
    Result(Error error) : value_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Shorthand for error().code()
    ErrorCode code() const {
        return is_ok() ? ErrorCode::Success : error().code();
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Move the value out (throws if error)
    T take() {
        return std::move(value());
    }

    template<typename F>
    auto map(F&& func) const -> Result<decltype(func(std::declval<const T&>()))> {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::Ok(func(std::get<T>(value_)));
        }
        return Result<U>::Err(error());
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result();
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    ErrorCode code() const {
        return error_ ? error_->code() : ErrorCode::Success;
    }

    void expect(const std::string& message) const {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    Result() = default;

    std::optional<Error> error_;
};

// Exceptions for library failures and fail-closed conditions
class BrightChainException : public std::runtime_error {
public:
    BrightChainException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public BrightChainException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : BrightChainException(code, "Crypto error: " + message) {}
};

class StorageException : public BrightChainException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : BrightChainException(code, "Storage error: " + message) {}
};

// Utility macros for error handling
#define BRIGHTCHAIN_TRY(expr) \
    do { \
        auto&& __result = (expr); \
        if (__result.is_err()) { \
            return __result.error(); \
        } \
    } while (0)

#define BRIGHTCHAIN_TRY_UNWRAP(var, expr) \
    auto&& __result_##var = (expr); \
    if (__result_##var.is_err()) { \
        return __result_##var.error(); \
    } \
    auto var = __result_##var.take();

} // namespace brightchain

#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for mdfkit
 */

#include <string>
#include <string_view>

namespace mdfkit {

/**
 * @brief Status codes for decoder operations
 *
 * The second group is the decoder failure taxonomy. Each of them is scoped to
 * the smallest unit that failed (slot, record, LOB value, table); none of them
 * ends a scan on its own.
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kInvalidArgument,
    kIOError,
    kCorruption,
    kNotSupported,
    kInternal,

    kMalformedPage,
    kRecordTooShort,
    kBrokenLobChain,
    kCatalogCorrupt,
    kForwardLoopDetected,
    kUnsupportedType,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status IOError(std::string msg = "") { return Status(StatusCode::kIOError, std::move(msg)); }
    [[nodiscard]] static Status Corruption(std::string msg = "") { return Status(StatusCode::kCorruption, std::move(msg)); }
    [[nodiscard]] static Status NotSupported(std::string msg = "") { return Status(StatusCode::kNotSupported, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Decoder taxonomy
    [[nodiscard]] static Status MalformedPage(std::string msg = "") { return Status(StatusCode::kMalformedPage, std::move(msg)); }
    [[nodiscard]] static Status RecordTooShort(std::string msg = "") { return Status(StatusCode::kRecordTooShort, std::move(msg)); }
    [[nodiscard]] static Status BrokenLobChain(std::string msg = "") { return Status(StatusCode::kBrokenLobChain, std::move(msg)); }
    [[nodiscard]] static Status CatalogCorrupt(std::string msg = "") { return Status(StatusCode::kCatalogCorrupt, std::move(msg)); }
    [[nodiscard]] static Status ForwardLoopDetected(std::string msg = "") { return Status(StatusCode::kForwardLoopDetected, std::move(msg)); }
    [[nodiscard]] static Status UnsupportedType(std::string msg = "") { return Status(StatusCode::kUnsupportedType, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool is_io_error() const noexcept { return code_ == StatusCode::kIOError; }
    [[nodiscard]] bool is_catalog_corrupt() const noexcept { return code_ == StatusCode::kCatalogCorrupt; }
    [[nodiscard]] bool is_unsupported_type() const noexcept { return code_ == StatusCode::kUnsupportedType; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace mdfkit

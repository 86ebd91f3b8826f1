/**
 * @file error.hpp
 * @brief Status codes for the DS205A turnstile driver.
 * @version 0.1
 * @date 2025-11-18
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace ds205a {

/**
 * @enum Status
 * @brief Enumeration of error codes for DS205A driver operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * Codes starting with 'D' are device/transport related.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        INVALID_CONFIG = 1,     /**< Invalid session configuration */
        DATA_TOO_LARGE = 2,     /**< Command payload exceeds 3 bytes */
        FRAME_TOO_SHORT = 3,    /**< Response shorter than 18 bytes */
        INVALID_HEADER = 4,     /**< Response header is not 0x7F */
        DEVICE_ID_MISMATCH = 5, /**< Machine number differs from configured device ID */
        COMMAND_FAILED = 6,     /**< Device reported a non-success execution byte */
        BAD_CHECKSUM = 7,       /**< Checksum mismatch (diagnostic only for responses) */
        INCOMPLETE_FRAME = 8,   /**< Read budget exhausted with a partial frame */
        NO_DATA = 9,            /**< Read budget exhausted with no data */
        CANCELLED = 10,         /**< Operation cancelled by the caller */
        RETRY_EXHAUSTED = 11,   /**< No valid response after all attempts */
        DNOT_FOUND = 12,        /**< Device not found */
        DNOT_OPEN = 13,         /**< Device not open */
        DOPEN_ERROR = 14,       /**< Device open error */
        DREAD_ERROR = 15,       /**< Device read error */
        DWRITE_ERROR = 16,      /**< Device write error */
        DCONFIG_ERROR = 17,     /**< Device configuration error */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class DS205AErrorCategory
 * @brief Custom error category for DS205A errors.
 */
    class DS205AErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "ds205a::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::INVALID_CONFIG:
                    return "Invalid configuration";
                case Status::DATA_TOO_LARGE:
                    return "Data too large";
                case Status::FRAME_TOO_SHORT:
                    return "Frame too short";
                case Status::INVALID_HEADER:
                    return "Invalid header byte";
                case Status::DEVICE_ID_MISMATCH:
                    return "Device ID mismatch";
                case Status::COMMAND_FAILED:
                    return "Command failed";
                case Status::BAD_CHECKSUM:
                    return "Bad checksum";
                case Status::INCOMPLETE_FRAME:
                    return "Incomplete frame";
                case Status::NO_DATA:
                    return "No data received";
                case Status::CANCELLED:
                    return "Operation cancelled";
                case Status::RETRY_EXHAUSTED:
                    return "No valid response";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DOPEN_ERROR:
                    return "Device open error";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &ds205a_category() {
        static DS205AErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), ds205a_category()};
    }

/**
 * @brief Check whether a status describes a transient exchange failure
 *
 * Transport and framing failures may succeed on a later attempt; everything
 * else (rejections, programmer errors, cancellation) may not.
 */
    inline bool is_transient(Status status) {
        switch (status) {
        case Status::INCOMPLETE_FRAME:
        case Status::NO_DATA:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
            return true;
        default:
            return false;
        }
    }

} // namespace ds205a

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<ds205a::Status> : true_type {};
} // namespace std

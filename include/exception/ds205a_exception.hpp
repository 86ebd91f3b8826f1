/**
 * @file ds205a_exception.hpp
 * @brief Exception hierarchy for the DS205A turnstile driver
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "../enums/error.hpp"

namespace ds205a {

    /**
     * @class DS205AException
     * @brief Base exception class for all driver errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class DS205AException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            DS205AException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                DS205AErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ConfigException
     * @brief Invalid session configuration, raised before any I/O
     */
    class ConfigException : public DS205AException {
        public:
            explicit ConfigException(const std::string& context)
                : DS205AException(Status::INVALID_CONFIG, context) {}
    };

    /**
     * @class ProtocolException
     * @brief Frame construction and framing errors
     *
     * Corresponds to DATA_TOO_LARGE, FRAME_TOO_SHORT, INVALID_HEADER and BAD_CHECKSUM.
     */
    class ProtocolException : public DS205AException {
        public:
            using DS205AException::DS205AException;
    };

    /**
     * @class ResponseException
     * @brief A complete response was received but rejected
     *
     * Wrong machine number or a non-success execution byte. Never retried.
     */
    class ResponseException : public DS205AException {
        public:
            using DS205AException::DS205AException;
    };

    /**
     * @class DeviceException
     * @brief Transport open/read/write failures and device state errors
     */
    class DeviceException : public DS205AException {
        public:
            using DS205AException::DS205AException;
    };

    /**
     * @class TimeoutException
     * @brief Read budget exhausted before a full response frame arrived
     *
     * For INCOMPLETE_FRAME the bytes collected from the header onwards are kept.
     */
    class TimeoutException : public DS205AException {
        private:
            std::vector<std::uint8_t> partial_;

        public:
            TimeoutException(Status status, const std::string& context,
                std::vector<std::uint8_t> partial = {})
                : DS205AException(status, context), partial_(std::move(partial)) {}

            /**
             * @brief Bytes accumulated before the budget ran out
             */
            const std::vector<std::uint8_t>& partial_frame() const noexcept { return partial_; }
    };

    /**
     * @class CancelledException
     * @brief The caller cancelled the operation
     */
    class CancelledException : public DS205AException {
        public:
            explicit CancelledException(const std::string& context)
                : DS205AException(Status::CANCELLED, context) {}
    };

    /**
     * @class RetryExhaustedException
     * @brief Every attempt of an exchange failed with a transient error
     *
     * Keeps the status of the last failure and the number of attempts made.
     * If the last failure was INCOMPLETE_FRAME its partial bytes are kept too.
     */
    class RetryExhaustedException : public DS205AException {
        private:
            Status last_status_;
            int attempts_;
            std::vector<std::uint8_t> partial_;

        public:
            RetryExhaustedException(Status last_status, int attempts, const std::string& context,
                std::vector<std::uint8_t> partial = {})
                : DS205AException(Status::RETRY_EXHAUSTED, context),
                last_status_(last_status),
                attempts_(attempts),
                partial_(std::move(partial)) {}

            Status last_status() const noexcept { return last_status_; }
            int attempts() const noexcept { return attempts_; }
            const std::vector<std::uint8_t>& partial_frame() const noexcept { return partial_; }
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     */
    [[noreturn]] inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::INVALID_CONFIG:
            throw ConfigException(context);

        case Status::DATA_TOO_LARGE:
        case Status::FRAME_TOO_SHORT:
        case Status::INVALID_HEADER:
        case Status::BAD_CHECKSUM:
            throw ProtocolException(status, context);

        case Status::DEVICE_ID_MISMATCH:
        case Status::COMMAND_FAILED:
            throw ResponseException(status, context);

        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DOPEN_ERROR:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
            throw DeviceException(status, context);

        case Status::INCOMPLETE_FRAME:
        case Status::NO_DATA:
            throw TimeoutException(status, context);

        case Status::CANCELLED:
            throw CancelledException(context);

        default:
            throw DS205AException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     * @param status The status code to check
     * @param context Description of where the error occurred
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace ds205a

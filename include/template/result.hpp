/**
 * @file result.hpp
 * @brief Result type with error context chaining for the codec layer.
 * @version 0.1
 * @date 2025-11-18
 * @copyright Copyright (c) 2025
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ds205a {

    namespace detail {

        /**
         * @brief Context trail shared by every Result instantiation.
         *
         * Each layer that forwards a failure appends its own name, so the
         * trail reads innermost first: "parse_response -> get_status".
         */
        class ResultTrail {
            public:
                const std::vector<std::string>& error_chain() const {
                    return chain_;
                }

                /**
                 * @brief The chain joined with " -> ", empty if there is none
                 */
                std::string trail() const {
                    std::string text;
                    for (std::size_t i = 0; i < chain_.size(); ++i) {
                        text += (i == 0 ? "" : " -> ") + chain_[i];
                    }
                    return text;
                }

            protected:
                void push_context(const std::string& op) {
                    if (!op.empty()) {
                        chain_.push_back(op);
                    }
                }

                void inherit_context(const std::vector<std::string>& chain,
                    const std::string& op) {
                    chain_ = chain;
                    push_context(op);
                }

                std::string render(Status status) const {
                    if (status == Status::SUCCESS) return "Success";

                    std::string text = make_error_code(status).message();
                    if (chain_.empty()) return text;

                    return text + " [" + trail() + "]";
                }

            private:
                std::vector<std::string> chain_;
        };

    } // namespace detail

/**
 * @brief Value-or-Status result with a chain of context strings.
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result : public detail::ResultTrail {
        public:
            Result() : state_(Status::UNKNOWN) {}

            bool ok() const { return std::holds_alternative<T>(state_); }
            bool fail() const { return !ok(); }
            explicit operator bool() const { return ok(); }
            bool operator!() const { return fail(); }

            // Throws std::bad_variant_access on a failed result
            const T& value() const { return std::get<T>(state_); }
            T& value() { return std::get<T>(state_); }

            Status error() const {
                return ok() ? Status::SUCCESS : std::get<Status>(state_);
            }

            /**
             * @brief Category message plus the context trail
             */
            std::string describe() const { return render(error()); }

            static Result success(T val, const std::string& op = "") {
                Result r;
                r.state_ = std::move(val);
                r.push_context(op);
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.state_ = status;
                r.push_context(op);
                return r;
            }

            template<typename U>
            static Result error(const Result<U>& cause, const std::string& op = "") {
                Result r;
                r.state_ = cause.error();
                r.inherit_context(cause.error_chain(), op);
                return r;
            }

        private:
            std::variant<T, Status> state_;
    };

    template<>
    class Result<void> : public detail::ResultTrail {
        public:
            bool ok() const { return status_ == Status::SUCCESS; }
            bool fail() const { return !ok(); }
            explicit operator bool() const { return ok(); }
            bool operator!() const { return fail(); }

            Status error() const { return status_; }

            std::string describe() const { return render(status_); }

            static Result success(const std::string& op = "") {
                Result r;
                r.push_context(op);
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                r.push_context(op);
                return r;
            }

            template<typename U>
            static Result error(const Result<U>& cause, const std::string& op = "") {
                Result r;
                r.status_ = cause.error();
                r.inherit_context(cause.error_chain(), op);
                return r;
            }

        private:
            Status status_ = Status::SUCCESS;
    };

} // namespace ds205a

/**
 * @file cancel_token.hpp
 * @brief Cooperative cancellation flag shared between a caller and a session
 * @version 0.1
 * @date 2025-11-18
 *
 * Copies share the same flag, so a token handed to send_command() can be
 * cancelled from another thread or from a signal-driven watcher.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <atomic>
#include <memory>

namespace ds205a {

    class CancelToken {
        public:
            CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

            void cancel() { flag_->store(true); }

            bool is_cancelled() const { return flag_->load(); }

            void reset() { flag_->store(false); }

            /**
             * @brief A token nobody cancels, used as the default argument
             */
            static const CancelToken& none() {
                static const CancelToken token;
                return token;
            }

        private:
            std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace ds205a

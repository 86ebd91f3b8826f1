/**
 * @file frame_synchronizer.cpp
 * @brief FrameSynchronizer implementation
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "../include/pattern/frame_synchronizer.hpp"
#include "../include/exception/ds205a_exception.hpp"

#include <algorithm>

namespace ds205a {

    FrameSynchronizer::FrameSynchronizer(std::uint8_t header, std::size_t frame_size)
        : header_(header), frame_size_(frame_size) {
        buffer_.reserve(frame_size_ * 2);
    }

    bool FrameSynchronizer::feed(span<const std::uint8_t> chunk) {
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());

        if (!locked_) {
            // Only look at bytes not scanned by a previous feed
            auto start = buffer_.begin() + static_cast<std::ptrdiff_t>(scan_pos_);
            auto it = std::find(start, buffer_.end(), header_);
            if (it != buffer_.end()) {
                std::size_t skip = static_cast<std::size_t>(it - buffer_.begin());
                buffer_.erase(buffer_.begin(), it);
                discarded_ += skip;
                locked_ = true;
            } else {
                scan_pos_ = buffer_.size();
            }
        }

        return complete();
    }

    std::vector<std::uint8_t> FrameSynchronizer::take_frame() const {
        if (!complete()) {
            throw ProtocolException(Status::INCOMPLETE_FRAME,
                "take_frame: " + std::to_string(buffer_.size()) + "/" +
                std::to_string(frame_size_) + " bytes" +
                (locked_ ? "" : ", no header"));
        }
        return std::vector<std::uint8_t>(buffer_.begin(),
            buffer_.begin() + static_cast<std::ptrdiff_t>(frame_size_));
    }

    void FrameSynchronizer::reset() {
        buffer_.clear();
        scan_pos_ = 0;
        discarded_ = 0;
        locked_ = false;
    }

} // namespace ds205a

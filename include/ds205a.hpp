/**
 * @file ds205a.hpp
 * @brief Header file to facilitate the inclusion of the DS205A driver library
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

// Include the protocol enums
#include "enums/protocol.hpp"
#include "enums/error.hpp"
// Include exception hierarchy and result type
#include "exception/ds205a_exception.hpp"
#include "template/result.hpp"
// Include the checksum helpers
#include "interface/serialization_helpers.hpp"
// Include the frames and codec
#include "frame/command_frame.hpp"
#include "frame/response_frame.hpp"
#include "frame/device_status.hpp"
#include "frame/frame_codec.hpp"
// Include the transport
#include "io/serial_port.hpp"
#include "io/real_serial_port.hpp"
// Include logging
#include "logging/logger.hpp"
// Include the session layer
#include "pattern/cancel_token.hpp"
#include "pattern/frame_synchronizer.hpp"
#include "pattern/session_config.hpp"
#include "pattern/device_session.hpp"

/**
 * @file fragmenter.hpp
 * @brief Split a data-link frame into HID reports
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "knxusb/protocol.hpp"

namespace knx
{
namespace usb
{

/**
 * @brief Encode a data-link frame as a sequence of HID reports
 *
 * Generates the start packet
 * [REPORT_HEADER][TRANSFER_HEADER][BODY (<= 52)]
 * followed by continuation packets
 * [REPORT_HEADER][BODY (<= 61)]
 * each zero padded to REPORT_SIZE. Padding is not counted in the
 * body length.
 *
 * Stateless; independent frames can be fragmented concurrently.
 *
 * @param frame       EMI frame, message code first
 * @param len         Frame length in bytes
 * @param protocol_id Protocol written to the transfer header
 * @param emi_id      EMI format written to the transfer header
 * @param out         Output reports, left empty on failure
 * @return ErrorCode::OK on success,
 *         ErrorCode::MALFORMED_LENGTH for an empty frame,
 *         ErrorCode::FRAME_TOO_LARGE if len exceeds MAX_FRAME_SIZE
 */
ErrorCode fragment_frame(const uint8_t* frame, size_t len, ProtocolId protocol_id, EmiId emi_id,
                         std::vector<Report>& out);

/**
 * @brief Number of reports needed for a frame of the given length
 *
 * @return 0 if len is 0 or exceeds MAX_FRAME_SIZE
 */
size_t report_count(size_t len);

}  // namespace usb
}  // namespace knx

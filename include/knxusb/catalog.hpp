/**
 * @file catalog.hpp
 * @brief Field catalogs: raw value decoding and lookup tables
 *
 * Every identifier read from the wire goes through one of the
 * parse_* functions. An undefined raw value is reported as
 * ErrorCode::UNKNOWN_ENUM_VALUE, never mapped to a default.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "knxusb/protocol.hpp"

namespace knx
{
namespace usb
{

/**
 * @brief Decode a protocol identifier
 *
 * @param raw Raw header octet
 * @param out Decoded identifier, untouched on failure
 * @return ErrorCode::OK or ErrorCode::UNKNOWN_ENUM_VALUE
 */
ErrorCode parse_protocol_id(uint8_t raw, ProtocolId& out);

/**
 * @brief Decode an EMI format identifier
 */
ErrorCode parse_emi_id(uint8_t raw, EmiId& out);

/**
 * @brief Decode a cEMI message code
 */
ErrorCode parse_cemi_message_code(uint8_t raw, CemiMessageCode& out);

/**
 * @brief Decode a sequence number (1..MAX_SEQUENCE_NUMBER)
 */
ErrorCode parse_sequence_number(uint8_t raw, SequenceNumber& out);

/**
 * @brief Decode a packet type
 */
ErrorCode parse_packet_type(uint8_t raw, PacketType& out);

/**
 * @brief Maximum body segment size for a report position
 *
 * @return FIRST_PACKET_MAX_DATA for the first packet,
 *         PARTIAL_PACKET_MAX_DATA for every other position
 */
size_t max_data_size(SequenceNumber seq);

/**
 * @brief Maximum body segment size for a segment kind
 *
 * @param partial true for continuation segments
 */
size_t max_data_size(bool partial);

/**
 * @brief True if the packet type marks the start of a transfer
 */
bool is_start(PacketType type);

/**
 * @brief True if the packet type marks the end of a transfer
 */
bool is_end(PacketType type);

const char* to_string(ProtocolId id);
const char* to_string(EmiId id);
const char* to_string(CemiMessageCode code);
const char* to_string(PacketType type);

/**
 * @brief Get error message string
 *
 * @param err Error code
 * @return Message from errors.def (static string)
 */
const char* to_string(ErrorCode err);

}  // namespace usb
}  // namespace knx

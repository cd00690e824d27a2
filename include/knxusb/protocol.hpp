/**
 * @file protocol.hpp
 * @brief KNX USB HID Transfer Protocol definitions
 *
 * Constants and identifiers of the KNX USB Transfer Protocol
 * (KNX Standard, Volume 3, Part 3.4 "KNX USB Interface").
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace knx
{
namespace usb
{

/* ========================================================================= */
/* Report format constants                                                   */
/* ========================================================================= */

/**
 * @brief Size of one USB HID report in octets
 *
 * Every report exchanged with the interface device has exactly this size.
 */
constexpr size_t REPORT_SIZE = 64;

/**
 * @brief Size of the KNX HID report header
 *
 * [REPORT_ID][PACKET_INFO][DATA_LENGTH]
 */
constexpr size_t REPORT_HEADER_SIZE = 3;

/**
 * @brief Size of the KNX HID report body
 */
constexpr size_t REPORT_BODY_SIZE = REPORT_SIZE - REPORT_HEADER_SIZE;

/**
 * @brief Report ID used for all KNX tunnel reports
 */
constexpr uint8_t REPORT_ID = 0x01;

/**
 * @brief Size of the KNX USB Transfer Protocol Header
 *
 * Present in the start packet only. Version 0 of the protocol always
 * uses this value in the header length field.
 */
constexpr size_t HEADER_SIZE = 8;

/**
 * @brief The only protocol version defined so far
 */
constexpr uint8_t PROTOCOL_VERSION = 0x00;

/**
 * @brief Manufacturer code for frames that fully comply with the standard
 */
constexpr uint16_t STANDARD_MANUFACTURER_CODE = 0x0000;

/**
 * @brief Maximum body segment in a start packet
 *
 * The start packet carries the transfer header in front of the body.
 */
constexpr size_t FIRST_PACKET_MAX_DATA = 52;

/**
 * @brief Maximum body segment in a continuation packet
 */
constexpr size_t PARTIAL_PACKET_MAX_DATA = REPORT_BODY_SIZE;

/**
 * @brief Maximum data-link frame length
 *
 * Extended frame format on TP1 (APDU length 255) including the EMI
 * message code and cEMI additional info.
 */
constexpr size_t MAX_FRAME_SIZE = 263;

/**
 * @brief Number of reports one transfer can span
 *
 * 52 + 4 * 61 = 296 octets, enough for MAX_FRAME_SIZE.
 */
constexpr uint8_t MAX_SEQUENCE_NUMBER = 5;

/**
 * @brief One fixed-size HID report
 */
using Report = std::array<uint8_t, REPORT_SIZE>;

/* ========================================================================= */
/* Frame structure                                                           */
/* ========================================================================= */

/**
 * Start packet:
 *
 * [REPORT_ID][PACKET_INFO][DATA_LEN][VER][HLEN][BLEN_H][BLEN_L][PROTO][EMI][MFR_H][MFR_L][BODY...][PAD]
 *
 * - REPORT_ID:   1 byte  (0x01)
 * - PACKET_INFO: 1 byte  (sequence number << 4 | packet type)
 * - DATA_LEN:    1 byte  (used octets of the report body, <= 61)
 * - VER:         1 byte  (protocol version, 0)
 * - HLEN:        1 byte  (header length, 8)
 * - BLEN:        2 bytes (body length, big-endian, total frame length)
 * - PROTO:       1 byte  (ProtocolId)
 * - EMI:         1 byte  (EmiId)
 * - MFR:         2 bytes (manufacturer code, big-endian, 0x0000)
 * - BODY:        52 bytes (first frame segment, zero padded)
 *
 * Continuation packet:
 *
 * [REPORT_ID][PACKET_INFO][DATA_LEN][BODY...]
 *
 * - BODY:        61 bytes (next frame segment, zero padded)
 */

/* ========================================================================= */
/* Identifiers                                                               */
/* ========================================================================= */

/**
 * @brief Protocol carried in the transfer body (header octet 5)
 */
enum class ProtocolId : uint8_t
{
  KNX_TUNNEL = 0x01,
  M_BUS_TUNNEL = 0x02,
  BATIBUS_TUNNEL = 0x03,
  BUS_ACCESS_SERVER_FEATURE_SERVICE = 0x0F,
};

/**
 * @brief EMI format of a KNX tunnel body (header octet 6)
 */
enum class EmiId : uint8_t
{
  EMI1 = 0x01,
  EMI2 = 0x02,
  COMMON_EMI = 0x03,
};

/**
 * @brief cEMI message codes (first octet of the transfer body)
 */
enum class CemiMessageCode : uint8_t
{
  L_RAW_REQ = 0x10,
  L_DATA_REQ = 0x11,
  L_POLL_DATA_REQ = 0x13,
  L_POLL_DATA_CON = 0x25,
  L_DATA_IND = 0x29,
  L_BUSMON_IND = 0x2B,
  L_RAW_IND = 0x2D,
  L_DATA_CON = 0x2E,
  L_RAW_CON = 0x2F,
  M_RESET_IND = 0xF0,
  M_RESET_REQ = 0xF1,
  M_PROP_WRITE_CON = 0xF5,
  M_PROP_WRITE_REQ = 0xF6,
  M_PROP_INFO_IND = 0xF7,
  M_FUNC_PROP_COMMAND_REQ = 0xF8,
  M_FUNC_PROP_STATE_READ_REQ = 0xF9,
  M_FUNC_PROP_COMMAND_CON = 0xFA,
  M_PROP_READ_CON = 0xFB,
  M_PROP_READ_REQ = 0xFC,
};

/**
 * @brief Position of a report within one transfer (packet info high nibble)
 */
enum class SequenceNumber : uint8_t
{
  FIRST_PACKET = 1,
  SECOND_PACKET = 2,
  THIRD_PACKET = 3,
  FOURTH_PACKET = 4,
  FIFTH_PACKET = 5,
};

/**
 * @brief Packet type (packet info low nibble)
 */
enum class PacketType : uint8_t
{
  START_AND_END = 0x03,
  PARTIAL = 0x04,
  START_AND_PARTIAL = 0x05,
  PARTIAL_AND_END = 0x06,
};

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Status codes returned by encoders, decoders and the reassembler
 *
 * Defined via errors.def, shared with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "knxusb/errors.def"
#undef ERR
};

}  // namespace usb
}  // namespace knx

/**
 * @file transfer.hpp
 * @brief KNX USB Transfer Protocol header and body
 *
 * Each wire entity has two constructors and one serializer:
 * - from_data(): build from semantic values (outbound, infallible)
 * - from_knx():  decode raw octets (inbound, sets is_valid())
 * - to_knx():    serialize, producing nothing for an invalid object
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
 * @brief Semantic content of a transfer header
 */
struct TransferHeaderData
{
  uint16_t body_length;
  ProtocolId protocol_id;
  EmiId emi_id;
};

/**
 * @brief KNX USB Transfer Protocol Header (3.4.1.3)
 *
 * Located in the start packet only.
 *
 * Layout (big-endian):
 * [VERSION][HEADER_LEN][BODY_LEN_H][BODY_LEN_L][PROTOCOL_ID][EMI_ID][MFR_H][MFR_L]
 */
class TransferHeader
{
 public:
  /**
   * @brief Build a header for an outbound transfer
   *
   * Always valid. Protocol version 0, header length 8,
   * manufacturer code 0x0000.
   */
  static TransferHeader from_data(const TransferHeaderData& data);

  /**
   * @brief Decode a header received from the device
   *
   * The header is valid only if exactly HEADER_SIZE octets are given,
   * both identifiers are defined, the protocol version is 0 and the
   * header length field is 8. Failures are logged and kept in error().
   *
   * @param data Pointer to header octets
   * @param len  Number of octets
   */
  static TransferHeader from_knx(const uint8_t* data, size_t len);

  /**
   * @brief Serialize the header
   *
   * @param out Receives exactly HEADER_SIZE octets, or is cleared if
   *            the header is invalid
   * @return true if the header was written
   */
  bool to_knx(std::vector<uint8_t>& out) const;

  uint8_t protocol_version() const
  {
    return protocol_version_;
  }

  uint8_t header_length() const
  {
    return header_length_;
  }

  /**
   * @brief Length of the whole transfer body (EMI frame incl. message code)
   *
   * Two octets, since extended frames can exceed 255 octets.
   */
  uint16_t body_length() const
  {
    return body_length_;
  }

  ProtocolId protocol_id() const
  {
    return protocol_id_;
  }

  EmiId emi_id() const
  {
    return emi_id_;
  }

  uint16_t manufacturer_code() const
  {
    return manufacturer_code_;
  }

  bool is_valid() const
  {
    return valid_;
  }

  /**
   * @brief Reason the header is invalid (ErrorCode::OK when valid)
   */
  ErrorCode error() const
  {
    return error_;
  }

 private:
  TransferHeader();

  uint8_t protocol_version_;    ///< Always 0 in a valid header
  uint8_t header_length_;       ///< Always 8 in a valid header
  uint16_t body_length_;        ///< Total body length over all reports
  ProtocolId protocol_id_;      ///< Carried protocol
  EmiId emi_id_;                ///< EMI format of the body
  uint16_t manufacturer_code_;  ///< 0x0000 for standard frames
  bool valid_;
  ErrorCode error_;
};

/**
 * @brief Semantic content of one body segment
 */
struct TransferBodyData
{
  std::vector<uint8_t> data;  ///< Segment octets (EMI message code first in a start packet)
  bool partial;               ///< true for continuation packets
};

/**
 * @brief One report's segment of the KNX USB Transfer Protocol Body
 *
 * Start packets carry at most FIRST_PACKET_MAX_DATA octets, beginning
 * with the EMI message code. Continuation packets carry at most
 * PARTIAL_PACKET_MAX_DATA octets of plain continuation data.
 */
class TransferBody
{
 public:
  /**
   * @brief Build a segment for an outbound report
   *
   * Invalid (CAPACITY_EXCEEDED) if the data does not fit the segment kind.
   */
  static TransferBody from_data(const TransferBodyData& data);

  /**
   * @brief Decode a segment taken from a received report
   *
   * The segment always arrives at full width: exactly
   * FIRST_PACKET_MAX_DATA octets (start packet) or
   * PARTIAL_PACKET_MAX_DATA octets (continuation). Any other length
   * is a malformed report.
   */
  static TransferBody from_knx(const uint8_t* data, size_t len);

  /**
   * @brief Serialize the segment, right-padded with 0x00
   *
   * @param partial Pad to the continuation width instead of the
   *                start packet width
   * @param out     Receives max_data_size(partial) octets, or is
   *                cleared if the body is invalid or does not fit
   * @return true if the segment was written
   */
  bool to_knx(bool partial, std::vector<uint8_t>& out) const;

  /**
   * @brief EMI message code (first octet) of a start packet segment
   *
   * @param out Decoded message code
   * @return true if this is a non-empty start segment whose first
   *         octet is a defined cEMI message code
   */
  bool emi_message_code(CemiMessageCode& out) const;

  /**
   * @brief Segment octets (includes the EMI message code in a start packet)
   */
  const std::vector<uint8_t>& data() const
  {
    return data_;
  }

  size_t length() const
  {
    return data_.size();
  }

  bool is_partial() const
  {
    return partial_;
  }

  bool is_valid() const
  {
    return valid_;
  }

  ErrorCode error() const
  {
    return error_;
  }

 private:
  TransferBody();

  std::vector<uint8_t> data_;
  bool partial_;
  bool valid_;
  ErrorCode error_;
};

}  // namespace usb
}  // namespace knx

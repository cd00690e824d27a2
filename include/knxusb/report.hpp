/**
 * @file report.hpp
 * @brief KNX HID report header (3.4.1.2)
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
 * @brief Header in front of every HID report body
 *
 * [REPORT_ID][SEQ << 4 | PACKET_TYPE][DATA_LENGTH]
 *
 * DATA_LENGTH counts the used octets of the report body; for a start
 * packet this includes the transfer header.
 */
class ReportHeader
{
 public:
  /**
   * @brief Build a report header for an outbound report
   *
   * @param seq         Position of the report in the transfer
   * @param type        Packet type
   * @param data_length Used octets of the report body
   */
  static ReportHeader from_data(SequenceNumber seq, PacketType type, uint8_t data_length);

  /**
   * @brief Decode the first REPORT_HEADER_SIZE octets of a report
   *
   * Invalid if fewer octets are given (MALFORMED_LENGTH), the report ID
   * is not REPORT_ID, the sequence number or packet type is undefined
   * (UNKNOWN_ENUM_VALUE), or the data length exceeds the report body
   * (MALFORMED_LENGTH).
   */
  static ReportHeader from_knx(const uint8_t* data, size_t len);

  /**
   * @brief Write REPORT_HEADER_SIZE octets to out
   *
   * @return false (nothing written) if the header is invalid
   */
  bool to_knx(uint8_t* out) const;

  SequenceNumber sequence_number() const
  {
    return seq_;
  }

  PacketType packet_type() const
  {
    return type_;
  }

  uint8_t data_length() const
  {
    return data_length_;
  }

  /**
   * @brief Raw packet info octet as received
   */
  uint8_t packet_info() const
  {
    return packet_info_;
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
  ReportHeader();

  SequenceNumber seq_;
  PacketType type_;
  uint8_t data_length_;
  uint8_t packet_info_;
  bool valid_;
  ErrorCode error_;
};

/**
 * @brief Packet type for a report position
 *
 * @param seq     Position in the transfer
 * @param is_last true if no report follows
 */
PacketType packet_type_for(SequenceNumber seq, bool is_last);

}  // namespace usb
}  // namespace knx

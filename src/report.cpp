/**
 * @file report.cpp
 * @brief KNX HID report header encoding/decoding
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/report.hpp"

#include "knxusb/catalog.hpp"
#include "knxusb/log.hpp"

namespace knx
{
namespace usb
{

ReportHeader::ReportHeader()
    : seq_(SequenceNumber::FIRST_PACKET),
      type_(PacketType::START_AND_END),
      data_length_(0),
      packet_info_(0),
      valid_(false),
      error_(ErrorCode::OK)
{
}

ReportHeader ReportHeader::from_data(SequenceNumber seq, PacketType type, uint8_t data_length)
{
  ReportHeader header;
  header.seq_ = seq;
  header.type_ = type;
  header.data_length_ = data_length;
  header.packet_info_ =
      static_cast<uint8_t>((static_cast<uint8_t>(seq) << 4) | static_cast<uint8_t>(type));
  header.valid_ = data_length <= REPORT_BODY_SIZE;
  if (!header.valid_)
  {
    header.error_ = ErrorCode::MALFORMED_LENGTH;
  }
  return header;
}

ReportHeader ReportHeader::from_knx(const uint8_t* data, size_t len)
{
  ReportHeader header;

  if (data == nullptr || len < REPORT_HEADER_SIZE)
  {
    log_error("report header: received %zu bytes, expected at least %zu",
              data ? len : 0, REPORT_HEADER_SIZE);
    header.error_ = ErrorCode::MALFORMED_LENGTH;
    return header;
  }

  header.packet_info_ = data[1];
  header.data_length_ = data[2];

  if (data[0] != REPORT_ID)
  {
    log_error("report header: 0x%02X is not a valid report id", data[0]);
    header.error_ = ErrorCode::UNKNOWN_ENUM_VALUE;
    return header;
  }

  const uint8_t raw_seq = static_cast<uint8_t>(data[1] >> 4);
  if (parse_sequence_number(raw_seq, header.seq_) != ErrorCode::OK)
  {
    log_error("report header: %u is not a valid sequence number", raw_seq);
    header.error_ = ErrorCode::UNKNOWN_ENUM_VALUE;
    return header;
  }

  const uint8_t raw_type = static_cast<uint8_t>(data[1] & 0x0F);
  if (parse_packet_type(raw_type, header.type_) != ErrorCode::OK)
  {
    log_error("report header: 0x%02X is not a valid packet type", raw_type);
    header.error_ = ErrorCode::UNKNOWN_ENUM_VALUE;
    return header;
  }

  if (header.data_length_ > REPORT_BODY_SIZE)
  {
    log_error("report header: data length %u exceeds report body of %zu",
              header.data_length_, REPORT_BODY_SIZE);
    header.error_ = ErrorCode::MALFORMED_LENGTH;
    return header;
  }

  header.valid_ = true;
  return header;
}

bool ReportHeader::to_knx(uint8_t* out) const
{
  if (!valid_ || out == nullptr)
  {
    return false;
  }

  out[0] = REPORT_ID;
  out[1] = packet_info_;
  out[2] = data_length_;
  return true;
}

PacketType packet_type_for(SequenceNumber seq, bool is_last)
{
  if (seq == SequenceNumber::FIRST_PACKET)
  {
    return is_last ? PacketType::START_AND_END : PacketType::START_AND_PARTIAL;
  }
  return is_last ? PacketType::PARTIAL_AND_END : PacketType::PARTIAL;
}

}  // namespace usb
}  // namespace knx

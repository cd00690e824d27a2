/**
 * @file transfer_header.cpp
 * @brief KNX USB Transfer Protocol Header encoding/decoding
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/catalog.hpp"
#include "knxusb/log.hpp"
#include "knxusb/transfer.hpp"

namespace knx
{
namespace usb
{

TransferHeader::TransferHeader()
    : protocol_version_(PROTOCOL_VERSION),
      header_length_(static_cast<uint8_t>(HEADER_SIZE)),
      body_length_(0),
      protocol_id_(ProtocolId::KNX_TUNNEL),
      emi_id_(EmiId::COMMON_EMI),
      manufacturer_code_(STANDARD_MANUFACTURER_CODE),
      valid_(false),
      error_(ErrorCode::OK)
{
}

TransferHeader TransferHeader::from_data(const TransferHeaderData& data)
{
  TransferHeader header;
  header.body_length_ = data.body_length;
  header.protocol_id_ = data.protocol_id;
  header.emi_id_ = data.emi_id;
  header.valid_ = true;
  return header;
}

TransferHeader TransferHeader::from_knx(const uint8_t* data, size_t len)
{
  TransferHeader header;

  if (data == nullptr || len != HEADER_SIZE)
  {
    log_error("transfer header: received %zu bytes, expected %zu", data ? len : 0,
              HEADER_SIZE);
    header.error_ = ErrorCode::MALFORMED_LENGTH;
    return header;
  }

  // [VERSION][HEADER_LEN][BODY_LEN_H][BODY_LEN_L][PROTOCOL_ID][EMI_ID][MFR_H][MFR_L]
  header.protocol_version_ = data[0];
  header.header_length_ = data[1];
  header.body_length_ = static_cast<uint16_t>((data[2] << 8) | data[3]);
  header.manufacturer_code_ = static_cast<uint16_t>((data[6] << 8) | data[7]);

  if (parse_protocol_id(data[4], header.protocol_id_) != ErrorCode::OK)
  {
    log_error("transfer header: 0x%02X is not a valid protocol id", data[4]);
    header.error_ = ErrorCode::UNKNOWN_ENUM_VALUE;
    return header;
  }

  if (parse_emi_id(data[5], header.emi_id_) != ErrorCode::OK)
  {
    log_error("transfer header: 0x%02X is not a valid EMI id", data[5]);
    header.error_ = ErrorCode::UNKNOWN_ENUM_VALUE;
    return header;
  }

  if (header.protocol_version_ != PROTOCOL_VERSION)
  {
    log_error("transfer header: protocol version %u, expected %u",
              header.protocol_version_, PROTOCOL_VERSION);
    header.error_ = ErrorCode::PROTOCOL_VERSION_MISMATCH;
    return header;
  }

  // A header length other than 8 rejects the entire report
  if (header.header_length_ != HEADER_SIZE)
  {
    log_error("transfer header: header length %u, expected %zu", header.header_length_,
              HEADER_SIZE);
    header.error_ = ErrorCode::HEADER_LENGTH_MISMATCH;
    return header;
  }

  header.valid_ = true;
  return header;
}

bool TransferHeader::to_knx(std::vector<uint8_t>& out) const
{
  out.clear();

  if (!valid_)
  {
    return false;
  }

  out.reserve(HEADER_SIZE);
  out.push_back(protocol_version_);
  out.push_back(header_length_);
  out.push_back(static_cast<uint8_t>((body_length_ >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(body_length_ & 0xFF));
  out.push_back(static_cast<uint8_t>(protocol_id_));
  out.push_back(static_cast<uint8_t>(emi_id_));
  out.push_back(static_cast<uint8_t>((manufacturer_code_ >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(manufacturer_code_ & 0xFF));

  return true;
}

}  // namespace usb
}  // namespace knx

/**
 * @file transfer_body.cpp
 * @brief KNX USB Transfer Protocol Body encoding/decoding
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

TransferBody::TransferBody() : data_(), partial_(false), valid_(false), error_(ErrorCode::OK) {}

TransferBody TransferBody::from_data(const TransferBodyData& data)
{
  TransferBody body;
  body.partial_ = data.partial;

  if (data.data.size() > max_data_size(data.partial))
  {
    log_error("transfer body: %zu bytes exceed the %s segment limit of %zu",
              data.data.size(), data.partial ? "continuation" : "start",
              max_data_size(data.partial));
    body.error_ = ErrorCode::CAPACITY_EXCEEDED;
    return body;
  }

  body.data_ = data.data;
  body.valid_ = true;
  return body;
}

TransferBody TransferBody::from_knx(const uint8_t* data, size_t len)
{
  TransferBody body;

  if (data == nullptr || (len != FIRST_PACKET_MAX_DATA && len != PARTIAL_PACKET_MAX_DATA))
  {
    log_error(
        "transfer body: received %zu bytes, expected %zu bytes for start packets, or %zu "
        "bytes for partial packets",
        data ? len : 0, FIRST_PACKET_MAX_DATA, PARTIAL_PACKET_MAX_DATA);
    body.error_ = ErrorCode::MALFORMED_LENGTH;
    return body;
  }

  body.data_.assign(data, data + len);
  body.partial_ = (len == PARTIAL_PACKET_MAX_DATA);
  body.valid_ = true;
  return body;
}

bool TransferBody::to_knx(bool partial, std::vector<uint8_t>& out) const
{
  out.clear();

  const size_t width = max_data_size(partial);
  if (!valid_ || data_.size() > width)
  {
    return false;
  }

  out.reserve(width);
  out.insert(out.end(), data_.begin(), data_.end());
  out.resize(width, 0x00);

  return true;
}

bool TransferBody::emi_message_code(CemiMessageCode& out) const
{
  if (partial_ || data_.empty())
  {
    return false;
  }

  return parse_cemi_message_code(data_[0], out) == ErrorCode::OK;
}

}  // namespace usb
}  // namespace knx

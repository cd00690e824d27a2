/**
 * @file fragmenter.cpp
 * @brief Frame fragmentation implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/fragmenter.hpp"

#include <algorithm>
#include <utility>

#include "knxusb/catalog.hpp"
#include "knxusb/log.hpp"
#include "knxusb/report.hpp"
#include "knxusb/transfer.hpp"

namespace knx
{
namespace usb
{

size_t report_count(size_t len)
{
  if (len == 0 || len > MAX_FRAME_SIZE)
  {
    return 0;
  }

  if (len <= FIRST_PACKET_MAX_DATA)
  {
    return 1;
  }

  const size_t rest = len - FIRST_PACKET_MAX_DATA;
  return 1 + (rest + PARTIAL_PACKET_MAX_DATA - 1) / PARTIAL_PACKET_MAX_DATA;
}

ErrorCode fragment_frame(const uint8_t* frame, size_t len, ProtocolId protocol_id, EmiId emi_id,
                         std::vector<Report>& out)
{
  out.clear();

  if (frame == nullptr || len == 0)
  {
    log_error("fragmenter: empty frame");
    return ErrorCode::MALFORMED_LENGTH;
  }

  // Reject before anything is emitted
  if (len > MAX_FRAME_SIZE)
  {
    log_error("fragmenter: frame of %zu bytes exceeds maximum of %zu", len,
              MAX_FRAME_SIZE);
    return ErrorCode::FRAME_TOO_LARGE;
  }

  const size_t count = report_count(len);
  std::vector<Report> reports;
  reports.reserve(count);

  const TransferHeader header =
      TransferHeader::from_data({static_cast<uint16_t>(len), protocol_id, emi_id});
  std::vector<uint8_t> header_bytes;
  header.to_knx(header_bytes);

  std::vector<uint8_t> body_bytes;
  size_t offset = 0;

  for (size_t i = 0; i < count; ++i)
  {
    const SequenceNumber seq = static_cast<SequenceNumber>(i + 1);
    const bool partial = (i != 0);
    const size_t chunk = std::min(len - offset, max_data_size(partial));

    const TransferBody body =
        TransferBody::from_data({std::vector<uint8_t>(frame + offset, frame + offset + chunk),
                                 partial});
    if (!body.to_knx(partial, body_bytes))
    {
      return body.error();
    }

    // DATA_LENGTH counts the transfer header in the start packet
    const size_t used = partial ? chunk : HEADER_SIZE + chunk;
    const ReportHeader report_header =
        ReportHeader::from_data(seq, packet_type_for(seq, i + 1 == count),
                                static_cast<uint8_t>(used));

    Report report{};
    report_header.to_knx(report.data());

    uint8_t* cursor = report.data() + REPORT_HEADER_SIZE;
    if (!partial)
    {
      cursor = std::copy(header_bytes.begin(), header_bytes.end(), cursor);
    }
    std::copy(body_bytes.begin(), body_bytes.end(), cursor);

    reports.push_back(report);
    offset += chunk;
  }

  log_debug("fragmenter: %zu byte %s frame in %zu report(s)", len, to_string(emi_id),
            count);

  out = std::move(reports);
  return ErrorCode::OK;
}

}  // namespace usb
}  // namespace knx

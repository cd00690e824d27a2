/**
 * @file reassembler.cpp
 * @brief Report reassembly implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/reassembler.hpp"

#include <algorithm>
#include <utility>

#include "knxusb/catalog.hpp"
#include "knxusb/log.hpp"
#include "knxusb/transfer.hpp"

namespace knx
{
namespace usb
{

Reassembler::Reassembler(size_t max_frame_size)
    : max_frame_size_(std::min(max_frame_size, MAX_FRAME_SIZE)),
      state_(State::IDLE),
      buffer_(),
      body_length_(0),
      expected_seq_(0),
      protocol_id_(ProtocolId::KNX_TUNNEL),
      emi_id_(EmiId::COMMON_EMI),
      last_failure_{ErrorCode::OK, 0, 0},
      failure_count_(0),
      completed_count_(0),
      reports_received_(0),
      failure_fn_(nullptr),
      failure_user_(nullptr)
{
  buffer_.reserve(max_frame_size_);
}

bool Reassembler::on_report_received(const uint8_t* report, size_t len,
                                     std::vector<uint8_t>& frame)
{
  ++reports_received_;

  if (report == nullptr || len != REPORT_SIZE)
  {
    log_error("reassembler: received %zu bytes, expected %zu", report ? len : 0,
              REPORT_SIZE);
    fail(ErrorCode::MALFORMED_LENGTH, 0);
    return false;
  }

  const ReportHeader header = ReportHeader::from_knx(report, len);
  if (!header.is_valid())
  {
    fail(header.error(), report[1]);
    return false;
  }

  // Start flag must agree with the sequence position
  const bool first = header.sequence_number() == SequenceNumber::FIRST_PACKET;
  if (is_start(header.packet_type()) != first)
  {
    log_warning("reassembler: packet type %s at sequence number %u",
                to_string(header.packet_type()),
                static_cast<unsigned>(header.sequence_number()));
    fail(ErrorCode::SEQUENCE_GAP_OR_DUPLICATE, header.packet_info());
    return false;
  }

  if (first)
  {
    if (state_ == State::COLLECTING)
    {
      // Previous transfer ended before its declared body length
      log_warning("reassembler: start packet while %zu of %u bytes collected",
                  buffer_.size(), body_length_);
      fail(ErrorCode::SEQUENCE_GAP_OR_DUPLICATE, header.packet_info());
    }
    return begin_transfer(report, header, frame);
  }

  if (state_ == State::IDLE)
  {
    log_warning("reassembler: continuation packet %u without start packet",
                static_cast<unsigned>(header.sequence_number()));
    fail(ErrorCode::UNEXPECTED_CONTINUATION, header.packet_info());
    return false;
  }

  return continue_transfer(report, header, frame);
}

bool Reassembler::begin_transfer(const uint8_t* report, const ReportHeader& header,
                                 std::vector<uint8_t>& frame)
{
  const uint8_t* body_start = report + REPORT_HEADER_SIZE;

  const TransferHeader transfer_header = TransferHeader::from_knx(body_start, HEADER_SIZE);
  if (!transfer_header.is_valid())
  {
    fail(transfer_header.error(), header.packet_info());
    return false;
  }

  const TransferBody body =
      TransferBody::from_knx(body_start + HEADER_SIZE, FIRST_PACKET_MAX_DATA);
  if (!body.is_valid())
  {
    fail(body.error(), header.packet_info());
    return false;
  }

  if (transfer_header.body_length() == 0)
  {
    log_error("reassembler: transfer header declares an empty body");
    fail(ErrorCode::MALFORMED_LENGTH, header.packet_info());
    return false;
  }

  if (transfer_header.body_length() > max_frame_size_)
  {
    log_error("reassembler: body length %u exceeds maximum of %zu",
              transfer_header.body_length(), max_frame_size_);
    fail(ErrorCode::FRAME_TOO_LARGE, header.packet_info());
    return false;
  }

  const size_t segment =
      std::min<size_t>(transfer_header.body_length(), FIRST_PACKET_MAX_DATA);
  if (header.data_length() != HEADER_SIZE + segment)
  {
    log_error("reassembler: data length %u, expected %zu", header.data_length(),
              HEADER_SIZE + segment);
    fail(ErrorCode::MALFORMED_LENGTH, header.packet_info());
    return false;
  }

  body_length_ = transfer_header.body_length();
  protocol_id_ = transfer_header.protocol_id();
  emi_id_ = transfer_header.emi_id();
  expected_seq_ = static_cast<uint8_t>(SequenceNumber::SECOND_PACKET);
  state_ = State::COLLECTING;

  buffer_.clear();
  append(body.data());

  // Advisory only: message code is not checked against the EMI id
  CemiMessageCode code;
  if (emi_id_ == EmiId::COMMON_EMI && !body.emi_message_code(code))
  {
    log_debug("reassembler: 0x%02X is not a cEMI message code", body.data()[0]);
  }

  if (buffer_.size() == body_length_)
  {
    return complete(frame);
  }

  if (is_end(header.packet_type()))
  {
    log_warning("reassembler: end packet after %zu of %u bytes", buffer_.size(),
                body_length_);
    fail(ErrorCode::SEQUENCE_GAP_OR_DUPLICATE, header.packet_info());
  }

  return false;
}

bool Reassembler::continue_transfer(const uint8_t* report, const ReportHeader& header,
                                    std::vector<uint8_t>& frame)
{
  const uint8_t seq = static_cast<uint8_t>(header.sequence_number());
  if (seq != expected_seq_)
  {
    log_warning("reassembler: sequence number %u, expected %u", seq, expected_seq_);
    fail(ErrorCode::SEQUENCE_GAP_OR_DUPLICATE, header.packet_info());
    return false;
  }

  const size_t segment =
      std::min<size_t>(body_length_ - buffer_.size(), PARTIAL_PACKET_MAX_DATA);
  if (header.data_length() != segment)
  {
    log_error("reassembler: data length %u, expected %zu", header.data_length(), segment);
    fail(ErrorCode::MALFORMED_LENGTH, header.packet_info());
    return false;
  }

  const TransferBody body =
      TransferBody::from_knx(report + REPORT_HEADER_SIZE, PARTIAL_PACKET_MAX_DATA);
  if (!body.is_valid())
  {
    fail(body.error(), header.packet_info());
    return false;
  }

  append(body.data());
  ++expected_seq_;

  if (buffer_.size() == body_length_)
  {
    return complete(frame);
  }

  if (is_end(header.packet_type()))
  {
    log_warning("reassembler: end packet after %zu of %u bytes", buffer_.size(),
                body_length_);
    fail(ErrorCode::SEQUENCE_GAP_OR_DUPLICATE, header.packet_info());
  }

  return false;
}

void Reassembler::append(const std::vector<uint8_t>& segment)
{
  // Octets beyond the declared body length are padding
  const size_t remaining = body_length_ - buffer_.size();
  const size_t take = std::min(remaining, segment.size());
  buffer_.insert(buffer_.end(), segment.begin(), segment.begin() + take);
}

bool Reassembler::complete(std::vector<uint8_t>& frame)
{
  frame = std::move(buffer_);
  buffer_.clear();
  buffer_.reserve(max_frame_size_);

  state_ = State::IDLE;
  expected_seq_ = 0;
  ++completed_count_;

  log_debug("reassembler: %zu byte %s frame complete", frame.size(), to_string(emi_id_));
  return true;
}

void Reassembler::abort()
{
  if (state_ != State::COLLECTING)
  {
    return;
  }

  log_warning("reassembler: transfer aborted after %zu of %u bytes", buffer_.size(),
              body_length_);
  fail(ErrorCode::TRANSFER_ABORTED, 0);
}

void Reassembler::set_failure_handler(FailureFn fn, void* user)
{
  failure_fn_ = fn;
  failure_user_ = user;
}

void Reassembler::fail(ErrorCode code, uint8_t packet_info)
{
  last_failure_ = {code, reports_received_ > 0 ? reports_received_ - 1 : 0, packet_info};
  ++failure_count_;

  buffer_.clear();
  body_length_ = 0;
  expected_seq_ = 0;
  state_ = State::IDLE;

  log_info("reassembler: report %zu discarded: %s", last_failure_.report_index,
           to_string(code));

  if (failure_fn_)
  {
    failure_fn_(failure_user_, last_failure_);
  }
}

}  // namespace usb
}  // namespace knx

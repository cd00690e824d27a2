/**
 * @file reassembler.hpp
 * @brief Reassemble HID reports into data-link frames
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "knxusb/protocol.hpp"
#include "knxusb/report.hpp"

namespace knx
{
namespace usb
{

/**
 * @brief KNX USB transfer receiver
 *
 * Consumes HID reports in arrival order and yields complete EMI frames.
 * Malformed or misordered reports end only the transfer in flight; the
 * next start packet begins a fresh transfer.
 *
 * One instance per inbound report stream. Not thread-safe: sequence
 * continuity depends on reports being fed in arrival order from a
 * single consumer.
 *
 * Example usage:
 * @code
 * Reassembler rx;
 *
 * // Interrupt IN transfer completed
 * void on_interrupt_in(const uint8_t* report, size_t len) {
 *   std::vector<uint8_t> frame;
 *   if (rx.on_report_received(report, len, frame)) {
 *     dispatch_emi(frame);  // frame[0] is the EMI message code
 *   }
 * }
 * @endcode
 */
class Reassembler
{
 public:
  /**
   * @brief Receiver state between two calls
   *
   * Completed and failed transfers both return to IDLE before
   * on_report_received() returns.
   */
  enum class State
  {
    IDLE,        // No transfer in progress
    COLLECTING,  // Start packet seen, waiting for continuation packets
  };

  /**
   * @brief Description of a discarded report or transfer
   */
  struct Failure
  {
    ErrorCode code;       ///< Reason
    size_t report_index;  ///< Zero-based index of the offending report in the stream
    uint8_t packet_info;  ///< Raw packet info octet of that report (0 if unavailable)
  };

  /**
   * @brief Failure callback function type
   *
   * Invoked synchronously from on_report_received() or abort().
   *
   * @param user    User context pointer passed to set_failure_handler()
   * @param failure Failure description
   */
  using FailureFn = void (*)(void* user, const Failure& failure);

  /**
   * @brief Construct Reassembler instance
   *
   * @param max_frame_size Largest accepted body length (clamped to
   *                       MAX_FRAME_SIZE)
   */
  explicit Reassembler(size_t max_frame_size = MAX_FRAME_SIZE);

  /**
   * @brief Process one received report
   *
   * The packet type must match the sequence position (a start type at
   * sequence 1 only) and the data length octet must equal the octets
   * that position carries for the declared body length. Either mismatch
   * discards the report and any transfer in flight.
   *
   * @param report Report octets
   * @param len    Report length, must be REPORT_SIZE
   * @param frame  Receives the reassembled frame, exactly body_length
   *               octets; untouched unless true is returned
   * @return true if this report completed a transfer
   */
  bool on_report_received(const uint8_t* report, size_t len, std::vector<uint8_t>& frame);

  /**
   * @brief Discard a transfer in progress
   *
   * Called by the session layer when its receive deadline expires.
   * An in-flight transfer is recorded as ErrorCode::TRANSFER_ABORTED.
   */
  void abort();

  /**
   * @brief Install a failure callback (nullptr to remove)
   */
  void set_failure_handler(FailureFn fn, void* user = nullptr);

  State state() const
  {
    return state_;
  }

  /**
   * @brief Most recent failure ({OK, 0, 0} if none occurred)
   */
  const Failure& last_failure() const
  {
    return last_failure_;
  }

  size_t failure_count() const
  {
    return failure_count_;
  }

  size_t completed_count() const
  {
    return completed_count_;
  }

  size_t reports_received() const
  {
    return reports_received_;
  }

  /**
   * @brief Protocol of the current or last completed transfer
   */
  ProtocolId protocol_id() const
  {
    return protocol_id_;
  }

  /**
   * @brief EMI format of the current or last completed transfer
   */
  EmiId emi_id() const
  {
    return emi_id_;
  }

  size_t max_frame_size() const
  {
    return max_frame_size_;
  }

 private:
  /**
   * @brief Handle a start packet (sequence number 1)
   */
  bool begin_transfer(const uint8_t* report, const ReportHeader& header,
                      std::vector<uint8_t>& frame);

  /**
   * @brief Handle a continuation packet while collecting
   */
  bool continue_transfer(const uint8_t* report, const ReportHeader& header,
                         std::vector<uint8_t>& frame);

  /**
   * @brief Append segment octets up to the declared body length
   */
  void append(const std::vector<uint8_t>& segment);

  /**
   * @brief Hand over the collected frame and return to IDLE
   */
  bool complete(std::vector<uint8_t>& frame);

  /**
   * @brief Record a failure, drop the transfer and return to IDLE
   */
  void fail(ErrorCode code, uint8_t packet_info);

  size_t max_frame_size_;       ///< Upper bound for body_length
  State state_;                 ///< State machine state
  std::vector<uint8_t> buffer_;  ///< Frame collected so far
  uint16_t body_length_;        ///< Declared length of the transfer in flight
  uint8_t expected_seq_;        ///< Next continuation sequence number
  ProtocolId protocol_id_;
  EmiId emi_id_;

  Failure last_failure_;
  size_t failure_count_;
  size_t completed_count_;
  size_t reports_received_;

  FailureFn failure_fn_;  ///< Failure callback
  void* failure_user_;    ///< User context for callback
};

}  // namespace usb
}  // namespace knx

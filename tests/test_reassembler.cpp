/**
 * @file test_reassembler.cpp
 * @brief Report reassembly tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <vector>

#include "knxusb/fragmenter.hpp"
#include "knxusb/log.hpp"
#include "knxusb/protocol.hpp"
#include "knxusb/reassembler.hpp"

using namespace knx::usb;

namespace
{

void silent_log(void* user, LogLevel level, const char* msg)
{
  (void)user;
  (void)level;
  (void)msg;
}

std::vector<uint8_t> make_frame(size_t len)
{
  std::vector<uint8_t> frame(len);
  frame[0] = 0x29;  // L_Data.ind
  for (size_t i = 1; i < len; ++i)
  {
    frame[i] = static_cast<uint8_t>(0xFF - i);
  }
  return frame;
}

std::vector<Report> fragment(const std::vector<uint8_t>& frame)
{
  std::vector<Report> reports;
  REQUIRE(fragment_frame(frame.data(), frame.size(), ProtocolId::KNX_TUNNEL, EmiId::COMMON_EMI,
                         reports) == ErrorCode::OK);
  return reports;
}

bool feed(Reassembler& rx, const Report& report, std::vector<uint8_t>& frame)
{
  return rx.on_report_received(report.data(), report.size(), frame);
}

struct FailureLog
{
  std::vector<Reassembler::Failure> failures;
};

void record_failure(void* user, const Reassembler::Failure& failure)
{
  static_cast<FailureLog*>(user)->failures.push_back(failure);
}

}  // namespace

/* ========================================================================= */
/* Round Trip Tests                                                          */
/* ========================================================================= */

TEST_CASE("Fragment and reassemble every frame length")
{
  set_log_handler(silent_log);
  Reassembler rx;

  for (size_t len = 1; len <= MAX_FRAME_SIZE; ++len)
  {
    CAPTURE(len);
    const std::vector<uint8_t> frame = make_frame(len);
    const std::vector<Report> reports = fragment(frame);

    std::vector<uint8_t> out;
    for (size_t i = 0; i < reports.size(); ++i)
    {
      const bool done = feed(rx, reports[i], out);
      CHECK(done == (i + 1 == reports.size()));
    }

    CHECK(out == frame);
    CHECK(rx.state() == Reassembler::State::IDLE);
  }

  CHECK(rx.completed_count() == MAX_FRAME_SIZE);
  CHECK(rx.failure_count() == 0);
  set_log_handler(nullptr);
}

TEST_CASE("Transfer boundaries")
{
  Reassembler rx;
  std::vector<uint8_t> out;

  SUBCASE("Single report transfer completes immediately")
  {
    const std::vector<uint8_t> frame = make_frame(FIRST_PACKET_MAX_DATA);
    const std::vector<Report> reports = fragment(frame);
    REQUIRE(reports.size() == 1);

    REQUIRE(feed(rx, reports[0], out));
    CHECK(out == frame);
    CHECK(rx.protocol_id() == ProtocolId::KNX_TUNNEL);
    CHECK(rx.emi_id() == EmiId::COMMON_EMI);
  }

  SUBCASE("Two report transfer collects after the start packet")
  {
    const std::vector<uint8_t> frame = make_frame(FIRST_PACKET_MAX_DATA + 1);
    const std::vector<Report> reports = fragment(frame);
    REQUIRE(reports.size() == 2);

    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK(rx.state() == Reassembler::State::COLLECTING);
    CHECK(out.empty());

    REQUIRE(feed(rx, reports[1], out));
    CHECK(out == frame);
    CHECK(rx.state() == Reassembler::State::IDLE);
  }

  SUBCASE("Padding is stripped using the body length")
  {
    const std::vector<uint8_t> frame = make_frame(10);
    std::vector<Report> reports = fragment(frame);
    for (size_t i = 11 + frame.size(); i < REPORT_SIZE; ++i)
    {
      reports[0][i] = 0xEE;
    }

    REQUIRE(feed(rx, reports[0], out));
    CHECK(out == frame);
  }
}

/* ========================================================================= */
/* Misordered Input Tests                                                    */
/* ========================================================================= */

TEST_CASE("Reassembler ordering failures")
{
  set_log_handler(silent_log);
  Reassembler rx;
  FailureLog log;
  rx.set_failure_handler(record_failure, &log);

  const std::vector<uint8_t> frame = make_frame(150);
  const std::vector<Report> reports = fragment(frame);
  REQUIRE(reports.size() == 3);
  std::vector<uint8_t> out;

  SUBCASE("Continuation without start packet")
  {
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK(rx.state() == Reassembler::State::IDLE);
    CHECK(rx.last_failure().code == ErrorCode::UNEXPECTED_CONTINUATION);
    CHECK(rx.last_failure().report_index == 0);
    CHECK(rx.last_failure().packet_info == 0x24);

    // Ready for the next start packet
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    REQUIRE(feed(rx, reports[2], out));
    CHECK(out == frame);
  }

  SUBCASE("Gap in sequence")
  {
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[2], out));
    CHECK(rx.state() == Reassembler::State::IDLE);
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.last_failure().report_index == 1);
    CHECK(out.empty());

    // The late report no longer belongs to a transfer
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK(rx.last_failure().code == ErrorCode::UNEXPECTED_CONTINUATION);
  }

  SUBCASE("Duplicate continuation")
  {
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.state() == Reassembler::State::IDLE);
  }

  SUBCASE("New start packet before the transfer is complete")
  {
    const std::vector<uint8_t> short_frame = make_frame(5);
    const std::vector<Report> short_reports = fragment(short_frame);

    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    REQUIRE(feed(rx, short_reports[0], out));
    CHECK(out == short_frame);
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.failure_count() == 1);
  }

  SUBCASE("End packet before the body length is reached")
  {
    Report truncated = reports[1];
    truncated[1] = 0x26;  // Sequence 2, partial-and-end

    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, truncated, out));
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.state() == Reassembler::State::IDLE);
  }

  SUBCASE("Failure handler sees every failure")
  {
    CHECK_FALSE(feed(rx, reports[2], out));
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[2], out));

    REQUIRE(log.failures.size() == 2);
    CHECK(log.failures[0].code == ErrorCode::UNEXPECTED_CONTINUATION);
    CHECK(log.failures[0].report_index == 0);
    CHECK(log.failures[1].code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(log.failures[1].report_index == 2);
    CHECK(rx.failure_count() == 2);
  }

  set_log_handler(nullptr);
}

/* ========================================================================= */
/* Malformed Input Tests                                                     */
/* ========================================================================= */

TEST_CASE("Reassembler malformed reports")
{
  set_log_handler(silent_log);
  Reassembler rx;

  const std::vector<uint8_t> frame = make_frame(20);
  Report report = fragment(frame)[0];
  std::vector<uint8_t> out;

  SUBCASE("Short report")
  {
    CHECK_FALSE(rx.on_report_received(report.data(), REPORT_SIZE - 1, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);
  }

  SUBCASE("Null report")
  {
    CHECK_FALSE(rx.on_report_received(nullptr, REPORT_SIZE, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);
  }

  SUBCASE("Wrong report id")
  {
    report[0] = 0x02;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::UNKNOWN_ENUM_VALUE);
  }

  SUBCASE("Protocol version mismatch")
  {
    report[3] = 0x01;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::PROTOCOL_VERSION_MISMATCH);
  }

  SUBCASE("Header length mismatch")
  {
    report[4] = 0x07;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::HEADER_LENGTH_MISMATCH);
  }

  SUBCASE("Unknown protocol id")
  {
    report[7] = 0x7E;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::UNKNOWN_ENUM_VALUE);
  }

  SUBCASE("Empty body")
  {
    report[5] = 0x00;
    report[6] = 0x00;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);
  }

  SUBCASE("Body length over the configured maximum")
  {
    Reassembler small_rx(16);
    CHECK(small_rx.max_frame_size() == 16);
    CHECK_FALSE(feed(small_rx, report, out));
    CHECK(small_rx.last_failure().code == ErrorCode::FRAME_TOO_LARGE);
  }

  SUBCASE("Maximum is clamped to the extended frame size")
  {
    Reassembler big_rx(4096);
    CHECK(big_rx.max_frame_size() == MAX_FRAME_SIZE);
  }

  SUBCASE("Start report with a continuation packet type")
  {
    report[1] = 0x14;  // Sequence 1, partial
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.last_failure().packet_info == 0x14);
  }

  SUBCASE("Start report data length disagrees with the body length")
  {
    report[2] = 8 + 19;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);

    report[2] = 0;
    CHECK_FALSE(feed(rx, report, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);
    CHECK(rx.failure_count() == 2);
  }

  SUBCASE("Continuation report with a start packet type")
  {
    std::vector<Report> reports = fragment(make_frame(150));
    reports[1][1] = 0x25;  // Sequence 2, start-and-partial

    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK(rx.last_failure().code == ErrorCode::SEQUENCE_GAP_OR_DUPLICATE);
    CHECK(rx.last_failure().report_index == 1);
  }

  SUBCASE("Continuation data length disagrees with the remaining body")
  {
    const std::vector<Report> reports = fragment(make_frame(150));

    Report empty_middle = reports[1];
    empty_middle[2] = 0;
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, empty_middle, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);

    // 150 - 52 - 61 = 37 octets remain for the last report
    Report full_last = reports[2];
    full_last[2] = 61;
    CHECK_FALSE(feed(rx, reports[0], out));
    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK_FALSE(feed(rx, full_last, out));
    CHECK(rx.last_failure().code == ErrorCode::MALFORMED_LENGTH);
    CHECK(rx.completed_count() == 0);
  }

  SUBCASE("Transfer with contradictory report headers is never delivered")
  {
    std::vector<Report> reports = fragment(make_frame(150));
    reports[0][1] = 0x14;  // Sequence 1, partial
    reports[0][2] = 0;
    reports[1][1] = 0x25;  // Sequence 2, start-and-partial
    reports[2][2] = 0;

    for (const Report& r : reports)
    {
      CHECK_FALSE(feed(rx, r, out));
    }
    CHECK(rx.completed_count() == 0);
    CHECK(rx.failure_count() == 3);
  }

  CHECK(out.empty());
  CHECK(rx.state() == Reassembler::State::IDLE);

  // Recovers with the next valid start packet
  REQUIRE(feed(rx, fragment(frame)[0], out));
  CHECK(out == frame);

  set_log_handler(nullptr);
}

/* ========================================================================= */
/* Abort Tests                                                               */
/* ========================================================================= */

TEST_CASE("Reassembler abort")
{
  set_log_handler(silent_log);
  Reassembler rx;

  const std::vector<uint8_t> frame = make_frame(100);
  const std::vector<Report> reports = fragment(frame);
  std::vector<uint8_t> out;

  SUBCASE("Abort while collecting")
  {
    CHECK_FALSE(feed(rx, reports[0], out));
    rx.abort();
    CHECK(rx.state() == Reassembler::State::IDLE);
    CHECK(rx.last_failure().code == ErrorCode::TRANSFER_ABORTED);
    CHECK(rx.failure_count() == 1);

    CHECK_FALSE(feed(rx, reports[1], out));
    CHECK(rx.last_failure().code == ErrorCode::UNEXPECTED_CONTINUATION);
  }

  SUBCASE("Abort while idle does nothing")
  {
    rx.abort();
    CHECK(rx.failure_count() == 0);
    CHECK(rx.last_failure().code == ErrorCode::OK);
  }

  set_log_handler(nullptr);
}

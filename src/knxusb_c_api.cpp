/**
 * @file knxusb_c_api.cpp
 * @brief knxusb C API implementation
 *
 * C wrapper for the C++ fragmenter and Reassembler class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>
#include <vector>

#include "knxusb/fragmenter.hpp"
#include "knxusb/knxusb.h"
#include "knxusb/reassembler.hpp"

using namespace knx::usb;

static_assert(KNXUSB_REPORT_SIZE == REPORT_SIZE, "report size mismatch");
static_assert(KNXUSB_MAX_FRAME_SIZE == MAX_FRAME_SIZE, "frame size mismatch");
static_assert(KNXUSB_MAX_REPORTS == MAX_SEQUENCE_NUMBER, "report count mismatch");

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct KnxUsbReassembler
{
  Reassembler* cpp_rx;
  knxusb_frame_fn on_frame;
  void* user;
  knxusb_failure_fn on_failure;
  void* failure_user;
  std::vector<uint8_t> frame;

  KnxUsbReassembler(knxusb_frame_fn frame_fn, void* user_ctx, size_t max_frame_size)
      : cpp_rx(nullptr),
        on_frame(frame_fn),
        user(user_ctx),
        on_failure(nullptr),
        failure_user(nullptr),
        frame()
  {
    cpp_rx = new (std::nothrow) Reassembler(max_frame_size);
  }

  ~KnxUsbReassembler()
  {
    delete cpp_rx;
  }
};

static void forward_failure(void* user, const Reassembler::Failure& failure)
{
  KnxUsbReassembler* rx = static_cast<KnxUsbReassembler*>(user);
  if (rx->on_failure)
  {
    rx->on_failure(rx->failure_user, static_cast<knxusb_error_t>(failure.code),
                   failure.report_index, failure.packet_info);
  }
}

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* knxusb_strerror(knxusb_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case KNXUSB_ERR_##name:   \
    return msg;
#include "knxusb/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Fragmentation                                                             */
/* ========================================================================= */

knxusb_error_t knxusb_fragment(const uint8_t* frame, size_t len,
                               knxusb_protocol_id_t protocol_id, knxusb_emi_id_t emi_id,
                               uint8_t* out, size_t out_size, size_t* out_count)
{
  if (out_count)
  {
    *out_count = 0;
  }

  std::vector<Report> reports;
  const ErrorCode err = fragment_frame(frame, len, static_cast<ProtocolId>(protocol_id),
                                       static_cast<EmiId>(emi_id), reports);
  if (err != ErrorCode::OK)
  {
    return static_cast<knxusb_error_t>(err);
  }

  if (out == nullptr || out_size < reports.size() * REPORT_SIZE)
  {
    return KNXUSB_ERR_CAPACITY_EXCEEDED;
  }

  for (size_t i = 0; i < reports.size(); ++i)
  {
    std::memcpy(out + i * REPORT_SIZE, reports[i].data(), REPORT_SIZE);
  }

  if (out_count)
  {
    *out_count = reports.size();
  }
  return KNXUSB_ERR_OK;
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

KnxUsbReassembler* knxusb_reassembler_create(knxusb_frame_fn on_frame, void* user,
                                             size_t max_frame_size)
{
  if (on_frame == nullptr)
  {
    return nullptr;
  }

  if (max_frame_size == 0)
  {
    max_frame_size = KNXUSB_MAX_FRAME_SIZE;
  }

  KnxUsbReassembler* rx = new (std::nothrow) KnxUsbReassembler(on_frame, user, max_frame_size);
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    delete rx;
    return nullptr;
  }

  return rx;
}

void knxusb_reassembler_destroy(KnxUsbReassembler* rx)
{
  delete rx;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

knxusb_error_t knxusb_reassembler_feed(KnxUsbReassembler* rx, const uint8_t* report, size_t len)
{
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    return KNXUSB_ERR_INVALID_ARGUMENT;
  }

  const size_t failures = rx->cpp_rx->failure_count();

  if (rx->cpp_rx->on_report_received(report, len, rx->frame))
  {
    rx->on_frame(rx->user, rx->frame.data(), rx->frame.size());
    return KNXUSB_ERR_OK;
  }

  // A start packet can fail the previous transfer and still be accepted
  if (rx->cpp_rx->failure_count() != failures &&
      rx->cpp_rx->state() == Reassembler::State::IDLE)
  {
    return static_cast<knxusb_error_t>(rx->cpp_rx->last_failure().code);
  }

  return KNXUSB_ERR_OK;
}

void knxusb_reassembler_abort(KnxUsbReassembler* rx)
{
  if (rx && rx->cpp_rx)
  {
    rx->cpp_rx->abort();
  }
}

int knxusb_reassembler_busy(const KnxUsbReassembler* rx)
{
  if (rx && rx->cpp_rx)
  {
    return rx->cpp_rx->state() == Reassembler::State::COLLECTING ? 1 : 0;
  }
  return 0;
}

void knxusb_reassembler_set_failure_handler(KnxUsbReassembler* rx, knxusb_failure_fn fn,
                                            void* user)
{
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    return;
  }

  rx->on_failure = fn;
  rx->failure_user = user;
  if (fn)
  {
    rx->cpp_rx->set_failure_handler(forward_failure, rx);
  }
  else
  {
    rx->cpp_rx->set_failure_handler(nullptr);
  }
}

size_t knxusb_reassembler_failures(const KnxUsbReassembler* rx)
{
  if (rx && rx->cpp_rx)
  {
    return rx->cpp_rx->failure_count();
  }
  return 0;
}

knxusb_error_t knxusb_reassembler_last_error(const KnxUsbReassembler* rx)
{
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    return KNXUSB_ERR_INVALID_ARGUMENT;
  }
  return static_cast<knxusb_error_t>(rx->cpp_rx->last_failure().code);
}

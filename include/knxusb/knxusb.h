/**
 * @file knxusb.h
 * @brief knxusb C API
 *
 * C-compatible interface for the KNX USB HID transfer layer.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Size of one HID report */
#define KNXUSB_REPORT_SIZE 64

  /** @brief Maximum data-link frame length */
#define KNXUSB_MAX_FRAME_SIZE 263

  /** @brief Maximum number of reports per transfer */
#define KNXUSB_MAX_REPORTS 5

  /* ========================================================================= */
  /* Identifiers                                                               */
  /* ========================================================================= */

  typedef enum
  {
    KNXUSB_PROTOCOL_KNX_TUNNEL = 0x01,                        /**< KNX Tunnel */
    KNXUSB_PROTOCOL_M_BUS_TUNNEL = 0x02,                      /**< M-Bus Tunnel */
    KNXUSB_PROTOCOL_BATIBUS_TUNNEL = 0x03,                    /**< BatiBus Tunnel */
    KNXUSB_PROTOCOL_BUS_ACCESS_SERVER_FEATURE_SERVICE = 0x0F, /**< Device feature service */
  } knxusb_protocol_id_t;

  typedef enum
  {
    KNXUSB_EMI1 = 0x01,       /**< EMI1 */
    KNXUSB_EMI2 = 0x02,       /**< EMI2 */
    KNXUSB_COMMON_EMI = 0x03, /**< cEMI */
  } knxusb_emi_id_t;

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) KNXUSB_ERR_##name = val,
#include "knxusb/errors.def"
#undef ERR
  } knxusb_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* knxusb_strerror(knxusb_error_t err);

  /* ========================================================================= */
  /* Fragmentation                                                             */
  /* ========================================================================= */

  /**
   * @brief Split a data-link frame into HID reports
   *
   * @param frame       EMI frame, message code first
   * @param len         Frame length in bytes
   * @param protocol_id Protocol identifier for the transfer header
   * @param emi_id      EMI identifier for the transfer header
   * @param out         Output buffer, KNXUSB_REPORT_SIZE bytes per report
   * @param out_size    Size of out in bytes
   * @param out_count   Receives the number of reports written (0 on error)
   * @return KNXUSB_ERR_OK on success; KNXUSB_ERR_CAPACITY_EXCEEDED if out
   *         cannot hold all reports (nothing is written)
   */
  knxusb_error_t knxusb_fragment(const uint8_t* frame, size_t len,
                                 knxusb_protocol_id_t protocol_id, knxusb_emi_id_t emi_id,
                                 uint8_t* out, size_t out_size, size_t* out_count);

  /* ========================================================================= */
  /* Reassembler handle                                                        */
  /* ========================================================================= */

  /** @brief Opaque handle to Reassembler instance */
  typedef struct KnxUsbReassembler KnxUsbReassembler;

  /**
   * @brief Frame callback function type
   *
   * @param user  User-defined context pointer
   * @param frame Reassembled EMI frame
   * @param len   Frame length in bytes
   */
  typedef void (*knxusb_frame_fn)(void* user, const uint8_t* frame, size_t len);

  /**
   * @brief Failure callback function type
   *
   * Called for every discarded report or transfer, including a transfer
   * cut short by a new start report that is itself accepted.
   *
   * @param user         User context pointer passed to
   *                     knxusb_reassembler_set_failure_handler()
   * @param err          Reason
   * @param report_index Zero-based index of the offending report
   * @param packet_info  Raw packet info octet of that report (0 if unavailable)
   */
  typedef void (*knxusb_failure_fn)(void* user, knxusb_error_t err, size_t report_index,
                                    uint8_t packet_info);

  /**
   * @brief Create a new Reassembler instance
   *
   * @param on_frame       Callback for completed frames
   * @param user           User context pointer (passed to on_frame)
   * @param max_frame_size Largest accepted frame (0: KNXUSB_MAX_FRAME_SIZE)
   * @return Pointer to Reassembler instance, or NULL on allocation failure
   */
  KnxUsbReassembler* knxusb_reassembler_create(knxusb_frame_fn on_frame, void* user,
                                               size_t max_frame_size);

  /**
   * @brief Destroy Reassembler instance and free resources
   * @param rx Reassembler instance (NULL-safe)
   */
  void knxusb_reassembler_destroy(KnxUsbReassembler* rx);

  /**
   * @brief Process one received HID report
   *
   * Invokes the frame callback when the report completes a transfer.
   *
   * A start report that arrives mid-transfer is accepted (KNXUSB_ERR_OK)
   * after the transfer in flight is discarded; that discard is visible
   * through knxusb_reassembler_failures() and the failure callback.
   *
   * @param rx     Reassembler instance
   * @param report Report bytes
   * @param len    Report length (KNXUSB_REPORT_SIZE)
   * @return KNXUSB_ERR_OK if the report was accepted, KNXUSB_ERR_INVALID_ARGUMENT
   *         for a NULL handle, otherwise the reason it was discarded
   */
  knxusb_error_t knxusb_reassembler_feed(KnxUsbReassembler* rx, const uint8_t* report,
                                         size_t len);

  /**
   * @brief Discard a transfer in progress
   * @param rx Reassembler instance
   */
  void knxusb_reassembler_abort(KnxUsbReassembler* rx);

  /**
   * @brief Check whether a transfer is in progress
   * @param rx Reassembler instance
   * @return 1 while collecting continuation reports, 0 otherwise
   */
  int knxusb_reassembler_busy(const KnxUsbReassembler* rx);

  /**
   * @brief Install a failure callback
   * @param rx   Reassembler instance
   * @param fn   Callback, NULL to remove
   * @param user User context pointer (passed to fn)
   */
  void knxusb_reassembler_set_failure_handler(KnxUsbReassembler* rx, knxusb_failure_fn fn,
                                              void* user);

  /**
   * @brief Number of discarded reports and transfers so far
   * @param rx Reassembler instance
   * @return Failure count, 0 for a NULL handle
   */
  size_t knxusb_reassembler_failures(const KnxUsbReassembler* rx);

  /**
   * @brief Reason for the most recent failure
   * @param rx Reassembler instance
   * @return Last failure code, KNXUSB_ERR_OK if none occurred,
   *         KNXUSB_ERR_INVALID_ARGUMENT for a NULL handle
   */
  knxusb_error_t knxusb_reassembler_last_error(const KnxUsbReassembler* rx);

#ifdef __cplusplus
} /* extern "C" */
#endif

/**
 * @file catalog.cpp
 * @brief Field catalog implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/catalog.hpp"

namespace knx
{
namespace usb
{

ErrorCode parse_protocol_id(uint8_t raw, ProtocolId& out)
{
  const ProtocolId id = static_cast<ProtocolId>(raw);

  switch (id)
  {
    case ProtocolId::KNX_TUNNEL:
    case ProtocolId::M_BUS_TUNNEL:
    case ProtocolId::BATIBUS_TUNNEL:
    case ProtocolId::BUS_ACCESS_SERVER_FEATURE_SERVICE:
      out = id;
      return ErrorCode::OK;
  }

  return ErrorCode::UNKNOWN_ENUM_VALUE;
}

ErrorCode parse_emi_id(uint8_t raw, EmiId& out)
{
  const EmiId id = static_cast<EmiId>(raw);

  switch (id)
  {
    case EmiId::EMI1:
    case EmiId::EMI2:
    case EmiId::COMMON_EMI:
      out = id;
      return ErrorCode::OK;
  }

  return ErrorCode::UNKNOWN_ENUM_VALUE;
}

ErrorCode parse_cemi_message_code(uint8_t raw, CemiMessageCode& out)
{
  const CemiMessageCode code = static_cast<CemiMessageCode>(raw);

  switch (code)
  {
    case CemiMessageCode::L_RAW_REQ:
    case CemiMessageCode::L_DATA_REQ:
    case CemiMessageCode::L_POLL_DATA_REQ:
    case CemiMessageCode::L_POLL_DATA_CON:
    case CemiMessageCode::L_DATA_IND:
    case CemiMessageCode::L_BUSMON_IND:
    case CemiMessageCode::L_RAW_IND:
    case CemiMessageCode::L_DATA_CON:
    case CemiMessageCode::L_RAW_CON:
    case CemiMessageCode::M_RESET_IND:
    case CemiMessageCode::M_RESET_REQ:
    case CemiMessageCode::M_PROP_WRITE_CON:
    case CemiMessageCode::M_PROP_WRITE_REQ:
    case CemiMessageCode::M_PROP_INFO_IND:
    case CemiMessageCode::M_FUNC_PROP_COMMAND_REQ:
    case CemiMessageCode::M_FUNC_PROP_STATE_READ_REQ:
    case CemiMessageCode::M_FUNC_PROP_COMMAND_CON:
    case CemiMessageCode::M_PROP_READ_CON:
    case CemiMessageCode::M_PROP_READ_REQ:
      out = code;
      return ErrorCode::OK;
  }

  return ErrorCode::UNKNOWN_ENUM_VALUE;
}

ErrorCode parse_sequence_number(uint8_t raw, SequenceNumber& out)
{
  if (raw < static_cast<uint8_t>(SequenceNumber::FIRST_PACKET) || raw > MAX_SEQUENCE_NUMBER)
  {
    return ErrorCode::UNKNOWN_ENUM_VALUE;
  }

  out = static_cast<SequenceNumber>(raw);
  return ErrorCode::OK;
}

ErrorCode parse_packet_type(uint8_t raw, PacketType& out)
{
  const PacketType type = static_cast<PacketType>(raw);

  switch (type)
  {
    case PacketType::START_AND_END:
    case PacketType::PARTIAL:
    case PacketType::START_AND_PARTIAL:
    case PacketType::PARTIAL_AND_END:
      out = type;
      return ErrorCode::OK;
  }

  return ErrorCode::UNKNOWN_ENUM_VALUE;
}

size_t max_data_size(SequenceNumber seq)
{
  return max_data_size(seq != SequenceNumber::FIRST_PACKET);
}

size_t max_data_size(bool partial)
{
  return partial ? PARTIAL_PACKET_MAX_DATA : FIRST_PACKET_MAX_DATA;
}

bool is_start(PacketType type)
{
  return type == PacketType::START_AND_END || type == PacketType::START_AND_PARTIAL;
}

bool is_end(PacketType type)
{
  return type == PacketType::START_AND_END || type == PacketType::PARTIAL_AND_END;
}

const char* to_string(ProtocolId id)
{
  switch (id)
  {
    case ProtocolId::KNX_TUNNEL:
      return "KNX Tunnel";
    case ProtocolId::M_BUS_TUNNEL:
      return "M-Bus Tunnel";
    case ProtocolId::BATIBUS_TUNNEL:
      return "BatiBus Tunnel";
    case ProtocolId::BUS_ACCESS_SERVER_FEATURE_SERVICE:
      return "Bus Access Server Feature Service";
  }
  return "unknown";
}

const char* to_string(EmiId id)
{
  switch (id)
  {
    case EmiId::EMI1:
      return "EMI1";
    case EmiId::EMI2:
      return "EMI2";
    case EmiId::COMMON_EMI:
      return "cEMI";
  }
  return "unknown";
}

const char* to_string(CemiMessageCode code)
{
  switch (code)
  {
    case CemiMessageCode::L_RAW_REQ:
      return "L_Raw.req";
    case CemiMessageCode::L_DATA_REQ:
      return "L_Data.req";
    case CemiMessageCode::L_POLL_DATA_REQ:
      return "L_PollData.req";
    case CemiMessageCode::L_POLL_DATA_CON:
      return "L_PollData.con";
    case CemiMessageCode::L_DATA_IND:
      return "L_Data.ind";
    case CemiMessageCode::L_BUSMON_IND:
      return "L_Busmon.ind";
    case CemiMessageCode::L_RAW_IND:
      return "L_Raw.ind";
    case CemiMessageCode::L_DATA_CON:
      return "L_Data.con";
    case CemiMessageCode::L_RAW_CON:
      return "L_Raw.con";
    case CemiMessageCode::M_RESET_IND:
      return "M_Reset.ind";
    case CemiMessageCode::M_RESET_REQ:
      return "M_Reset.req";
    case CemiMessageCode::M_PROP_WRITE_CON:
      return "M_PropWrite.con";
    case CemiMessageCode::M_PROP_WRITE_REQ:
      return "M_PropWrite.req";
    case CemiMessageCode::M_PROP_INFO_IND:
      return "M_PropInfo.ind";
    case CemiMessageCode::M_FUNC_PROP_COMMAND_REQ:
      return "M_FuncPropCommand.req";
    case CemiMessageCode::M_FUNC_PROP_STATE_READ_REQ:
      return "M_FuncPropStateRead.req";
    case CemiMessageCode::M_FUNC_PROP_COMMAND_CON:
      return "M_FuncPropCommand.con";
    case CemiMessageCode::M_PROP_READ_CON:
      return "M_PropRead.con";
    case CemiMessageCode::M_PROP_READ_REQ:
      return "M_PropRead.req";
  }
  return "unknown";
}

const char* to_string(PacketType type)
{
  switch (type)
  {
    case PacketType::START_AND_END:
      return "start-and-end";
    case PacketType::PARTIAL:
      return "partial";
    case PacketType::START_AND_PARTIAL:
      return "start-and-partial";
    case PacketType::PARTIAL_AND_END:
      return "partial-and-end";
  }
  return "unknown";
}

const char* to_string(ErrorCode err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "knxusb/errors.def"
#undef ERR
  }
  return "unknown error";
}

}  // namespace usb
}  // namespace knx

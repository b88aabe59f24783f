// Repository: BatchScribe
// Component: Event codec
// Purpose: JSON text <-> session events.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_PROTOCOL_EVENT_CODEC_HPP_
#define BATCHSCRIBE_PROTOCOL_EVENT_CODEC_HPP_

#include <optional>
#include <string>

#include "batchscribe/protocol/Events.hpp"

namespace batchscribe::protocol {

// Result of parsing one inbound text message: an event, or a ProtocolError
// message suitable for an outbound "error" event.
struct ParseResult {
  std::optional<InboundEvent> event;
  std::string error;

  bool ok() const { return event.has_value(); }
};

// Parses one client message.
//
// - The message must be a JSON object with a string "type".
// - audio_chunk requires "data" (array of integers 0..255) and an integer
//   "sequenceNumber"; "mimeType" defaults to audio/webm; "timestamp" optional.
// - start_recording takes an optional string "language".
// - Any other type parses to kPing / kStopRecording / kEndRecording or,
//   when unrecognised, kUnknown carrying the type string.
ParseResult ParseInbound(const std::string& text);

// Serializes one outbound event as a single-line JSON object.
std::string ToJson(const OutboundEvent& event);

}  // namespace batchscribe::protocol

#endif  // BATCHSCRIBE_PROTOCOL_EVENT_CODEC_HPP_

// Repository: BatchScribe
// Component: IEventSink Interface
// Purpose: Outbound side of one client connection.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_PROTOCOL_IEVENT_SINK_HPP_
#define BATCHSCRIBE_PROTOCOL_IEVENT_SINK_HPP_

#include "batchscribe/protocol/Events.hpp"

namespace batchscribe::protocol {

// IEventSink delivers OutboundEvents to one client.
//
// Called only from the owning session's processing thread. After Close(),
// or after a failed delivery, IsOpen() is false and Send() drops events.
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  // Returns false if the event could not be delivered.
  virtual bool Send(const OutboundEvent& event) = 0;

  // Closes the outbound connection. Safe to call multiple times.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;
};

}  // namespace batchscribe::protocol

#endif  // BATCHSCRIBE_PROTOCOL_IEVENT_SINK_HPP_

// Repository: BatchScribe
// Component: Session Scope implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/SessionScope.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "batchscribe/protocol/EventCodec.hpp"
#include "batchscribe/util/Logger.hpp"

namespace batchscribe::session {

using batchscribe::protocol::InboundType;
using batchscribe::util::Logger;

SessionScope::SessionScope(SessionRegistry& registry,
                           Finalizer& finalizer,
                           const time::ITimeSource& clock,
                           std::shared_ptr<protocol::IEventSink> sink)
    : registry_(registry),
      finalizer_(finalizer),
      session_id_(SessionRegistry::NextSessionId(clock.NowUtcMs())) {
  session_ = registry_.Create(session_id_, std::move(sink));
  if (!session_) {
    throw std::runtime_error("session id already registered: " + session_id_);
  }
  session_->SendConnectionNotice();
}

SessionScope::~SessionScope() { Close(); }

void SessionScope::Close() {
  if (!session_ || session_->state() == AudioSession::State::kClosed) return;
  try {
    finalizer_.Finalize(*session_, FinalizeReason::kDisconnect);
  } catch (const std::exception& e) {
    Logger::Error("[SessionScope] Finalize on disconnect failed session=" + session_id_ +
                  " err=" + e.what());
    registry_.Remove(session_id_);
  }
}

bool SessionScope::HandleMessage(const std::string& text) {
  std::shared_ptr<AudioSession> session = registry_.Get(session_id_);
  if (!session) {
    Logger::Warn("[SessionScope] Message for unregistered session ignored session=" +
                 session_id_);
    return false;
  }

  protocol::ParseResult parsed = protocol::ParseInbound(text);
  if (!parsed.ok()) {
    Logger::Warn("[SessionScope] Protocol error session=" + session_id_ + " err=" + parsed.error);
    session->SendError(parsed.error);
    return true;
  }

  const protocol::InboundEvent& event = *parsed.event;
  try {
    switch (event.type) {
      case InboundType::kAudioChunk:
        session->OnAudioChunk(event);
        break;
      case InboundType::kStartRecording:
        session->OnStartRecording(event.language);
        break;
      case InboundType::kEndRecording:
        finalizer_.Finalize(*session, FinalizeReason::kEndOfRecording);
        return false;
      case InboundType::kPing:
      case InboundType::kStopRecording:
      case InboundType::kUnknown:
        session->OnControl(event);
        break;
    }
  } catch (const std::exception& e) {
    Logger::Error("[SessionScope] Event handling failed session=" + session_id_ +
                  " type=" + event.type_name + " err=" + e.what());
    session->SendError(std::string("Server error: ") + e.what());
  }
  return session->state() == AudioSession::State::kActive;
}

}  // namespace batchscribe::session

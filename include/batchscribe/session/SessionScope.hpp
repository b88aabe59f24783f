// Repository: BatchScribe
// Component: Session Scope
// Purpose: Per-connection RAII guard that creates a session, routes its
//          inbound messages and guarantees finalization on every exit path.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_SESSION_SCOPE_HPP_
#define BATCHSCRIBE_SESSION_SESSION_SCOPE_HPP_

#include <memory>
#include <string>

#include "batchscribe/protocol/IEventSink.hpp"
#include "batchscribe/session/AudioSession.hpp"
#include "batchscribe/session/Finalizer.hpp"
#include "batchscribe/session/SessionRegistry.hpp"
#include "batchscribe/time/ITimeSource.hpp"

namespace batchscribe::session {

// SessionScope lives on the connection thread for the lifetime of one
// connection:
//
//   SessionScope scope(registry, finalizer, clock, sink);  // connection sent
//   while (read(text)) {
//     if (!scope.HandleMessage(text)) break;               // end_recording
//   }
//   // ~SessionScope: Finalize(kDisconnect) unless already closed
//
// Throws std::runtime_error from the constructor if the session cannot be
// registered.
class SessionScope {
 public:
  SessionScope(SessionRegistry& registry,
               Finalizer& finalizer,
               const time::ITimeSource& clock,
               std::shared_ptr<protocol::IEventSink> sink);
  ~SessionScope();

  SessionScope(const SessionScope&) = delete;
  SessionScope& operator=(const SessionScope&) = delete;

  // Parses and dispatches one text message. Returns false once the session
  // is finished (end_recording, or no longer registered) and the caller
  // should stop reading.
  bool HandleMessage(const std::string& text);

  // Runs the disconnect finalization now instead of at destruction.
  void Close();

  const std::string& session_id() const { return session_id_; }
  const std::shared_ptr<AudioSession>& session() const { return session_; }

 private:
  SessionRegistry& registry_;
  Finalizer& finalizer_;
  std::string session_id_;
  std::shared_ptr<AudioSession> session_;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_SESSION_SCOPE_HPP_

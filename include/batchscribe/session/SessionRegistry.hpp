// Repository: BatchScribe
// Component: Session Registry
// Purpose: Concurrency-safe map of active sessions keyed by session id.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_SESSION_REGISTRY_HPP_
#define BATCHSCRIBE_SESSION_SESSION_REGISTRY_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "batchscribe/protocol/IEventSink.hpp"
#include "batchscribe/session/AudioSession.hpp"

namespace batchscribe::session {

// SessionRegistry owns the existence of sessions, never their contents.
//
// Create/Get/Remove hold the mutex only for the map operation; no audio
// processing, transcription or archival ever runs under it. Sessions are
// handed out as shared_ptr so a connection thread keeps its session alive
// across a concurrent Remove().
class SessionRegistry {
 public:
  SessionRegistry(SessionSettings settings, SessionCollaborators collaborators);

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Creates and registers a new session. Returns nullptr if the id is taken.
  std::shared_ptr<AudioSession> Create(const std::string& session_id,
                                       std::shared_ptr<protocol::IEventSink> sink);

  // nullptr when absent; callers treat that as a no-op, not a fault.
  std::shared_ptr<AudioSession> Get(const std::string& session_id) const;

  // Returns true if the id was present.
  bool Remove(const std::string& session_id);

  size_t Size() const;

  // "session_<YYYYmmdd_HHMMSS>_<n>", n from a process-wide counter.
  static std::string NextSessionId(int64_t now_utc_ms);

 private:
  SessionSettings settings_;
  SessionCollaborators collaborators_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<AudioSession>> sessions_;

  static std::atomic<uint64_t> next_connection_;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_SESSION_REGISTRY_HPP_

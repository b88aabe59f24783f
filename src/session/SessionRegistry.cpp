// Repository: BatchScribe
// Component: Session Registry implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/SessionRegistry.hpp"

#include <utility>

#include "batchscribe/util/Logger.hpp"
#include "batchscribe/util/Timestamp.hpp"

namespace batchscribe::session {

using batchscribe::util::Logger;

std::atomic<uint64_t> SessionRegistry::next_connection_{1};

SessionRegistry::SessionRegistry(SessionSettings settings, SessionCollaborators collaborators)
    : settings_(std::move(settings)), collaborators_(collaborators) {}

std::shared_ptr<AudioSession> SessionRegistry::Create(
    const std::string& session_id, std::shared_ptr<protocol::IEventSink> sink) {
  // Construct outside the lock; only the insertion is serialised.
  auto session = std::make_shared<AudioSession>(session_id, settings_, collaborators_,
                                                std::move(sink));
  size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = sessions_.emplace(session_id, session);
    if (!inserted) {
      Logger::Warn("[SessionRegistry] Duplicate session id rejected session=" + session_id);
      return nullptr;
    }
    active = sessions_.size();
  }
  Logger::Info("[SessionRegistry] Session created session=" + session_id +
               " active=" + std::to_string(active));
  return session;
}

std::shared_ptr<AudioSession> SessionRegistry::Get(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

bool SessionRegistry::Remove(const std::string& session_id) {
  size_t erased = 0;
  size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    erased = sessions_.erase(session_id);
    active = sessions_.size();
  }
  if (erased > 0) {
    Logger::Info("[SessionRegistry] Session removed session=" + session_id +
                 " active=" + std::to_string(active));
  }
  return erased > 0;
}

size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::string SessionRegistry::NextSessionId(int64_t now_utc_ms) {
  const uint64_t n = next_connection_.fetch_add(1, std::memory_order_relaxed);
  return "session_" + util::FormatUtcCompact(now_utc_ms) + "_" + std::to_string(n);
}

}  // namespace batchscribe::session

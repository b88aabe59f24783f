// Repository: BatchScribe
// Component: Session Finalizer
// Purpose: Drains a session, archives its full recording exactly once and
//          removes it from the registry.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_FINALIZER_HPP_
#define BATCHSCRIBE_SESSION_FINALIZER_HPP_

#include "batchscribe/archive/ArchiveDispatcher.hpp"
#include "batchscribe/session/AudioSession.hpp"
#include "batchscribe/session/SessionRegistry.hpp"
#include "batchscribe/time/ITimeSource.hpp"

namespace batchscribe::session {

enum class FinalizeReason { kEndOfRecording, kDisconnect };

const char* FinalizeReasonName(FinalizeReason reason);

// Finalize() steps, each guarded on its own so a failure in one never
// prevents the next:
//   1. Final batch if chunk metadata is pending
//   2. recording_complete notice, then close the connection
//   3. Stop here if the session was already finalized
//   4. Build the full-session WAV (skip archival when empty)
//   5. Submit to the ArchiveDispatcher; finalized is set regardless
//   6. Remove from the registry, mark kClosed
//
// Removal in step 6 also runs after the step 3 guard: the registry never
// keeps a torn-down session.
class Finalizer {
 public:
  Finalizer(SessionRegistry& registry,
            archive::ArchiveDispatcher& dispatcher,
            const time::ITimeSource& clock);

  void Finalize(AudioSession& session, FinalizeReason reason);

 private:
  void SubmitArchive(AudioSession& session, FinalizeReason reason);

  SessionRegistry& registry_;
  archive::ArchiveDispatcher& dispatcher_;
  const time::ITimeSource& clock_;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_FINALIZER_HPP_

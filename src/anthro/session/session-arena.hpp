
#pragma once

#include <shared_mutex>

#include "verification.hpp"

#include "anthro/body/keypoint-frame.hpp"
#include "anthro/measure/measurement-set.hpp"
#include "anthro/measure/params.hpp"

namespace anthro
{
// -------------------------------------------------------------- CaptureSession
//
// The frames and per-view sets of one capture attempt, and its verification
// lifecycle. Lives in a SessionArena.
//
class CaptureSession
{
 private:
   mutable std::mutex padlock_;
   vector<KeypointFrame> frames_;
   vector<MeasurementSet> view_sets_;
   VerificationSession verification_;

 public:
   explicit CaptureSession(VerificationSession::Config config);
   CaptureSession(const CaptureSession&) = delete;
   CaptureSession(CaptureSession&&)      = delete;
   ~CaptureSession()                     = default;
   CaptureSession& operator=(const CaptureSession&) = delete;
   CaptureSession& operator=(CaptureSession&&) = delete;

   const string& user_id() const noexcept { return verification_.user_id(); }
   const string& session_id() const noexcept
   {
      return verification_.session_id();
   }
   unsigned retake_count() const noexcept
   {
      return verification_.retake_count();
   }

   VerificationSession& verification() noexcept { return verification_; }
   const VerificationSession& verification() const noexcept
   {
      return verification_;
   }

   void add_frames(const vector<KeypointFrame>& frames) noexcept(false);
   void add_view_sets(const vector<MeasurementSet>& sets) noexcept(false);

   vector<KeypointFrame> frames() const noexcept;
   vector<MeasurementSet> view_sets() const noexcept;
};

// ---------------------------------------------------------------- SessionArena
//
// Owns the live capture sessions, keyed by session id. Each session
// serializes its own transitions; the arena lock only guards the map.
//
class SessionArena
{
 public:
   struct Config
   {
      Params params                          = {};
      shared_ptr<const MeasurementPlan> plan = nullptr;
      GraceScheduler* scheduler              = nullptr; // not owned
      TransitionListener listener            = nullptr;
   };

 private:
   Config config_;
   mutable std::shared_mutex padlock_;
   hashmap<string, shared_ptr<CaptureSession>> sessions_;

   VerificationSession::Config
   make_session_config_(string user_id,
                        string session_id,
                        unsigned retake_count) const noexcept;

 public:
   explicit SessionArena(Config config);
   SessionArena(const SessionArena&) = delete;
   SessionArena& operator=(const SessionArena&) = delete;
   ~SessionArena() = default;

   const Params& params() const noexcept { return config_.params; }
   const MeasurementPlan* plan() const noexcept { return config_.plan.get(); }

   // Throws if 'session_id' is already open.
   shared_ptr<CaptureSession> open_session(string user_id,
                                           string session_id) noexcept(false);

   // 'old_session_id' must be RETAKING. Opens 'new_session_id' in CAPTURED
   // with one more retake, and closes the old session. Once the chain has
   // used 'max_retakes', the old session instead moves to RETAKES_EXHAUSTED,
   // stays open, and nullptr is returned.
   shared_ptr<CaptureSession> start_retake(const string_view old_session_id,
                                           string new_session_id) noexcept(false);

   shared_ptr<CaptureSession> find(const string_view session_id) const noexcept;

   // FALSE if there was no such session
   bool close_session(const string_view session_id) noexcept;

   size_t size() const noexcept;
   vector<string> session_ids() const noexcept; // sorted
};

} // namespace anthro


#pragma once

#include "grace-scheduler.hpp"

#include "anthro/measure/measurement-set.hpp"
#include "anthro/measure/error-kind.hpp"
#include "anthro/measure/params.hpp"

namespace anthro
{
// ----------------------------------------------------------- VerificationState
//
//    CAPTURED --> PENDING_REVIEW --> ACCEPTED
//                               \--> RETAKING --> ABANDONED
//
// A retake opens a new session in CAPTURED. A chain that runs out of retakes
// ends in RETAKES_EXHAUSTED. ACCEPTED, ABANDONED and RETAKES_EXHAUSTED are
// terminal.
//
enum class VerificationState : int8_t {
   CAPTURED = 0,
   PENDING_REVIEW,
   ACCEPTED,
   RETAKING,
   ABANDONED,
   RETAKES_EXHAUSTED
};

const char* str(const VerificationState) noexcept;
VerificationState to_verification_state(const string_view) noexcept(false);
bool is_terminal(const VerificationState) noexcept;

// ----------------------------------------------------------- TransitionTrigger
//
enum class TransitionTrigger : int8_t {
   SUBMIT = 0,         // CAPTURED -> PENDING_REVIEW
   CAPTURE_FAILURE,    // CAPTURED -> CAPTURED
   ACCEPT,             // PENDING_REVIEW -> ACCEPTED
   AMEND,              // PENDING_REVIEW -> PENDING_REVIEW
   REJECT,             // PENDING_REVIEW -> RETAKING
   RETAKE_PROPOSED,    // PENDING_REVIEW -> PENDING_REVIEW, grace expired
   ACKNOWLEDGE_RETAKE, // PENDING_REVIEW -> RETAKING
   ABANDON,            // RETAKING -> ABANDONED
   RETAKES_EXHAUSTED   // RETAKING -> RETAKES_EXHAUSTED
};

const char* str(const TransitionTrigger) noexcept;

// ------------------------------------------------------------- TransitionEvent
//
struct TransitionEvent
{
   string user_id          = ""s;
   string session_id       = ""s;
   VerificationState from  = VerificationState::CAPTURED;
   VerificationState to    = VerificationState::CAPTURED;
   TransitionTrigger trigger = TransitionTrigger::SUBMIT;
   unsigned retake_count   = 0;
   string detail           = ""s;
   Timestamp timestamp     = {};

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const TransitionEvent& o) noexcept
   {
      return o.to_string();
   }
};

// Called with the session lock held: must not call back into the session.
using TransitionListener = std::function<void(const TransitionEvent&)>;

// --------------------------------------------------------- VerificationSession
//
// The lifecycle of one capture session's reconciled set. Transitions are
// serialized per session. Illegal transitions throw std::runtime_error and
// leave the session unchanged.
//
class VerificationSession
{
 private:
   struct Pimpl;
   shared_ptr<Pimpl> pimpl_; // shared with pending grace tasks

 public:
   struct Config
   {
      string user_id                        = ""s;
      string session_id                     = ""s;
      unsigned retake_count                 = 0;
      VerificationParams params             = {};
      real min_field_confidence             = 0.5; // 'is_accurate' on amend
      shared_ptr<const MeasurementPlan> plan = nullptr; // nullptr: no check
      GraceScheduler* scheduler = nullptr; // not owned; nullptr: no timer
      TransitionListener listener = nullptr;
   };

   explicit VerificationSession(Config config);
   VerificationSession(const VerificationSession&) = delete;
   VerificationSession(VerificationSession&&)      = default;
   ~VerificationSession(); // cancels any pending grace task
   VerificationSession& operator=(const VerificationSession&) = delete;
   VerificationSession& operator=(VerificationSession&&) = default;

   const string& user_id() const noexcept;
   const string& session_id() const noexcept;
   unsigned retake_count() const noexcept;

   VerificationState state() const noexcept;
   bool retake_proposed() const noexcept;
   bool grace_timer_pending() const noexcept;
   unsigned n_capture_failures() const noexcept;

   // A copy of the submitted (possibly amended, or accepted) record.
   std::optional<ReconciledMeasurementSet> record() const noexcept;

   // CAPTURED -> PENDING_REVIEW. The record must match this session, and
   // validate against the plan. Starts the grace timer if the record is not
   // accurate.
   void submit(ReconciledMeasurementSet reconciled) noexcept(false);

   // Stays CAPTURED; a new frame is needed.
   void report_capture_failure(const string_view reason) noexcept(false);

   // PENDING_REVIEW -> ACCEPTED. Sets 'verified_by_user'. The record is
   // immutable thereafter.
   void accept() noexcept(false);

   // PENDING_REVIEW only: a user correction of one field's value.
   void amend(const string_view field, real value) noexcept(false);

   // PENDING_REVIEW -> RETAKING
   void reject() noexcept(false);

   // PENDING_REVIEW -> RETAKING, after the grace period proposed a retake.
   void acknowledge_retake() noexcept(false);

   // RETAKING -> ABANDONED
   void abandon() noexcept(false);

   // RETAKING -> RETAKES_EXHAUSTED
   void exhaust_retakes(const string_view detail) noexcept(false);

   string to_string() const noexcept;
   friend string str(const VerificationSession& o) noexcept
   {
      return o.to_string();
   }
};

} // namespace anthro

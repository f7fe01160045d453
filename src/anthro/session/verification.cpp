
#include "stdinc.hpp"

#include "verification.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/measure/compute-measurements.hpp"

#define This VerificationSession

namespace anthro
{
// ----------------------------------------------------------- VerificationState
//
const char* str(const VerificationState x) noexcept
{
   switch(x) {
#define E(x) \
   case VerificationState::x: return #x;
      E(CAPTURED);
      E(PENDING_REVIEW);
      E(ACCEPTED);
      E(RETAKING);
      E(ABANDONED);
      E(RETAKES_EXHAUSTED);
#undef E
   }
   return "<unknown>";
}

VerificationState to_verification_state(const string_view val) noexcept(false)
{
#define E(x) \
   if(val == #x) return VerificationState::x;
   E(CAPTURED);
   E(PENDING_REVIEW);
   E(ACCEPTED);
   E(RETAKING);
   E(ABANDONED);
   E(RETAKES_EXHAUSTED);
#undef E
   throw std::runtime_error(
       format("could not convert '{}' to a verification state", val));
}

bool is_terminal(const VerificationState x) noexcept
{
   return x == VerificationState::ACCEPTED or x == VerificationState::ABANDONED
          or x == VerificationState::RETAKES_EXHAUSTED;
}

// ----------------------------------------------------------- TransitionTrigger
//
const char* str(const TransitionTrigger x) noexcept
{
   switch(x) {
#define E(x) \
   case TransitionTrigger::x: return #x;
      E(SUBMIT);
      E(CAPTURE_FAILURE);
      E(ACCEPT);
      E(AMEND);
      E(REJECT);
      E(RETAKE_PROPOSED);
      E(ACKNOWLEDGE_RETAKE);
      E(ABANDON);
      E(RETAKES_EXHAUSTED);
#undef E
   }
   return "<unknown>";
}

// ------------------------------------------------------------- TransitionEvent
//
Json::Value TransitionEvent::to_json() const noexcept
{
   auto o            = Json::Value{Json::objectValue};
   o["user_id"]      = user_id;
   o["session_id"]   = session_id;
   o["from"]         = str(from);
   o["to"]           = str(to);
   o["trigger"]      = str(trigger);
   o["retake_count"] = retake_count;
   o["detail"]       = detail;
   o["timestamp"]    = json_save(timestamp);
   return o;
}

string TransitionEvent::to_string() const noexcept
{
   return format("[{}] session '{}' (user '{}', retake {}): {} -> {} on {}{}",
                 str(timestamp),
                 session_id,
                 user_id,
                 retake_count,
                 str(from),
                 str(to),
                 str(trigger),
                 (detail.empty() ? ""s : format(": {}", detail)));
}

// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   const Config config;

   mutable std::mutex padlock;
   VerificationState state = VerificationState::CAPTURED;
   std::optional<ReconciledMeasurementSet> record;
   bool retake_proposed              = false;
   GraceScheduler::task_id grace_task = 0;
   uint64_t grace_generation         = 0;
   unsigned n_capture_failures       = 0;

   explicit Pimpl(Config in_config)
       : config(std::move(in_config))
   {}

   using lock_t = std::unique_lock<std::mutex>;

   // All below with 'padlock' held

   void emit(VerificationState from,
             VerificationState to,
             TransitionTrigger trigger,
             string detail)
   {
      TransitionEvent e;
      e.user_id      = config.user_id;
      e.session_id   = config.session_id;
      e.from         = from;
      e.to           = to;
      e.trigger      = trigger;
      e.retake_count = config.retake_count;
      e.detail       = std::move(detail);
      e.timestamp    = Timestamp::now();

      TRACE(e.to_string());
      if(!config.listener) return;
      try {
         config.listener(e);
      } catch(std::exception& ex) {
         LOG_ERR(format("transition listener threw on '{}': {}",
                        e.to_string(),
                        ex.what()));
      }
   }

   void transition(VerificationState to,
                   TransitionTrigger trigger,
                   string detail = ""s)
   {
      const auto from = state;
      state           = to;
      emit(from, to, trigger, std::move(detail));
   }

   void require(VerificationState expected, const char* op) const
       noexcept(false)
   {
      if(state != expected)
         throw std::runtime_error(
             format("session '{}': cannot {} in state {} (requires {})",
                    config.session_id,
                    op,
                    str(state),
                    str(expected)));
   }

   void cancel_grace_timer() noexcept
   {
      if(grace_task != 0 and config.scheduler != nullptr)
         config.scheduler->cancel(grace_task);
      grace_task = 0;
      ++grace_generation;
   }

   void start_grace_timer(const shared_ptr<Pimpl>& self)
   {
      cancel_grace_timer();
      if(config.scheduler == nullptr) return;

      const auto delay = std::chrono::microseconds(
          int64_t(std::round(config.params.grace_period_seconds * 1e6)));
      const auto generation = grace_generation;
      std::weak_ptr<Pimpl> weak = self;

      grace_task = config.scheduler->schedule_after(delay, [weak, generation]() {
         if(auto p = weak.lock()) p->on_grace_expired(generation);
      });
   }

   void on_grace_expired(uint64_t generation)
   {
      lock_t lock(padlock);
      if(generation != grace_generation) return; // cancelled
      if(state != VerificationState::PENDING_REVIEW) return;
      grace_task      = 0;
      retake_proposed = true;
      transition(VerificationState::PENDING_REVIEW,
                 TransitionTrigger::RETAKE_PROPOSED,
                 format("no review within {}s of an inaccurate capture",
                        config.params.grace_period_seconds));
   }

   bool record_is_accurate(const ReconciledMeasurementSet& r) const noexcept
   {
      return !r.has_conflicts()
             and is_accurate(r.set.fields, config.min_field_confidence);
   }
};

// ---------------------------------------------------------------- construction
//
This::This(Config config)
    : pimpl_(make_shared<Pimpl>(std::move(config)))
{}

This::~This()
{
   if(!pimpl_) return;
   Pimpl::lock_t lock(pimpl_->padlock);
   pimpl_->cancel_grace_timer();
}

// --------------------------------------------------------------------- getters
//
const string& This::user_id() const noexcept { return pimpl_->config.user_id; }

const string& This::session_id() const noexcept
{
   return pimpl_->config.session_id;
}

unsigned This::retake_count() const noexcept
{
   return pimpl_->config.retake_count;
}

VerificationState This::state() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return pimpl_->state;
}

bool This::retake_proposed() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return pimpl_->retake_proposed;
}

bool This::grace_timer_pending() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return pimpl_->grace_task != 0;
}

unsigned This::n_capture_failures() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return pimpl_->n_capture_failures;
}

std::optional<ReconciledMeasurementSet> This::record() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return pimpl_->record;
}

// ---------------------------------------------------------------------- submit
//
void This::submit(ReconciledMeasurementSet reconciled) noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::CAPTURED, "submit");

   const auto& set = reconciled.set;
   if(set.capture_session_id != P.config.session_id)
      throw std::runtime_error(format("session '{}': cannot submit a set for "
                                      "session '{}'",
                                      P.config.session_id,
                                      set.capture_session_id));
   if(set.user_id != P.config.user_id)
      throw std::runtime_error(format("session '{}': cannot submit a set for "
                                      "user '{}', owner is '{}'",
                                      P.config.session_id,
                                      set.user_id,
                                      P.config.user_id));
   if(set.pose_type != PoseType::COMBINED)
      throw std::runtime_error(
          format("session '{}': submitted set must be 'combined', not '{}'",
                 P.config.session_id,
                 str(set.pose_type)));
   if(set.verified_by_user)
      throw std::runtime_error(
          format("session '{}': submitted set is already verified",
                 P.config.session_id));
   if(P.config.plan) validate_against_plan(set, *P.config.plan);

   const bool accurate = set.is_accurate;
   const auto detail
       = accurate ? "accurate"s
                  : (reconciled.has_conflicts()
                         ? format("inaccurate, conflicting: {}",
                                  implode(cbegin(reconciled.conflicting_fields),
                                          cend(reconciled.conflicting_fields),
                                          ", "))
                         : "inaccurate"s);

   P.record          = std::move(reconciled);
   P.retake_proposed = false;
   P.transition(VerificationState::PENDING_REVIEW,
                TransitionTrigger::SUBMIT,
                detail);

   if(!accurate) P.start_grace_timer(pimpl_);
}

// ------------------------------------------------------ report-capture-failure
//
void This::report_capture_failure(const string_view reason) noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::CAPTURED, "report a capture failure");
   ++P.n_capture_failures;
   P.transition(VerificationState::CAPTURED,
                TransitionTrigger::CAPTURE_FAILURE,
                string(reason));
}

// ---------------------------------------------------------------------- accept
//
void This::accept() noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::PENDING_REVIEW, "accept");
   Expects(P.record.has_value());

   P.cancel_grace_timer();
   P.record->set.verified_by_user = true;
   P.record->set.updated_at       = Timestamp::now();
   P.retake_proposed              = false;
   P.transition(VerificationState::ACCEPTED, TransitionTrigger::ACCEPT);
}

// ----------------------------------------------------------------------- amend
//
void This::amend(const string_view field, real value) noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   if(P.state == VerificationState::ACCEPTED)
      throw std::runtime_error(format("session '{}': the accepted record is "
                                      "immutable; start a new capture session",
                                      P.config.session_id));
   P.require(VerificationState::PENDING_REVIEW, "amend");
   Expects(P.record.has_value());

   if(!std::isfinite(value) or value <= 0.0)
      throw std::runtime_error(format("session '{}': amended value {} for "
                                      "'{}' is not finite and positive",
                                      P.config.session_id,
                                      value,
                                      field));

   auto& r  = *P.record;
   auto ii  = r.set.fields.find(field);
   if(ii == end(r.set.fields))
      throw std::runtime_error(format("session '{}': no field '{}' to amend",
                                      P.config.session_id,
                                      field));

   const real old_value = ii->second.value;
   auto& m                     = ii->second;
   m.value                     = value;
   m.confidence                = 1.0;
   m.conflicting               = false;
   m.estimated_from_front_only = false;

   auto& cf = r.conflicting_fields;
   cf.erase(std::remove(begin(cf), end(cf), ii->first), end(cf));
   r.provenance[ii->first] = {"user"s};

   r.set.is_accurate = P.record_is_accurate(r);
   r.set.updated_at  = Timestamp::now();

   P.retake_proposed = false;
   P.cancel_grace_timer();
   P.transition(VerificationState::PENDING_REVIEW,
                TransitionTrigger::AMEND,
                format("'{}': {} -> {}", field, old_value, value));
   if(!r.set.is_accurate) P.start_grace_timer(pimpl_);
}

// ---------------------------------------------------------------------- reject
//
void This::reject() noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::PENDING_REVIEW, "reject");
   P.cancel_grace_timer();
   P.transition(VerificationState::RETAKING,
                TransitionTrigger::REJECT,
                "rejected by user");
}

// ---------------------------------------------------------- acknowledge-retake
//
void This::acknowledge_retake() noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::PENDING_REVIEW, "acknowledge a retake");
   if(!P.retake_proposed)
      throw std::runtime_error(format(
          "session '{}': no retake has been proposed", P.config.session_id));
   P.cancel_grace_timer();
   P.transition(VerificationState::RETAKING,
                TransitionTrigger::ACKNOWLEDGE_RETAKE,
                "proposed retake acknowledged");
}

// --------------------------------------------------------------------- abandon
//
void This::abandon() noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::RETAKING, "abandon");
   P.transition(VerificationState::ABANDONED, TransitionTrigger::ABANDON);
}

// ------------------------------------------------------------- exhaust-retakes
//
void This::exhaust_retakes(const string_view detail) noexcept(false)
{
   auto& P = *pimpl_;
   Pimpl::lock_t lock(P.padlock);
   P.require(VerificationState::RETAKING, "exhaust retakes");
   WARN(format("{}: session '{}' (user '{}'): {}",
               str(ErrorKind::RETAKES_EXHAUSTED),
               P.config.session_id,
               P.config.user_id,
               detail));
   P.transition(VerificationState::RETAKES_EXHAUSTED,
                TransitionTrigger::RETAKES_EXHAUSTED,
                string(detail));
}

// ------------------------------------------------------------------- to-string
//
string This::to_string() const noexcept
{
   Pimpl::lock_t lock(pimpl_->padlock);
   return format("VerificationSession '{}' (user '{}', retake {}): {}{}",
                 pimpl_->config.session_id,
                 pimpl_->config.user_id,
                 pimpl_->config.retake_count,
                 str(pimpl_->state),
                 (pimpl_->retake_proposed ? ", retake proposed" : ""));
}

} // namespace anthro

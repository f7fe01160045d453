
#include "stdinc.hpp"

#include "session-arena.hpp"

namespace anthro
{
// -------------------------------------------------------------- CaptureSession
//
CaptureSession::CaptureSession(VerificationSession::Config config)
    : verification_(std::move(config))
{}

void CaptureSession::add_frames(const vector<KeypointFrame>& frames) noexcept(
    false)
{
   std::lock_guard lock(padlock_);
   frames_.insert(end(frames_), cbegin(frames), cend(frames));
}

void CaptureSession::add_view_sets(const vector<MeasurementSet>& sets) noexcept(
    false)
{
   for(const auto& s : sets)
      if(s.capture_session_id != session_id() or s.user_id != user_id())
         throw std::runtime_error(
             format("set '{}' (session '{}', user '{}') does not belong to "
                    "session '{}' of user '{}'",
                    s.set_id,
                    s.capture_session_id,
                    s.user_id,
                    session_id(),
                    user_id()));

   std::lock_guard lock(padlock_);
   view_sets_.insert(end(view_sets_), cbegin(sets), cend(sets));
}

vector<KeypointFrame> CaptureSession::frames() const noexcept
{
   std::lock_guard lock(padlock_);
   return frames_;
}

vector<MeasurementSet> CaptureSession::view_sets() const noexcept
{
   std::lock_guard lock(padlock_);
   return view_sets_;
}

// ---------------------------------------------------------------- SessionArena
//
SessionArena::SessionArena(Config config)
    : config_(std::move(config))
{}

VerificationSession::Config
SessionArena::make_session_config_(string user_id,
                                   string session_id,
                                   unsigned retake_count) const noexcept
{
   VerificationSession::Config o;
   o.user_id              = std::move(user_id);
   o.session_id           = std::move(session_id);
   o.retake_count         = retake_count;
   o.params               = config_.params.verification;
   o.min_field_confidence = config_.params.aggregate.min_field_confidence;
   o.plan                 = config_.plan;
   o.scheduler            = config_.scheduler;
   o.listener             = config_.listener;
   return o;
}

// ---------------------------------------------------------------- open-session
//
shared_ptr<CaptureSession>
SessionArena::open_session(string user_id, string session_id) noexcept(false)
{
   if(user_id.empty() or session_id.empty())
      throw std::runtime_error("user and session ids must be non-empty");

   std::unique_lock lock(padlock_);
   if(sessions_.count(session_id) > 0)
      throw std::runtime_error(
          format("session '{}' is already open", session_id));

   auto s = make_shared<CaptureSession>(
       make_session_config_(std::move(user_id), session_id, 0));
   sessions_[session_id] = s;
   return s;
}

// ---------------------------------------------------------------- start-retake
//
shared_ptr<CaptureSession>
SessionArena::start_retake(const string_view old_session_id,
                           string new_session_id) noexcept(false)
{
   // Listeners may call back into the arena, so the lock is never held while
   // the old session's verification changes state.
   auto old = find(old_session_id);
   if(old == nullptr)
      throw std::runtime_error(
          format("no open session '{}' to retake", old_session_id));

   const auto state = old->verification().state();
   if(state != VerificationState::RETAKING)
      throw std::runtime_error(format("session '{}' is {}, but a retake "
                                      "requires RETAKING",
                                      old_session_id,
                                      str(state)));

   const unsigned max_retakes = config_.params.verification.max_retakes;
   const unsigned next        = old->retake_count() + 1;
   if(next > max_retakes) {
      old->verification().exhaust_retakes(
          format("{} retakes used, maximum is {}",
                 old->retake_count(),
                 max_retakes));
      return nullptr;
   }

   std::unique_lock lock(padlock_);

   auto ii = sessions_.find(string(old_session_id));
   if(ii == end(sessions_) or ii->second != old)
      throw std::runtime_error(format("session '{}' was closed or retaken "
                                      "concurrently",
                                      old_session_id));

   if(new_session_id.empty() or sessions_.count(new_session_id) > 0)
      throw std::runtime_error(
          format("cannot open retake session '{}'", new_session_id));

   auto s = make_shared<CaptureSession>(
       make_session_config_(old->user_id(), new_session_id, next));
   sessions_.erase(ii);
   sessions_[new_session_id] = s;

   TRACE(format("session '{}' retaken as '{}' (retake {}/{})",
                old_session_id,
                new_session_id,
                next,
                max_retakes));
   return s;
}

// ------------------------------------------------------------------------ find
//
shared_ptr<CaptureSession>
SessionArena::find(const string_view session_id) const noexcept
{
   std::shared_lock lock(padlock_);
   auto ii = sessions_.find(string(session_id));
   return (ii == cend(sessions_)) ? nullptr : ii->second;
}

bool SessionArena::close_session(const string_view session_id) noexcept
{
   std::unique_lock lock(padlock_);
   return sessions_.erase(string(session_id)) > 0;
}

size_t SessionArena::size() const noexcept
{
   std::shared_lock lock(padlock_);
   return sessions_.size();
}

vector<string> SessionArena::session_ids() const noexcept
{
   vector<string> out;
   {
      std::shared_lock lock(padlock_);
      out.reserve(sessions_.size());
      for(const auto& ii : sessions_) out.push_back(ii.first);
   }
   std::sort(begin(out), end(out));
   return out;
}

} // namespace anthro

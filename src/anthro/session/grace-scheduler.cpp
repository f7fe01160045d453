
#include "stdinc.hpp"

#include "grace-scheduler.hpp"

namespace anthro
{
// ------------------------------------------------------------- ManualScheduler
//
GraceScheduler::task_id
ManualScheduler::schedule_after(duration delay, std::function<void()> f)
{
   std::lock_guard lock(padlock_);
   const auto id = next_id_++;
   tasks_.push_back({now_ + std::max(delay, duration{0}), id, std::move(f)});
   return id;
}

bool ManualScheduler::cancel(task_id id) noexcept
{
   std::lock_guard lock(padlock_);
   auto ii = std::find_if(
       begin(tasks_), end(tasks_), [id](const auto& t) { return t.id == id; });
   if(ii == end(tasks_)) return false;
   tasks_.erase(ii);
   return true;
}

size_t ManualScheduler::n_pending() const noexcept
{
   std::lock_guard lock(padlock_);
   return tasks_.size();
}

GraceScheduler::duration ManualScheduler::now() const noexcept
{
   std::lock_guard lock(padlock_);
   return now_;
}

unsigned ManualScheduler::advance(duration dt) noexcept(false)
{
   duration target;
   {
      std::lock_guard lock(padlock_);
      target = now_ + dt;
   }

   unsigned counter = 0;
   while(true) {
      std::function<void()> f;
      {
         std::lock_guard lock(padlock_);
         auto ii = std::min_element(
             begin(tasks_), end(tasks_), [](const auto& a, const auto& b) {
                return (a.deadline != b.deadline) ? a.deadline < b.deadline
                                                  : a.id < b.id;
             });
         if(ii == end(tasks_) or ii->deadline > target) break;
         now_ = ii->deadline;
         f    = std::move(ii->f);
         tasks_.erase(ii);
      }
      f();
      ++counter;
   }

   std::lock_guard lock(padlock_);
   now_ = target;
   return counter;
}

// ----------------------------------------------------------- ThreadedScheduler
//
ThreadedScheduler::ThreadedScheduler()
    : thread_([this]() { run_(); })
{}

ThreadedScheduler::~ThreadedScheduler()
{
   {
      std::lock_guard lock(padlock_);
      done_ = true;
      tasks_.clear();
   }
   cv_.notify_all();
   if(thread_.joinable()) thread_.join();
}

GraceScheduler::task_id
ThreadedScheduler::schedule_after(duration delay, std::function<void()> f)
{
   task_id id = 0;
   {
      std::lock_guard lock(padlock_);
      id = next_id_++;
      tasks_.emplace(clock::now() + std::max(delay, duration{0}),
                     std::make_pair(id, std::move(f)));
   }
   cv_.notify_all();
   return id;
}

bool ThreadedScheduler::cancel(task_id id) noexcept
{
   std::lock_guard lock(padlock_);
   for(auto ii = begin(tasks_); ii != end(tasks_); ++ii) {
      if(ii->second.first == id) {
         tasks_.erase(ii);
         return true;
      }
   }
   return false;
}

size_t ThreadedScheduler::n_pending() const noexcept
{
   std::lock_guard lock(padlock_);
   return tasks_.size();
}

void ThreadedScheduler::run_() noexcept
{
   std::unique_lock lock(padlock_);
   while(!done_) {
      if(tasks_.empty()) {
         cv_.wait(lock);
         continue;
      }

      auto ii = begin(tasks_);
      if(clock::now() < ii->first) {
         cv_.wait_until(lock, ii->first);
         continue;
      }

      auto f = std::move(ii->second.second);
      tasks_.erase(ii);

      lock.unlock();
      try {
         f();
      } catch(std::exception& e) {
         LOG_ERR(format("grace task threw: {}", e.what()));
      }
      lock.lock();
   }
}

} // namespace anthro

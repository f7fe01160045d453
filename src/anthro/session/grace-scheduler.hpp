
#pragma once

#include <chrono>
#include <condition_variable>
#include <thread>

#include "anthro/foundation.hpp"

namespace anthro
{
// -------------------------------------------------------------- GraceScheduler
//
// Runs cancellable one-shot tasks after a delay. Tasks run without any
// scheduler lock held, so they may schedule or cancel other tasks.
//
class GraceScheduler
{
 public:
   using task_id  = uint64_t;
   using duration = std::chrono::microseconds;

   virtual ~GraceScheduler() = default;

   virtual task_id schedule_after(duration delay, std::function<void()> f) = 0;

   // TRUE if the task was pending, and now never runs.
   virtual bool cancel(task_id id) noexcept = 0;

   virtual size_t n_pending() const noexcept = 0;
};

// ------------------------------------------------------------- ManualScheduler
//
// Virtual time. Nothing runs until 'advance' moves the clock past a deadline.
//
class ManualScheduler final : public GraceScheduler
{
 private:
   struct Task
   {
      duration deadline;
      task_id id;
      std::function<void()> f;
   };

   mutable std::mutex padlock_;
   duration now_{0};
   task_id next_id_ = 1;
   vector<Task> tasks_;

 public:
   ManualScheduler()                       = default;
   ManualScheduler(const ManualScheduler&) = delete;
   ManualScheduler& operator=(const ManualScheduler&) = delete;
   virtual ~ManualScheduler() = default;

   task_id schedule_after(duration delay, std::function<void()> f) override;
   bool cancel(task_id id) noexcept override;
   size_t n_pending() const noexcept override;

   duration now() const noexcept;

   // Runs every task whose deadline falls within 'dt', in deadline order.
   // Returns the number of tasks run.
   unsigned advance(duration dt) noexcept(false);
};

// ----------------------------------------------------------- ThreadedScheduler
//
// One worker thread, steady-clock deadlines.
//
class ThreadedScheduler final : public GraceScheduler
{
 private:
   using clock      = std::chrono::steady_clock;
   using time_point = clock::time_point;

   mutable std::mutex padlock_;
   std::condition_variable cv_;
   std::multimap<time_point, std::pair<task_id, std::function<void()>>> tasks_;
   task_id next_id_ = 1;
   bool done_       = false;
   std::thread thread_;

   void run_() noexcept;

 public:
   ThreadedScheduler();
   ThreadedScheduler(const ThreadedScheduler&) = delete;
   ThreadedScheduler& operator=(const ThreadedScheduler&) = delete;
   virtual ~ThreadedScheduler(); // Pending tasks are dropped

   task_id schedule_after(duration delay, std::function<void()> f) override;
   bool cancel(task_id id) noexcept override;
   size_t n_pending() const noexcept override;
};

} // namespace anthro

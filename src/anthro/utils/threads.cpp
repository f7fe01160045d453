
#include "anthro/foundation.hpp"
#include "threads.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace anthro
{
unsigned hardware_concurrency() { return std::thread::hardware_concurrency(); }

// ---------------------------------------------------------- Notification Queue

class NotificationQueue final
{
 private:
   std::deque<std::function<void()>> q_;
   bool done_{false};
   std::mutex padlock_;
   std::condition_variable ready_;

   using lock_t = std::unique_lock<decltype(padlock_)>;

 public:
   NotificationQueue()  = default;
   ~NotificationQueue() = default;

   NotificationQueue(const NotificationQueue&) = delete;
   void operator=(const NotificationQueue&) = delete;
   NotificationQueue(NotificationQueue&&)   = delete;
   void operator=(NotificationQueue&&) = delete;

   // Blocks until a job is available. Returns false once 'done_' is set and
   // the queue has drained.
   bool pop(std::function<void()>& x)
   {
      lock_t lock{padlock_};
      while(q_.empty() && !done_) ready_.wait(lock);
      if(q_.empty()) return false;
      x = std::move(q_.front());
      q_.pop_front();
      return true;
   }

   template<typename F> void push(F&& f)
   {
      {
         lock_t lock{padlock_};
         q_.emplace_back(std::forward<F>(f));
      }
      ready_.notify_one();
   }

   bool try_pop(std::function<void()>& x)
   {
      lock_t lock{padlock_, std::try_to_lock};
      if(!lock || q_.empty()) return false;
      x = std::move(q_.front());
      q_.pop_front();
      return true;
   }

   template<typename F> bool try_push(F&& f)
   {
      {
         lock_t lock{padlock_, std::try_to_lock};
         if(!lock) return false;
         q_.emplace_back(std::forward<F>(f));
      }
      ready_.notify_one();
      return true;
   }

   void done()
   {
      {
         lock_t lock{padlock_};
         done_ = true;
      }
      ready_.notify_all();
   }
};

// ----------------------------------------------------- Portable Task Schedular
// Jobs handed to the schedular never throw: ParallelJobSet wraps them.
class PortableTaskSchedular
{
 private:
   const unsigned count_{};
   std::vector<std::thread> threads_;
   unique_ptr<NotificationQueue[]> q_;
   std::atomic<unsigned> index_{0};
   std::atomic<bool> ready_{true};

   bool try_run_one_(unsigned i)
   {
      std::function<void()> f;
      for(unsigned n = 0; n != count_; ++n)
         if(q_[(i + n) % count_].try_pop(f)) break;
      if(f) {
         f();
         return true;
      }
      return false;
   }

   void run_(unsigned i)
   {
      while(true) {
         if(!try_run_one_(i)) {
            std::function<void()> f;
            if(!q_[i].pop(f)) break; // only fails on the done signal
            f();
         }
      }
   }

 public:
   PortableTaskSchedular(unsigned count = std::max(hardware_concurrency(), 4u))
       : count_(count)
       , q_(new NotificationQueue[count_])
   {
      threads_.reserve(count_);
      for(unsigned n = 0; n != count_; ++n)
         threads_.emplace_back([this, n] { this->run_(n); });
   }

   ~PortableTaskSchedular() { dispose(); }

   void dispose()
   {
      if(!ready_.exchange(false)) return;
      for(unsigned ind = 0; ind < count_; ++ind) q_[ind].done();
      for(auto& e : threads_)
         if(e.joinable()) e.join();
   }

   template<typename F> void schedule(F&& f)
   {
      if(!ready_) return;
      unsigned i = index_++;
      for(unsigned n = 0; n != count_; ++n)
         if(q_[(i + n) % count_].try_push(std::forward<F>(f))) return;
      q_[i % count_].push(std::forward<F>(f));
   }

   bool try_run_one()
   {
      static std::atomic<unsigned> counter{0};
      return try_run_one_(counter++ % count_);
   }
};

// -------------------------------------------------------------------- Schedule

static inline PortableTaskSchedular& global_schedular()
{
   static PortableTaskSchedular instance;
   return instance;
}

void schedule(std::function<void()> f)
{
   global_schedular().schedule(std::move(f));
}

// --------------------------------------------------------------- Parallel Jobs

void ParallelJobSet::reserve(size_t sz)
{
   if(Fs.size() < sz) Fs.reserve(sz);
}

void ParallelJobSet::schedule(std::function<void()> f)
{
   Fs.emplace_back(std::move(f));
}

void ParallelJobSet::execute() noexcept(false)
{
   auto jobs        = std::move(Fs);
   const unsigned N = unsigned(jobs.size());
   Fs.clear();

   std::atomic<unsigned> counter{0};
   std::mutex padlock;
   std::exception_ptr first_error = nullptr;

   auto run_job = [&](unsigned i) {
      try {
         jobs[i]();
      } catch(...) {
         std::lock_guard<decltype(padlock)> lock(padlock);
         if(!first_error) first_error = std::current_exception();
      }
      ++counter;
   };

   for(unsigned i = 0; i < N; ++i)
      ::anthro::schedule([&run_job, i]() { run_job(i); });

   while(counter < N)
      if(!global_schedular().try_run_one()) std::this_thread::yield();

   if(first_error) std::rethrow_exception(first_error);
}

} // namespace anthro

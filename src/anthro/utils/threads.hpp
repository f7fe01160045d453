
#pragma once

#include <exception>
#include <functional>
#include <vector>

namespace anthro
{
unsigned hardware_concurrency();
void schedule(std::function<void()> f);

// A batch of independent jobs. `execute` blocks until every job has run, then
// rethrows the first exception any job raised.
class ParallelJobSet
{
 private:
   std::vector<std::function<void()>> Fs;

 public:
   ParallelJobSet()                      = default;
   ParallelJobSet(const ParallelJobSet&) = delete;
   ParallelJobSet(ParallelJobSet&&)      = default;
   ~ParallelJobSet()                     = default;
   ParallelJobSet& operator=(const ParallelJobSet&) = delete;
   ParallelJobSet& operator=(ParallelJobSet&&) = default;

   void reserve(size_t sz); // ensure capacity for jobs
   size_t size() const noexcept { return Fs.size(); }

   void schedule(std::function<void()>);
   void execute() noexcept(false); // Re-uses the current thread during execute
};

} // namespace anthro

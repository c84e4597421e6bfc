#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace chunksync::engine {

enum class JobState {
    kPending,
    kRunning,
    kSucceeded,
    kFailed,
};

const char* to_string(JobState state);

struct Job {
    std::string name;
    std::function<void()> work;
    JobState state = JobState::kPending;
    std::string error;
    std::exception_ptr exception;
};

// state, error and exception are written by a worker under the scheduler lock.
// Read them directly only once the handle came back from wait_any; poll a
// running job through JobScheduler::state_of.
using JobHandle = std::shared_ptr<const Job>;

struct BatchResult {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::vector<std::string> failures;
    std::exception_ptr first_exception;

    bool ok() const { return failed == 0; }
    // Rethrows the first captured failure; no-op for a clean batch.
    void rethrow_if_failed() const;
};

// Bounded worker pool. At most max_parallel jobs run at once; the rest wait
// in FIFO order. All waiting is done on a condition variable.
class JobScheduler {
public:
    explicit JobScheduler(std::size_t max_parallel);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    JobHandle submit(std::string name, std::function<void()> work);

    // Blocks until a finished job not yet returned by wait_any is available.
    // Returns nullptr when nothing is outstanding.
    JobHandle wait_any();

    // Blocks until every submitted job has finished, failed ones included.
    BatchResult wait_all();

    JobState state_of(const JobHandle& job) const;

    std::size_t max_parallel() const { return workers_.size(); }
    std::size_t peak_active() const;

    void shutdown();

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::shared_ptr<Job>> pending_;
    std::vector<std::shared_ptr<Job>> batch_;
    std::deque<std::shared_ptr<Job>> finished_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::size_t active_ = 0;
    std::size_t peak_active_ = 0;
    std::size_t outstanding_ = 0;
    bool stopping_{false};
};

}  // namespace chunksync::engine

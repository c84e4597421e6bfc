#include "job_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

namespace chunksync::engine {

const char* to_string(JobState state) {
    switch (state) {
        case JobState::kPending:
            return "pending";
        case JobState::kRunning:
            return "running";
        case JobState::kSucceeded:
            return "succeeded";
        case JobState::kFailed:
            return "failed";
        default:
            return "unknown";
    }
}

void BatchResult::rethrow_if_failed() const {
    if (first_exception) {
        std::rethrow_exception(first_exception);
    }
    if (failed > 0) {
        throw std::runtime_error(failures.empty() ? "Job batch failed" : failures.front());
    }
}

JobScheduler::JobScheduler(std::size_t max_parallel) {
    if (max_parallel == 0) {
        throw std::invalid_argument("max_parallel must be > 0");
    }
    for (std::size_t i = 0; i < max_parallel; ++i) {
        workers_.emplace_back(&JobScheduler::worker_loop, this);
    }
}

JobScheduler::~JobScheduler() {
    shutdown();
}

JobHandle JobScheduler::submit(std::string name, std::function<void()> work) {
    auto job = std::make_shared<Job>();
    job->name = std::move(name);
    job->work = std::move(work);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("JobScheduler is shut down");
        }
        pending_.push(job);
        batch_.push_back(job);
        ++outstanding_;
    }
    work_cv_.notify_one();
    return job;
}

JobHandle JobScheduler::wait_any() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [&] { return !finished_.empty() || outstanding_ == 0; });
    if (finished_.empty()) {
        return nullptr;
    }
    auto job = finished_.front();
    finished_.pop_front();
    return job;
}

BatchResult JobScheduler::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [&] { return outstanding_ == 0; });

    BatchResult result;
    for (const auto& job : batch_) {
        if (job->state == JobState::kSucceeded) {
            ++result.succeeded;
            continue;
        }
        ++result.failed;
        result.failures.push_back(job->name + ": " + job->error);
        if (!result.first_exception) {
            result.first_exception = job->exception;
        }
    }
    batch_.clear();
    finished_.clear();
    return result;
}

JobState JobScheduler::state_of(const JobHandle& job) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return job->state;
}

std::size_t JobScheduler::peak_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_active_;
}

void JobScheduler::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        // Queued jobs still run so no caller is left waiting on them.
        done_cv_.wait(lock, [&] { return outstanding_ == 0; });
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void JobScheduler::worker_loop() {
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [&] { return stopping_ || !pending_.empty(); });
            if (stopping_ && pending_.empty()) {
                return;
            }
            job = std::move(pending_.front());
            pending_.pop();
            job->state = JobState::kRunning;
            ++active_;
            peak_active_ = std::max(peak_active_, active_);
        }

        JobState outcome = JobState::kSucceeded;
        std::string error;
        std::exception_ptr exception;
        try {
            job->work();
        } catch (const std::exception& ex) {
            outcome = JobState::kFailed;
            error = ex.what();
            exception = std::current_exception();
        } catch (...) {
            outcome = JobState::kFailed;
            error = "unknown exception";
            exception = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            job->state = outcome;
            job->error = std::move(error);
            job->exception = exception;
            job->work = nullptr;
            --active_;
            --outstanding_;
            finished_.push_back(job);
        }
        done_cv_.notify_all();
    }
}

}  // namespace chunksync::engine

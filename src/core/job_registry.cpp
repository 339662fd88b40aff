#include "core/job_registry.hpp"
#include "core/random_id.hpp"
#include "logging/logger.hpp"
#include <mutex>

std::string JobRegistry::add(OperationKind kind, CancellationTokenPtr token)
{
    std::shared_lock<std::shared_mutex> structure(structure_mutex_);
    for (;;)
    {
        JobMap::accessor accessor;
        std::string id = RandomId::hex(8);
        if (!jobs_.insert(accessor, id))
            continue;

        accessor->second.id = id;
        accessor->second.kind = kind;
        accessor->second.state = JobState::RECEIVED;
        accessor->second.started = std::chrono::system_clock::now();
        accessor->second.token = std::move(token);
        return id;
    }
}

bool JobRegistry::setState(const std::string &id, JobState state)
{
    JobMap::accessor accessor;
    if (!jobs_.find(accessor, id))
        return false;
    accessor->second.state = state;
    return true;
}

void JobRegistry::remove(const std::string &id)
{
    JobState last = JobState::FAILED;
    {
        std::shared_lock<std::shared_mutex> structure(structure_mutex_);
        JobMap::accessor accessor;
        if (!jobs_.find(accessor, id))
            return;
        last = accessor->second.state;
        jobs_.erase(accessor);
    }
    if (last == JobState::DONE)
        ++completed_;
    else
        ++failed_;
}

size_t JobRegistry::cancelAll(const std::string &reason)
{
    size_t cancelled = 0;
    // cancel() only; isCancelled() would run a disconnect check bound to a request from this thread
    for (const auto &job : snapshot())
    {
        if (job.token)
        {
            job.token->cancel(reason);
            ++cancelled;
        }
    }
    if (cancelled > 0)
    {
        Logger::info("JobRegistry: cancelled " + std::to_string(cancelled) + " in-flight job(s): " + reason);
    }
    return cancelled;
}

std::vector<JobInfo> JobRegistry::snapshot() const
{
    std::unique_lock<std::shared_mutex> structure(structure_mutex_);
    std::vector<JobInfo> jobs;
    jobs.reserve(jobs_.size());
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it)
    {
        jobs.push_back(it->second);
    }
    return jobs;
}

std::string JobRegistry::stateName(JobState state)
{
    switch (state)
    {
    case JobState::RECEIVED:
        return "received";
    case JobState::VALIDATED:
        return "validated";
    case JobState::STAGED:
        return "staged";
    case JobState::TRANSFORMING:
        return "transforming";
    case JobState::STREAMING:
        return "streaming";
    case JobState::DONE:
        return "done";
    case JobState::FAILED:
        return "failed";
    default:
        return "unknown";
    }
}

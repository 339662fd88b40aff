#pragma once

#include "core/cancellation_token.hpp"
#include "core/conversion_spec.hpp"
#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <string>
#include <tbb/concurrent_hash_map.h>
#include <vector>

enum class JobState
{
    RECEIVED,
    VALIDATED,
    STAGED,
    TRANSFORMING,
    STREAMING,
    DONE,
    FAILED
};

/**
 * @brief Snapshot of one in-flight job
 */
struct JobInfo
{
    std::string id;
    OperationKind kind = OperationKind::IMAGE_CONVERT;
    JobState state = JobState::RECEIVED;
    std::chrono::system_clock::time_point started;
    CancellationTokenPtr token;
};

/**
 * @brief Process-wide table of in-flight jobs
 *
 * Jobs are added when a request is accepted and removed once their workspace
 * is gone. Shutdown uses cancelAll() to stop running transformations.
 */
class JobRegistry
{
public:
    /**
     * @brief Register a new job in state RECEIVED
     * @return Generated job id
     */
    std::string add(OperationKind kind, CancellationTokenPtr token);

    // Returns false if the job is unknown
    bool setState(const std::string &id, JobState state);

    // Removes the job and counts it as completed or failed by its last state
    void remove(const std::string &id);

    /**
     * @brief Cancel every registered job
     * @return Number of jobs that were cancelled
     */
    size_t cancelAll(const std::string &reason);

    std::vector<JobInfo> snapshot() const;
    size_t count() const { return jobs_.size(); }

    uint64_t completedCount() const { return completed_.load(); }
    uint64_t failedCount() const { return failed_.load(); }

    static std::string stateName(JobState state);

private:
    using JobMap = tbb::concurrent_hash_map<std::string, JobInfo>;

    JobMap jobs_;
    // Shared for insert and erase, exclusive for traversal
    mutable std::shared_mutex structure_mutex_;
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

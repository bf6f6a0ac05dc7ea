#ifndef VIETVOICE_JOB_STORE_H
#define VIETVOICE_JOB_STORE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "Assembler.hpp"

namespace vietvoice {

using Clock = std::chrono::steady_clock;

struct JobSummary
{
  std::string id;
  double durationSeconds = 0.0;
  int sampleRate = 0;
  std::size_t sizeBytes = 0;
};

// What an eviction policy gets to see of a job
struct JobInfo
{
  std::string id;
  Clock::time_point createdAt;
  std::size_t sizeBytes = 0;
};

class EvictionPolicy
{
public:
  virtual ~EvictionPolicy() = default;

  // jobs are ordered oldest first; returns the ids to drop
  virtual std::vector<std::string> selectVictims(const std::vector<JobInfo>& jobs, Clock::time_point now) const = 0;
};

class TtlEvictionPolicy : public EvictionPolicy
{
public:
  explicit TtlEvictionPolicy(Clock::duration lifespan) : m_lifespan(lifespan) {}

  std::vector<std::string> selectVictims(const std::vector<JobInfo>& jobs, Clock::time_point now) const override;

private:
  Clock::duration m_lifespan;
};

// Drops the oldest jobs until both bounds hold; 0 disables a bound
class CapacityEvictionPolicy : public EvictionPolicy
{
public:
  CapacityEvictionPolicy(std::size_t maxJobs, std::size_t maxBytes) : m_maxJobs(maxJobs), m_maxBytes(maxBytes) {}

  std::vector<std::string> selectVictims(const std::vector<JobInfo>& jobs, Clock::time_point now) const override;

private:
  std::size_t m_maxJobs;
  std::size_t m_maxBytes;
};

class CompositeEvictionPolicy : public EvictionPolicy
{
public:
  explicit CompositeEvictionPolicy(std::vector<std::unique_ptr<EvictionPolicy>> policies)
      : m_policies(std::move(policies)) {}

  std::vector<std::string> selectVictims(const std::vector<JobInfo>& jobs, Clock::time_point now) const override;

private:
  std::vector<std::unique_ptr<EvictionPolicy>> m_policies;
};

// Process-wide map from job id to finished audio for the two-step
// (generate, then download) pattern. Safe for concurrent use.
//
// Entries are immutable once created; fetch hands out shared references, so
// an eviction racing a fetch either happens before it (NotFoundError) or
// after it (the fetch keeps its copy alive).
class JobStore
{
public:
  explicit JobStore(std::unique_ptr<EvictionPolicy> policy = nullptr);

  JobStore(const JobStore&) = delete;
  JobStore& operator=(const JobStore&) = delete;

  JobSummary create(AssembledAudio audio);
  JobSummary create(AssembledAudio audio, Clock::time_point now);

  // Throws NotFoundError for unknown or evicted ids
  AssembledAudio fetch(const std::string& id) const;
  std::shared_ptr<const std::string> fetchEncoded(const std::string& id) const;
  JobSummary describe(const std::string& id) const;

  bool evict(const std::string& id);
  std::size_t evictCreatedBefore(Clock::time_point cutoff);

  // Apply the eviction policy to every job
  std::size_t sweep();
  std::size_t sweep(Clock::time_point now);

  std::size_t size() const;
  std::size_t totalBytes() const;

private:
  struct Job
  {
    std::string id;
    std::uint64_t sequence = 0;
    Clock::time_point createdAt;
    std::shared_ptr<const AssembledAudio> audio;
    std::shared_ptr<const std::string> encoded;
  };

  std::string nextId();
  const Job& findLocked(const std::string& id) const;
  std::vector<JobInfo> snapshotLocked() const;
  std::size_t applyPolicyLocked(Clock::time_point now, const std::string& keepId);
  void eraseLocked(const std::string& id);

  mutable std::mutex m_mutex;
  std::unordered_map<std::string, Job> m_jobs;
  std::unique_ptr<EvictionPolicy> m_policy;
  std::mt19937_64 m_random;
  std::uint64_t m_sequence = 0;
  std::size_t m_totalBytes = 0;
};

} // namespace vietvoice

#endif // VIETVOICE_JOB_STORE_H

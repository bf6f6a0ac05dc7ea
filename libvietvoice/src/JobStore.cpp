#include "JobStore.hpp"

#include <algorithm>
#include <set>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "WavFile.hpp"

namespace vietvoice {

std::vector<std::string> TtlEvictionPolicy::selectVictims(const std::vector<JobInfo>& jobs,
                                                          Clock::time_point now) const {
  std::vector<std::string> victims;
  for (const auto& job : jobs)
  {
    if (now - job.createdAt > m_lifespan)
    {
      victims.push_back(job.id);
    }
  }
  return victims;
}

std::vector<std::string> CapacityEvictionPolicy::selectVictims(const std::vector<JobInfo>& jobs,
                                                               Clock::time_point /*now*/) const {
  std::size_t count = jobs.size();
  std::size_t bytes = 0;
  for (const auto& job : jobs)
  {
    bytes += job.sizeBytes;
  }

  std::vector<std::string> victims;
  for (const auto& job : jobs)
  {
    bool overCount = m_maxJobs > 0 && count > m_maxJobs;
    bool overBytes = m_maxBytes > 0 && bytes > m_maxBytes;
    if (!overCount && !overBytes)
    {
      break;
    }
    victims.push_back(job.id);
    count--;
    bytes -= job.sizeBytes;
  }
  return victims;
}

std::vector<std::string> CompositeEvictionPolicy::selectVictims(const std::vector<JobInfo>& jobs,
                                                                Clock::time_point now) const {
  std::set<std::string> seen;
  std::vector<std::string> victims;
  for (const auto& policy : m_policies)
  {
    for (auto& id : policy->selectVictims(jobs, now))
    {
      if (seen.insert(id).second)
      {
        victims.push_back(std::move(id));
      }
    }
  }
  return victims;
}

JobStore::JobStore(std::unique_ptr<EvictionPolicy> policy) : m_policy(std::move(policy)) {
  std::random_device device;
  m_random.seed((static_cast<std::uint64_t>(device()) << 32) ^ device());
}

JobSummary JobStore::create(AssembledAudio audio) { return create(std::move(audio), Clock::now()); }

JobSummary JobStore::create(AssembledAudio audio, Clock::time_point now) {
  if (audio.sampleRate <= 0)
  {
    throw InvalidInputError("cannot register audio without a sample rate");
  }

  // Encode before taking the lock; entries never change after insertion
  auto encoded = std::make_shared<const std::string>(encodeWav(audio.samples, audio.sampleRate));
  auto shared = std::make_shared<const AssembledAudio>(std::move(audio));

  JobSummary summary;
  summary.durationSeconds = shared->durationSeconds;
  summary.sampleRate = shared->sampleRate;
  summary.sizeBytes = encoded->size();

  std::lock_guard<std::mutex> lock(m_mutex);
  Job job;
  job.id = nextId();
  job.sequence = m_sequence;
  job.createdAt = now;
  job.audio = std::move(shared);
  job.encoded = std::move(encoded);
  summary.id = job.id;

  m_totalBytes += summary.sizeBytes;
  m_jobs.emplace(job.id, std::move(job));
  spdlog::info("Registered job {} ({} second(s), {} byte(s))", summary.id, summary.durationSeconds, summary.sizeBytes);

  if (m_policy)
  {
    applyPolicyLocked(now, summary.id);
  }
  return summary;
}

AssembledAudio JobStore::fetch(const std::string& id) const {
  std::shared_ptr<const AssembledAudio> audio;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    audio = findLocked(id).audio;
  }
  return *audio;
}

std::shared_ptr<const std::string> JobStore::fetchEncoded(const std::string& id) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return findLocked(id).encoded;
}

JobSummary JobStore::describe(const std::string& id) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  const Job& job = findLocked(id);

  JobSummary summary;
  summary.id = job.id;
  summary.durationSeconds = job.audio->durationSeconds;
  summary.sampleRate = job.audio->sampleRate;
  summary.sizeBytes = job.encoded->size();
  return summary;
}

bool JobStore::evict(const std::string& id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_jobs.find(id) == m_jobs.end())
  {
    return false;
  }
  eraseLocked(id);
  spdlog::info("Evicted job {}", id);
  return true;
}

std::size_t JobStore::evictCreatedBefore(Clock::time_point cutoff) {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> expired;
  for (const auto& entry : m_jobs)
  {
    if (entry.second.createdAt < cutoff)
    {
      expired.push_back(entry.first);
    }
  }
  for (const auto& id : expired)
  {
    eraseLocked(id);
  }
  if (!expired.empty())
  {
    spdlog::info("Evicted {} job(s) created before cutoff", expired.size());
  }
  return expired.size();
}

std::size_t JobStore::sweep() { return sweep(Clock::now()); }

std::size_t JobStore::sweep(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_policy)
  {
    return 0;
  }
  return applyPolicyLocked(now, std::string());
}

std::size_t JobStore::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.size();
}

std::size_t JobStore::totalBytes() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_totalBytes;
}

std::string JobStore::nextId() {
  // Random prefix keeps ids unguessable, the sequence keeps them unique
  m_sequence++;
  return fmt::format("{:012x}{:06x}", m_random() & 0xFFFFFFFFFFFFull, m_sequence);
}

const JobStore::Job& JobStore::findLocked(const std::string& id) const {
  auto it = m_jobs.find(id);
  if (it == m_jobs.end())
  {
    throw NotFoundError(id);
  }
  return it->second;
}

std::vector<JobInfo> JobStore::snapshotLocked() const {
  std::vector<const Job*> ordered;
  ordered.reserve(m_jobs.size());
  for (const auto& entry : m_jobs)
  {
    ordered.push_back(&entry.second);
  }
  std::sort(ordered.begin(), ordered.end(), [](const Job* a, const Job* b) { return a->sequence < b->sequence; });

  std::vector<JobInfo> jobs;
  jobs.reserve(ordered.size());
  for (const Job* job : ordered)
  {
    jobs.push_back({job->id, job->createdAt, job->encoded->size()});
  }
  return jobs;
}

std::size_t JobStore::applyPolicyLocked(Clock::time_point now, const std::string& keepId) {
  std::size_t evicted = 0;
  for (const auto& id : m_policy->selectVictims(snapshotLocked(), now))
  {
    if (id == keepId || m_jobs.find(id) == m_jobs.end())
    {
      continue;
    }
    eraseLocked(id);
    evicted++;
    spdlog::debug("Eviction policy dropped job {}", id);
  }
  if (evicted > 0)
  {
    spdlog::info("Evicted {} job(s), {} remaining", evicted, m_jobs.size());
  }
  return evicted;
}

void JobStore::eraseLocked(const std::string& id) {
  auto it = m_jobs.find(id);
  m_totalBytes -= it->second.encoded->size();
  m_jobs.erase(it);
}

} // namespace vietvoice

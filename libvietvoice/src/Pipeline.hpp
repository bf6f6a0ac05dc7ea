#ifndef VIETVOICE_PIPELINE_H
#define VIETVOICE_PIPELINE_H

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Assembler.hpp"
#include "Config.hpp"
#include "JobStore.hpp"
#include "SegmentSynthesizer.hpp"
#include "Segmenter.hpp"
#include "VoiceParameters.hpp"

namespace vietvoice {

// One caller's request; never shared between requests
struct SynthesisRequest
{
  std::string text;
  VoiceSelection voice;
  std::optional<float> speed;
  std::optional<std::size_t> sampleIteration;
  std::optional<ReferenceOverride> reference;
};

// Empty when neither is given; throws InvalidParameterError naming the
// missing half when only one is
std::optional<ReferenceOverride> pairReference(const std::string& audioFile, const std::string& text);

struct PreparedRequest
{
  std::vector<TextChunk> chunks;
  VoiceParameters voice;
  SynthesisOptions options;
};

struct SynthesisStats
{
  std::size_t chunkCount = 0;
  double inferSeconds = 0.0;
  double audioSeconds = 0.0;
  double realTimeFactor = 0.0;
};

// Text in, one continuous track out, plus the job store for deferred
// downloads. The pipeline itself holds no per-request state.
class Pipeline
{
public:
  Pipeline(std::shared_ptr<SegmentSynthesizer> synthesizer, const ServiceConfig& config);

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Throws InvalidInputError or InvalidParameterError
  PreparedRequest segmentAndResolve(const std::string& text, const VoiceSelection& explicitParams) const;
  PreparedRequest prepare(const SynthesisRequest& request) const;

  // Throws SynthesisBackendError or FormatMismatchError; never returns a
  // track with a chunk missing
  AssembledAudio synthesizeAll(const std::vector<TextChunk>& chunks,
                               const VoiceParameters& voice,
                               const SynthesisOptions& options) const;
  AssembledAudio synthesizeAll(const std::vector<TextChunk>& chunks,
                               const VoiceParameters& voice,
                               const SynthesisOptions& options,
                               SynthesisStats& stats) const;

  AssembledAudio synthesize(const SynthesisRequest& request) const;
  AssembledAudio synthesize(const SynthesisRequest& request, SynthesisStats& stats) const;

  JobSummary registerJob(AssembledAudio audio);
  AssembledAudio fetchJob(const std::string& jobId) const;
  std::shared_ptr<const std::string> fetchJobWav(const std::string& jobId) const;
  bool evictJob(const std::string& jobId);
  std::size_t sweepJobs();

  JobStore& jobs() { return m_jobs; }
  const ServiceConfig& config() const { return m_config; }

private:
  SynthesizedSegment synthesizeChunk(const TextChunk& chunk,
                                     const VoiceParameters& voice,
                                     const SynthesisOptions& options) const;

  ServiceConfig m_config;
  std::shared_ptr<SegmentSynthesizer> m_synthesizer;
  Segmenter m_segmenter;
  JobStore m_jobs;
};

} // namespace vietvoice

#endif // VIETVOICE_PIPELINE_H

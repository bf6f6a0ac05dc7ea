#include "Pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "TextNormalizer.hpp"

using namespace vietvoice;

std::optional<ReferenceOverride> vietvoice::pairReference(const std::string& audioFile, const std::string& text) {
  if (audioFile.empty() && text.empty())
  {
    return std::nullopt;
  }
  if (text.empty())
  {
    throw InvalidParameterError("reference_text", "required together with reference_audio");
  }
  if (audioFile.empty())
  {
    throw InvalidParameterError("reference_audio", "required together with reference_text");
  }
  return ReferenceOverride{audioFile, text};
}

Pipeline::Pipeline(std::shared_ptr<SegmentSynthesizer> synthesizer, const ServiceConfig& config)
    : m_config(config), m_synthesizer(std::move(synthesizer)), m_segmenter(config.segmentation),
      m_jobs(makeEvictionPolicy(config.jobs)) {
  if (!m_synthesizer)
  {
    throw std::runtime_error("Pipeline requires a segment synthesizer");
  }
  validateServiceConfig(m_config);

  spdlog::debug("Pipeline ready: max {} character(s) per chunk, {} synthesis thread(s), {} Hz",
                m_config.segmentation.maxChars,
                m_config.synthesisThreads,
                m_synthesizer->sampleRate());
}

PreparedRequest Pipeline::segmentAndResolve(const std::string& text, const VoiceSelection& explicitParams) const {
  if (text.find_first_not_of(" \t\n\r\f\v") == std::string::npos)
  {
    throw InvalidInputError("text is empty");
  }

  std::size_t length = codepointLength(text);
  if (length > m_config.maxInputChars)
  {
    throw InvalidInputError("text has " + std::to_string(length) + " characters, the limit is " +
                            std::to_string(m_config.maxInputChars));
  }

  PreparedRequest prepared;
  prepared.voice = resolveVoice(explicitParams, m_config.voiceDefaults);
  prepared.options.speed = m_config.defaultSpeed;

  if (m_config.normalizeText)
  {
    auto normalized = normalizeText(text);
    spdlog::debug("Normalized text: {}", normalized);
    prepared.chunks = m_segmenter.segment(normalized);
  }
  else
  {
    prepared.chunks = m_segmenter.segment(text);
  }

  return prepared;
}

PreparedRequest Pipeline::prepare(const SynthesisRequest& request) const {
  auto prepared = segmentAndResolve(request.text, request.voice);

  if (request.speed)
  {
    float speed = *request.speed;
    if (!(speed >= MIN_SPEED && speed <= MAX_SPEED))
    {
      throw InvalidParameterError("speed", "must be within [0.25, 2.0]");
    }
    prepared.options.speed = speed;
  }
  if (request.sampleIteration)
  {
    prepared.options.sampleIteration = *request.sampleIteration;
  }
  if (request.reference)
  {
    const auto& reference = *request.reference;
    if (reference.file.empty())
    {
      throw InvalidParameterError("reference_audio", "required together with reference_text");
    }
    if (!std::filesystem::is_regular_file(reference.file))
    {
      throw InvalidParameterError("reference_audio", "no such file: " + reference.file);
    }
    std::string transcript;
    try
    {
      transcript = normalizeText(reference.text);
    }
    catch (const InvalidInputError& e)
    {
      throw InvalidParameterError("reference_text", e.what());
    }
    prepared.options.reference = ReferenceOverride{reference.file, transcript};
    spdlog::debug("Using caller reference {} instead of the catalog", reference.file);
  }

  return prepared;
}

SynthesizedSegment Pipeline::synthesizeChunk(const TextChunk& chunk,
                                             const VoiceParameters& voice,
                                             const SynthesisOptions& options) const {
  SynthesizedSegment segment;
  try
  {
    segment = m_synthesizer->synthesize(chunk, voice, options);
  }
  catch (const VietVoiceError&)
  {
    throw;
  }
  catch (const std::exception& e)
  {
    throw SynthesisBackendError(chunk.index, e.what());
  }

  if (segment.samples.empty())
  {
    throw SynthesisBackendError(chunk.index, "model returned no audio");
  }
  segment.chunkIndex = chunk.index;
  return segment;
}

AssembledAudio Pipeline::synthesizeAll(const std::vector<TextChunk>& chunks,
                                       const VoiceParameters& voice,
                                       const SynthesisOptions& options) const {
  SynthesisStats unused;
  return synthesizeAll(chunks, voice, options, unused);
}

AssembledAudio Pipeline::synthesizeAll(const std::vector<TextChunk>& chunks,
                                       const VoiceParameters& voice,
                                       const SynthesisOptions& options,
                                       SynthesisStats& stats) const {
  if (chunks.empty())
  {
    throw InvalidInputError("no chunks to synthesize");
  }

  spdlog::debug("Synthesizing {} chunk(s) with {}", chunks.size(), toString(voice));
  auto startTime = std::chrono::steady_clock::now();

  // Results land in their chunk's slot regardless of completion order
  std::vector<SynthesizedSegment> segments(chunks.size());
  std::vector<std::exception_ptr> errors(chunks.size());
  std::atomic<std::size_t> nextChunk{0};
  std::atomic<bool> failed{false};

  auto worker = [&]() {
    while (!failed.load())
    {
      std::size_t i = nextChunk.fetch_add(1);
      if (i >= chunks.size())
      {
        return;
      }
      try
      {
        segments[i] = synthesizeChunk(chunks[i], voice, options);
      }
      catch (...)
      {
        errors[i] = std::current_exception();
        failed = true;
      }
    }
  };

  std::size_t threadCount = std::min(m_config.synthesisThreads, chunks.size());
  if (threadCount <= 1)
  {
    worker();
  }
  else
  {
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    try
    {
      for (std::size_t t = 0; t < threadCount; t++)
      {
        threads.emplace_back(worker);
      }
    }
    catch (const std::system_error&)
    {
      failed = true;
      for (auto& thread : threads)
      {
        thread.join();
      }
      throw;
    }
    for (auto& thread : threads)
    {
      thread.join();
    }
  }

  for (const auto& error : errors)
  {
    if (error)
    {
      std::rethrow_exception(error);
    }
  }

  auto endTime = std::chrono::steady_clock::now();
  auto audio = assemble(segments, m_config.audio);

  stats.chunkCount = chunks.size();
  stats.inferSeconds = std::chrono::duration<double>(endTime - startTime).count();
  stats.audioSeconds = audio.durationSeconds;
  stats.realTimeFactor = stats.audioSeconds > 0 ? stats.inferSeconds / stats.audioSeconds : 0.0;
  spdlog::info("Synthesized {} second(s) of audio from {} chunk(s) in {} second(s)",
               stats.audioSeconds,
               stats.chunkCount,
               stats.inferSeconds);

  return audio;
}

AssembledAudio Pipeline::synthesize(const SynthesisRequest& request) const {
  SynthesisStats unused;
  return synthesize(request, unused);
}

AssembledAudio Pipeline::synthesize(const SynthesisRequest& request, SynthesisStats& stats) const {
  auto prepared = prepare(request);
  return synthesizeAll(prepared.chunks, prepared.voice, prepared.options, stats);
}

JobSummary Pipeline::registerJob(AssembledAudio audio) { return m_jobs.create(std::move(audio)); }

AssembledAudio Pipeline::fetchJob(const std::string& jobId) const { return m_jobs.fetch(jobId); }

std::shared_ptr<const std::string> Pipeline::fetchJobWav(const std::string& jobId) const {
  return m_jobs.fetchEncoded(jobId);
}

bool Pipeline::evictJob(const std::string& jobId) { return m_jobs.evict(jobId); }

std::size_t Pipeline::sweepJobs() { return m_jobs.sweep(); }

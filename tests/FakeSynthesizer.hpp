#ifndef VIETVOICE_TESTS_FAKE_SYNTHESIZER_H
#define VIETVOICE_TESTS_FAKE_SYNTHESIZER_H

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

#include "SegmentSynthesizer.hpp"

namespace vietvoice {
namespace testing {

// Sine tone whose length is proportional to the chunk's byte length
class FakeSynthesizer : public SegmentSynthesizer
{
public:
  explicit FakeSynthesizer(int sampleRate = 8000, std::size_t samplesPerByte = 40)
      : m_sampleRate(sampleRate), m_samplesPerByte(samplesPerByte) {}

  SynthesizedSegment synthesize(const TextChunk& chunk,
                                const VoiceParameters& voice,
                                const SynthesisOptions& options) override {
    calls++;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      voices.push_back(voice);
      speeds.push_back(options.speed);
      references.push_back(options.reference);
    }

    if (failChunk && *failChunk == chunk.index)
    {
      throw std::runtime_error("model exploded");
    }

    SynthesizedSegment segment;
    segment.chunkIndex = chunk.index;
    segment.sampleRate = m_sampleRate;
    auto rate = rateOverrides.find(chunk.index);
    if (rate != rateOverrides.end())
    {
      segment.sampleRate = rate->second;
    }

    if (!silentChunk || *silentChunk != chunk.index)
    {
      std::size_t count = chunk.content.size() * m_samplesPerByte;
      segment.samples.reserve(count);
      for (std::size_t i = 0; i < count; i++)
      {
        segment.samples.push_back(0.5f * static_cast<float>(std::sin(0.05 * static_cast<double>(i + chunk.index))));
      }
    }
    segment.durationSeconds = static_cast<double>(segment.samples.size()) / segment.sampleRate;
    return segment;
  }

  int sampleRate() const override { return m_sampleRate; }

  std::atomic<std::size_t> calls{0};
  std::optional<std::size_t> failChunk;
  std::optional<std::size_t> silentChunk;
  std::map<std::size_t, int> rateOverrides;

  std::vector<VoiceParameters> voices;
  std::vector<float> speeds;
  std::vector<std::optional<ReferenceOverride>> references;

private:
  int m_sampleRate;
  std::size_t m_samplesPerByte;
  std::mutex m_mutex;
};

} // namespace testing
} // namespace vietvoice

#endif // VIETVOICE_TESTS_FAKE_SYNTHESIZER_H

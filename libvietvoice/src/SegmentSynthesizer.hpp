#ifndef VIETVOICE_SEGMENT_SYNTHESIZER_H
#define VIETVOICE_SEGMENT_SYNTHESIZER_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Segmenter.hpp"
#include "VoiceParameters.hpp"

namespace vietvoice {

constexpr float MIN_SPEED = 0.25f;
constexpr float MAX_SPEED = 2.0f;

// Caller-supplied recording to imitate instead of a catalog sample
struct ReferenceOverride
{
  std::string file; // WAV at the model sample rate
  std::string text; // transcript of the recording
};

// Request-scoped knobs that travel with the voice into every chunk
struct SynthesisOptions
{
  float speed = 0.9f;
  std::size_t sampleIteration = 0;
  std::optional<ReferenceOverride> reference;
};

struct SynthesizedSegment
{
  std::size_t chunkIndex = 0;
  std::vector<float> samples; // mono, [-1, 1]
  int sampleRate = 0;
  double durationSeconds = 0.0;
};

// Boundary to the neural speech model: one call per chunk.
//
// Implementations throw SynthesisBackendError carrying the chunk index on any
// failure. synthesize() may be called from several threads at once.
class SegmentSynthesizer
{
public:
  virtual ~SegmentSynthesizer() = default;

  virtual SynthesizedSegment synthesize(const TextChunk& chunk,
                                        const VoiceParameters& voice,
                                        const SynthesisOptions& options) = 0;

  virtual int sampleRate() const = 0;
};

} // namespace vietvoice

#endif // VIETVOICE_SEGMENT_SYNTHESIZER_H

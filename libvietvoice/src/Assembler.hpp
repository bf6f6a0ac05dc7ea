#ifndef VIETVOICE_ASSEMBLER_H
#define VIETVOICE_ASSEMBLER_H

#include <cstddef>
#include <string>
#include <vector>

#include "SegmentSynthesizer.hpp"

namespace vietvoice {

enum class FadeCurve
{
  Linear,
  EqualPower
};

struct AssemblerConfig
{
  double crossFadeSeconds = 0.1;
  double minTargetSeconds = 1.0;
  FadeCurve fadeCurve = FadeCurve::Linear;

  // Scale so the loudest sample reaches this level; 0 leaves levels alone
  float peakLevel = 0.0f;
};

struct AssembledAudio
{
  std::vector<float> samples;
  int sampleRate = 0;
  double durationSeconds = 0.0;
  std::string format = "wav";

  // Size of the encoded container
  std::size_t sizeBytes() const;

  bool operator==(const AssembledAudio& other) const {
    return sampleRate == other.sampleRate && format == other.format && samples == other.samples;
  }
};

// Stitch per-chunk waveforms into one track: cross-fade every internal
// boundary, then pad with trailing silence up to the minimum duration.
//
// Segments must already be in ascending chunk order and share a sample rate,
// otherwise FormatMismatchError is thrown.
AssembledAudio assemble(const std::vector<SynthesizedSegment>& segments, const AssemblerConfig& config);

FadeCurve parseFadeCurve(const std::string& name);
std::string toString(FadeCurve curve);

} // namespace vietvoice

#endif // VIETVOICE_ASSEMBLER_H

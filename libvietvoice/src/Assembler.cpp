#include "Assembler.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "WavFile.hpp"

namespace vietvoice {

namespace {

constexpr double HALF_PI = 1.57079632679489661923;

// Blend the last `overlap` samples of out with the head of next
void crossFade(std::vector<float>& out, const std::vector<float>& next, std::size_t overlap, FadeCurve curve) {
  std::size_t base = out.size() - overlap;
  for (std::size_t i = 0; i < overlap; i++)
  {
    double t = overlap > 1 ? static_cast<double>(i) / static_cast<double>(overlap - 1) : 0.5;
    double fadeIn = t;
    double fadeOut = 1.0 - t;
    if (curve == FadeCurve::EqualPower)
    {
      fadeIn = std::sin(t * HALF_PI);
      fadeOut = std::cos(t * HALF_PI);
    }
    out[base + i] = static_cast<float>(out[base + i] * fadeOut + next[i] * fadeIn);
  }
  out.insert(out.end(), next.begin() + static_cast<std::ptrdiff_t>(overlap), next.end());
}

void checkFormat(const std::vector<SynthesizedSegment>& segments) {
  const int sampleRate = segments.front().sampleRate;
  for (std::size_t i = 0; i < segments.size(); i++)
  {
    const auto& segment = segments[i];
    if (segment.sampleRate <= 0)
    {
      throw FormatMismatchError("chunk " + std::to_string(segment.chunkIndex) + " has no sample rate");
    }
    if (segment.sampleRate != sampleRate)
    {
      throw FormatMismatchError("chunk " + std::to_string(segment.chunkIndex) + " has sample rate " +
                                std::to_string(segment.sampleRate) + " Hz, expected " + std::to_string(sampleRate) +
                                " Hz");
    }
    if (i > 0 && segment.chunkIndex <= segments[i - 1].chunkIndex)
    {
      throw FormatMismatchError("chunk " + std::to_string(segment.chunkIndex) + " arrived after chunk " +
                                std::to_string(segments[i - 1].chunkIndex));
    }
  }
}

} // namespace

std::size_t AssembledAudio::sizeBytes() const { return wavSizeBytes(samples.size()); }

AssembledAudio assemble(const std::vector<SynthesizedSegment>& segments, const AssemblerConfig& config) {
  if (segments.empty())
  {
    throw InvalidInputError("no segments to assemble");
  }
  if (config.crossFadeSeconds < 0.0)
  {
    throw InvalidParameterError("cross_fade_duration", "must not be negative");
  }
  if (config.minTargetSeconds < 0.0)
  {
    throw InvalidParameterError("min_target_duration", "must not be negative");
  }

  checkFormat(segments);

  AssembledAudio audio;
  audio.sampleRate = segments.front().sampleRate;
  const auto fadeSamples = static_cast<std::size_t>(std::llround(config.crossFadeSeconds * audio.sampleRate));

  std::size_t totalSamples = 0;
  for (const auto& segment : segments)
  {
    totalSamples += segment.samples.size();
  }
  audio.samples.reserve(totalSamples);
  audio.samples = segments.front().samples;

  for (std::size_t i = 1; i < segments.size(); i++)
  {
    const auto& left = segments[i - 1].samples;
    const auto& right = segments[i].samples;

    // Fade never reaches past either neighbour
    std::size_t overlap = std::min({fadeSamples, left.size(), right.size(), audio.samples.size()});
    crossFade(audio.samples, right, overlap, config.fadeCurve);
  }

  const auto targetSamples = static_cast<std::size_t>(std::ceil(config.minTargetSeconds * audio.sampleRate));
  if (audio.samples.size() < targetSamples)
  {
    spdlog::debug("Padding {} sample(s) of silence to reach {} second(s)",
                  targetSamples - audio.samples.size(),
                  config.minTargetSeconds);
    audio.samples.resize(targetSamples, 0.0f);
  }

  if (config.peakLevel > 0.0f)
  {
    float peak = 0.0f;
    for (float s : audio.samples)
    {
      peak = std::max(peak, std::abs(s));
    }
    if (peak > 0.0f)
    {
      float scale = config.peakLevel / peak;
      for (auto& s : audio.samples)
      {
        s *= scale;
      }
    }
  }

  audio.durationSeconds = static_cast<double>(audio.samples.size()) / static_cast<double>(audio.sampleRate);
  spdlog::debug("Assembled {} segment(s) into {} second(s) at {} Hz",
                segments.size(),
                audio.durationSeconds,
                audio.sampleRate);

  return audio;
}

FadeCurve parseFadeCurve(const std::string& name) {
  if (name == "linear")
  {
    return FadeCurve::Linear;
  }
  if (name == "equal_power")
  {
    return FadeCurve::EqualPower;
  }
  throw InvalidParameterError("fade_curve", "unknown curve '" + name + "' (expected linear or equal_power)");
}

std::string toString(FadeCurve curve) { return curve == FadeCurve::EqualPower ? "equal_power" : "linear"; }

} // namespace vietvoice

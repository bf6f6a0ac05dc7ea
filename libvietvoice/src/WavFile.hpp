#ifndef VIETVOICE_WAVFILE_H
#define VIETVOICE_WAVFILE_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace vietvoice {

constexpr std::size_t WAV_HEADER_SIZE = 44;

struct WavData
{
  std::vector<float> samples; // first channel only
  int sampleRate = 0;
  int channels = 0;
};

// 16-bit PCM mono container size for numSamples samples
std::size_t wavSizeBytes(std::size_t numSamples);

void writeWavHeader(int sampleRate, int sampleWidth, int channels, int32_t numSamples, std::ostream& audioFile);

// Clamp to [-1, 1] and scale to 16-bit
std::vector<int16_t> toPcm16(const std::vector<float>& samples);

std::string encodeWav(const std::vector<float>& samples, int sampleRate);
void writeWavFile(const std::string& path, const std::vector<float>& samples, int sampleRate);

// Only 16-bit PCM is understood; anything else throws std::runtime_error
WavData decodeWav(const std::string& bytes);
WavData readWavFile(const std::string& path);

} // namespace vietvoice

#endif // VIETVOICE_WAVFILE_H

#include "WavFile.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace vietvoice {

namespace {

#pragma pack(push, 1)
struct WavHeader
{
  char riff[4] = {'R', 'I', 'F', 'F'};
  uint32_t chunkSize = 0;
  char wave[4] = {'W', 'A', 'V', 'E'};
  char fmt[4] = {'f', 'm', 't', ' '};
  uint32_t fmtChunkSize = 16;
  uint16_t audioFormat = 1; // PCM
  uint16_t numChannels = 1;
  uint32_t sampleRate = 0;
  uint32_t byteRate = 0;
  uint16_t blockAlign = 0;
  uint16_t bitsPerSample = 16;
  char data[4] = {'d', 'a', 't', 'a'};
  uint32_t dataSize = 0;
};
#pragma pack(pop)

static_assert(sizeof(WavHeader) == WAV_HEADER_SIZE, "unexpected WAV header layout");

uint16_t readU16(const std::string& bytes, std::size_t pos) {
  uint16_t value;
  std::memcpy(&value, bytes.data() + pos, sizeof(value));
  return value;
}

uint32_t readU32(const std::string& bytes, std::size_t pos) {
  uint32_t value;
  std::memcpy(&value, bytes.data() + pos, sizeof(value));
  return value;
}

} // namespace

std::size_t wavSizeBytes(std::size_t numSamples) { return WAV_HEADER_SIZE + numSamples * sizeof(int16_t); }

void writeWavHeader(int sampleRate, int sampleWidth, int channels, int32_t numSamples, std::ostream& audioFile) {
  WavHeader header;
  header.numChannels = static_cast<uint16_t>(channels);
  header.sampleRate = static_cast<uint32_t>(sampleRate);
  header.bitsPerSample = static_cast<uint16_t>(sampleWidth * 8);
  header.blockAlign = static_cast<uint16_t>(channels * sampleWidth);
  header.byteRate = static_cast<uint32_t>(sampleRate * channels * sampleWidth);
  header.dataSize = static_cast<uint32_t>(numSamples * sampleWidth * channels);
  header.chunkSize = header.dataSize + sizeof(WavHeader) - 8;

  audioFile.write(reinterpret_cast<const char*>(&header), sizeof(header));
}

std::vector<int16_t> toPcm16(const std::vector<float>& samples) {
  std::vector<int16_t> pcm;
  pcm.reserve(samples.size());
  for (float s : samples)
  {
    pcm.push_back(static_cast<int16_t>(std::clamp(s, -1.0f, 1.0f) * 32767.0f));
  }
  return pcm;
}

std::string encodeWav(const std::vector<float>& samples, int sampleRate) {
  auto pcm = toPcm16(samples);

  std::ostringstream out(std::ios::binary);
  writeWavHeader(sampleRate, sizeof(int16_t), 1, static_cast<int32_t>(pcm.size()), out);
  out.write(reinterpret_cast<const char*>(pcm.data()), static_cast<std::streamsize>(sizeof(int16_t) * pcm.size()));
  return out.str();
}

void writeWavFile(const std::string& path, const std::vector<float>& samples, int sampleRate) {
  std::ofstream audioFile(path, std::ios::binary);
  if (!audioFile)
  {
    throw std::runtime_error("Cannot open " + path + " for writing");
  }

  auto bytes = encodeWav(samples, sampleRate);
  audioFile.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!audioFile.good())
  {
    throw std::runtime_error("Failed writing WAV data to " + path);
  }
}

WavData decodeWav(const std::string& bytes) {
  if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0)
  {
    throw std::runtime_error("Not a RIFF/WAVE stream");
  }

  WavData wav;
  uint16_t bitsPerSample = 0;
  uint16_t audioFormat = 0;
  bool haveFormat = false;

  std::size_t pos = 12;
  while (pos + 8 <= bytes.size())
  {
    std::string id = bytes.substr(pos, 4);
    std::size_t size = readU32(bytes, pos + 4);
    std::size_t body = pos + 8;
    if (body + size > bytes.size())
    {
      throw std::runtime_error("Truncated WAV chunk '" + id + "'");
    }

    if (id == "fmt ")
    {
      if (size < 16)
      {
        throw std::runtime_error("WAV fmt chunk is too short");
      }
      audioFormat = readU16(bytes, body);
      wav.channels = readU16(bytes, body + 2);
      wav.sampleRate = static_cast<int>(readU32(bytes, body + 4));
      bitsPerSample = readU16(bytes, body + 14);
      haveFormat = true;
    }
    else if (id == "data")
    {
      if (!haveFormat)
      {
        throw std::runtime_error("WAV data chunk precedes fmt chunk");
      }
      if (audioFormat != 1 || bitsPerSample != 16 || wav.channels < 1)
      {
        throw std::runtime_error("Only 16-bit PCM WAV is supported");
      }

      std::size_t frameBytes = sizeof(int16_t) * wav.channels;
      std::size_t frames = size / frameBytes;
      wav.samples.reserve(frames);
      for (std::size_t f = 0; f < frames; f++)
      {
        int16_t value;
        std::memcpy(&value, bytes.data() + body + f * frameBytes, sizeof(value));
        wav.samples.push_back(static_cast<float>(value) / 32768.0f);
      }
      return wav;
    }

    // Chunks are word aligned
    pos = body + size + (size & 1);
  }

  throw std::runtime_error("WAV stream has no data chunk");
}

WavData readWavFile(const std::string& path) {
  std::ifstream audioFile(path, std::ios::binary);
  if (!audioFile)
  {
    throw std::runtime_error("Cannot open WAV file " + path);
  }

  std::string bytes((std::istreambuf_iterator<char>(audioFile)), std::istreambuf_iterator<char>());
  return decodeWav(bytes);
}

} // namespace vietvoice

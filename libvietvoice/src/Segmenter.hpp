#ifndef VIETVOICE_SEGMENTER_H
#define VIETVOICE_SEGMENTER_H

#include <cstddef>
#include <string>
#include <vector>

namespace vietvoice {

struct TextChunk
{
  std::size_t index = 0;
  std::string content;
  std::size_t estimatedChars = 0;

  // Byte offset of content within the segmented text
  std::size_t offset = 0;
};

struct SegmenterConfig
{
  // Soft limit in code points; a single longer word is emitted on its own
  std::size_t maxChars = 135;

  // Chunks shorter than minChunkRatio * maxChars are merged into a neighbour
  double minChunkRatio = 0.25;
  std::size_t mergeToleranceChars = 0;
};

class Segmenter
{
public:
  explicit Segmenter(const SegmenterConfig& config);

  // Split text into ordered chunks on sentence, comma and word boundaries.
  // Throws InvalidInputError for empty or whitespace-only text.
  std::vector<TextChunk> segment(const std::string& text) const;

  const SegmenterConfig& config() const { return m_config; }

private:
  SegmenterConfig m_config;
};

std::vector<TextChunk> segment(const std::string& text, std::size_t maxChars);

// Rebuild the segmented text from its chunks and the separators between them
std::string rejoinChunks(const std::string& text, const std::vector<TextChunk>& chunks);

} // namespace vietvoice

#endif // VIETVOICE_SEGMENTER_H

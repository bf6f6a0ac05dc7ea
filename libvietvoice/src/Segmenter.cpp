#include "Segmenter.hpp"

#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>
#include <utf8.h>

#include "Errors.hpp"
#include "TextNormalizer.hpp"

namespace vietvoice {

namespace {

const char* SENTENCE_MARKS = ".!?";
const char* CLAUSE_MARKS = ",";

struct Span
{
  std::size_t begin;
  std::size_t end;
};

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isMark(char c, const char* marks) {
  for (const char* m = marks; *m != '\0'; m++)
  {
    if (*m == c)
    {
      return true;
    }
  }
  return false;
}

// Maps byte offsets to code point counts so span lengths are O(1)
class CodepointIndex
{
public:
  explicit CodepointIndex(const std::string& text) : m_prefix(text.size() + 1, 0) {
    for (std::size_t i = 0; i < text.size(); i++)
    {
      bool continuation = (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80;
      m_prefix[i + 1] = m_prefix[i] + (continuation ? 0 : 1);
    }
  }

  std::size_t length(std::size_t begin, std::size_t end) const { return m_prefix[end] - m_prefix[begin]; }
  std::size_t length(const Span& span) const { return length(span.begin, span.end); }

private:
  std::vector<std::size_t> m_prefix;
};

// Split a span after every mark that is followed by whitespace or the end of
// the span. The mark stays with the preceding unit; whitespace between units
// is left out of both.
std::vector<Span> splitAfterMarks(const std::string& text, const Span& span, const char* marks) {
  std::vector<Span> units;
  std::size_t i = span.begin;
  while (i < span.end)
  {
    while (i < span.end && isSpace(text[i]))
    {
      i++;
    }
    if (i >= span.end)
    {
      break;
    }

    std::size_t start = i;
    std::size_t lastNonSpace = i;
    for (; i < span.end; i++)
    {
      if (!isSpace(text[i]))
      {
        lastNonSpace = i;
      }
      if (isMark(text[i], marks) && (i + 1 == span.end || isSpace(text[i + 1])))
      {
        i++;
        break;
      }
    }
    units.push_back({start, lastNonSpace + 1});
  }
  return units;
}

std::vector<Span> splitWords(const std::string& text, const Span& span) {
  std::vector<Span> words;
  std::size_t i = span.begin;
  while (i < span.end)
  {
    while (i < span.end && isSpace(text[i]))
    {
      i++;
    }
    std::size_t start = i;
    while (i < span.end && !isSpace(text[i]))
    {
      i++;
    }
    if (i > start)
    {
      words.push_back({start, i});
    }
  }
  return words;
}

// Greedy packing: a word joins the current chunk while the chunk stays within
// maxChars. A word longer than maxChars becomes a chunk of its own.
void packWords(const std::string& text,
               const Span& span,
               const CodepointIndex& index,
               std::size_t maxChars,
               std::vector<Span>& chunks) {
  auto words = splitWords(text, span);
  bool open = false;
  Span current{0, 0};

  for (const auto& word : words)
  {
    if (!open)
    {
      current = word;
      open = true;
    }
    else if (index.length(current.begin, word.end) <= maxChars)
    {
      current.end = word.end;
    }
    else
    {
      chunks.push_back(current);
      current = word;
    }

    if (index.length(word) > maxChars)
    {
      spdlog::warn("Word of {} characters exceeds the chunk limit of {} and is kept whole: {}",
                   index.length(word),
                   maxChars,
                   text.substr(word.begin, word.end - word.begin));
    }
  }

  if (open)
  {
    chunks.push_back(current);
  }
}

// Fold chunks shorter than minChars into a neighbour, preferring the next one,
// as long as the merged span stays within limit.
std::vector<Span> mergeShortChunks(const std::vector<Span>& chunks,
                                   const CodepointIndex& index,
                                   std::size_t minChars,
                                   std::size_t limit) {
  std::vector<Span> merged;
  for (std::size_t i = 0; i < chunks.size(); i++)
  {
    Span current = chunks[i];
    while (index.length(current) < minChars && i + 1 < chunks.size() &&
           index.length(current.begin, chunks[i + 1].end) <= limit)
    {
      current.end = chunks[i + 1].end;
      i++;
    }

    if (index.length(current) < minChars && !merged.empty() &&
        index.length(merged.back().begin, current.end) <= limit)
    {
      merged.back().end = current.end;
      continue;
    }

    merged.push_back(current);
  }
  return merged;
}

} // namespace

Segmenter::Segmenter(const SegmenterConfig& config) : m_config(config) {
  if (m_config.maxChars == 0)
  {
    throw InvalidInputError("max_chars must be positive");
  }
  if (m_config.minChunkRatio < 0.0 || m_config.minChunkRatio > 1.0)
  {
    throw InvalidParameterError("min_chunk_ratio", "must be within [0, 1]");
  }
}

std::vector<TextChunk> Segmenter::segment(const std::string& text) const {
  if (utf8::find_invalid(text.begin(), text.end()) != text.end())
  {
    throw InvalidInputError("text is not valid UTF-8");
  }

  Span whole{0, text.size()};
  auto sentences = splitAfterMarks(text, whole, SENTENCE_MARKS);
  if (sentences.empty())
  {
    throw InvalidInputError("text is empty");
  }

  CodepointIndex index(text);
  const std::size_t maxChars = m_config.maxChars;

  std::vector<Span> spans;
  for (const auto& sentence : sentences)
  {
    if (index.length(sentence) <= maxChars)
    {
      spans.push_back(sentence);
      continue;
    }

    for (const auto& clause : splitAfterMarks(text, sentence, CLAUSE_MARKS))
    {
      if (index.length(clause) <= maxChars)
      {
        spans.push_back(clause);
      }
      else
      {
        packWords(text, clause, index, maxChars, spans);
      }
    }
  }

  auto minChars = static_cast<std::size_t>(std::ceil(m_config.minChunkRatio * static_cast<double>(maxChars)));
  spans = mergeShortChunks(spans, index, minChars, maxChars + m_config.mergeToleranceChars);

  std::vector<TextChunk> chunks;
  chunks.reserve(spans.size());
  for (const auto& span : spans)
  {
    TextChunk chunk;
    chunk.index = chunks.size();
    chunk.content = text.substr(span.begin, span.end - span.begin);
    chunk.estimatedChars = weightedLength(chunk.content);
    chunk.offset = span.begin;
    chunks.push_back(std::move(chunk));
  }

  if (spdlog::should_log(spdlog::level::debug))
  {
    std::stringstream lengths;
    for (const auto& span : spans)
    {
      lengths << index.length(span) << " ";
    }
    spdlog::debug("Segmented {} character(s) into {} chunk(s) (max {}): {}",
                  index.length(whole),
                  chunks.size(),
                  maxChars,
                  lengths.str());
  }

  return chunks;
}

std::vector<TextChunk> segment(const std::string& text, std::size_t maxChars) {
  SegmenterConfig config;
  config.maxChars = maxChars;
  return Segmenter(config).segment(text);
}

std::string rejoinChunks(const std::string& text, const std::vector<TextChunk>& chunks) {
  std::string joined;
  std::size_t position = 0;
  for (const auto& chunk : chunks)
  {
    if (chunk.offset < position || chunk.offset > text.size())
    {
      throw InvalidInputError("chunk " + std::to_string(chunk.index) + " is out of order");
    }
    joined.append(text, position, chunk.offset - position);
    joined += chunk.content;
    position = chunk.offset + chunk.content.size();
  }
  if (position < text.size())
  {
    joined.append(text, position, std::string::npos);
  }
  return joined;
}

} // namespace vietvoice

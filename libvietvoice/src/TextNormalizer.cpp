#include "TextNormalizer.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>
#include <utf8.h>

#include "Errors.hpp"

namespace vietvoice {

namespace {

const std::u32string ALPHANUMERIC = U"abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
const std::u32string VIETNAMESE_LOWER = U"àáảãạăằắẳẵặâầấẩẫậèéẻẽẹêềếểễệđìíỉĩịòóỏõọôồốổỗộơờớởỡợùúủũụưừứửữựỳỵỷỹý";
const std::u32string VIETNAMESE_UPPER = U"ÀÁẢÃẠĂẰẮẲẴẶÂẦẤẨẪẬÈÉẺẼẸÊỀẾỂỄỆĐÌÍỈĨỊÒÓỎÕỌÔỒỐỔỖỘƠỜỚỞỠỢÙÚỦŨỤƯỪỨỬỮỰỲỴỶỸÝ";
const std::u32string PUNCTUATION = U" .,!?'@$%&/:;()";
const std::string PAUSE_MARKS = ".,;:!?";

bool isReadable(char32_t c) {
  return ALPHANUMERIC.find(c) != std::u32string::npos || VIETNAMESE_LOWER.find(c) != std::u32string::npos ||
         VIETNAMESE_UPPER.find(c) != std::u32string::npos || PUNCTUATION.find(c) != std::u32string::npos;
}

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && isSpace(s[begin]))
  {
    begin++;
  }
  while (end > begin && isSpace(s[end - 1]))
  {
    end--;
  }
  return s.substr(begin, end - begin);
}

// One line per sentence: every non-empty line must end with a period
std::string joinLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line))
  {
    line = trim(line);
    if (line.empty())
    {
      continue;
    }
    if (line.back() != '.')
    {
      line += '.';
    }
    lines.push_back(line);
  }

  std::string joined;
  for (std::size_t i = 0; i < lines.size(); i++)
  {
    if (i > 0)
    {
      joined += ' ';
    }
    joined += lines[i];
  }
  return joined;
}

} // namespace

std::string normalizeText(const std::string& text) {
  std::string source = text;
  if (source.find('\n') != std::string::npos)
  {
    source = joinLines(source);
  }

  std::u32string codepoints;
  try
  {
    utf8::utf8to32(source.begin(), source.end(), std::back_inserter(codepoints));
  }
  catch (const utf8::exception& e)
  {
    throw InvalidInputError(std::string("text is not valid UTF-8: ") + e.what());
  }

  std::size_t replaced = 0;
  for (auto& c : codepoints)
  {
    if (!isReadable(c))
    {
      c = U' ';
      replaced++;
    }
  }
  if (replaced > 0)
  {
    spdlog::debug("Replaced {} unreadable character(s) with spaces", replaced);
  }

  std::u32string cleaned;
  cleaned.reserve(codepoints.size());
  for (char32_t c : codepoints)
  {
    if (c == U';' || c == U':' || c == U'(' || c == U')')
    {
      c = U',';
    }

    if (cleaned.empty() && c == U' ')
    {
      continue;
    }
    if ((c == U'.' || c == U',' || c == U' ') && !cleaned.empty() && cleaned.back() == c)
    {
      continue;
    }
    cleaned.push_back(c);
  }
  while (!cleaned.empty() && cleaned.back() == U' ')
  {
    cleaned.pop_back();
  }

  if (cleaned.empty())
  {
    throw InvalidInputError("text contains no readable characters");
  }

  char32_t last = cleaned.back();
  if (last != U'.' && last != U'?' && last != U'!' && last != U',')
  {
    cleaned.push_back(U'.');
  }

  std::string result;
  utf8::utf32to8(cleaned.begin(), cleaned.end(), std::back_inserter(result));
  return result;
}

std::size_t weightedLength(const std::string& text) {
  auto pauses = std::count_if(
      text.begin(), text.end(), [](char c) { return PAUSE_MARKS.find(c) != std::string::npos; });
  return text.size() + 3 * static_cast<std::size_t>(pauses);
}

std::size_t codepointLength(const std::string& text) {
  try
  {
    return static_cast<std::size_t>(utf8::distance(text.begin(), text.end()));
  }
  catch (const utf8::exception& e)
  {
    throw InvalidInputError(std::string("text is not valid UTF-8: ") + e.what());
  }
}

} // namespace vietvoice

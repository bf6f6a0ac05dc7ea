#ifndef VIETVOICE_REFERENCE_CATALOG_H
#define VIETVOICE_REFERENCE_CATALOG_H

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "VoiceParameters.hpp"

using json = nlohmann::json;

namespace vietvoice {

// A recorded utterance the model imitates: its audio file and transcript
struct ReferenceSample
{
  std::string file;
  std::string text;
  Gender gender = Gender::Unspecified;
  Area area = Area::Unspecified;
  Group group = Group::Unspecified;
  Emotion emotion = Emotion::Unspecified;

  // Unspecified fields of voice match anything
  bool matches(const VoiceParameters& voice) const;
};

class ReferenceCatalog
{
public:
  ReferenceCatalog() = default;
  explicit ReferenceCatalog(std::vector<ReferenceSample> samples);

  // JSON array of {file, text, gender, area, group, emotion}; relative file
  // paths are resolved against baseDir
  static ReferenceCatalog fromJson(const json& root, const std::string& baseDir = "");
  static ReferenceCatalog load(const std::string& path);

  std::vector<const ReferenceSample*> filter(const VoiceParameters& voice) const;

  // The iteration-th sample matching voice. Throws InvalidParameterError when
  // nothing matches or iteration is out of range.
  const ReferenceSample& select(const VoiceParameters& voice, std::size_t iteration) const;

  const std::vector<ReferenceSample>& samples() const { return m_samples; }
  bool empty() const { return m_samples.empty(); }

private:
  std::vector<ReferenceSample> m_samples;
};

} // namespace vietvoice

#endif // VIETVOICE_REFERENCE_CATALOG_H

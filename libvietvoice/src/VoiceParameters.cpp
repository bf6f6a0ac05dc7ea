#include "VoiceParameters.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "Errors.hpp"

namespace vietvoice {

namespace {

template <typename T> using NameTable = std::vector<std::pair<const char*, T>>;

const NameTable<Gender> GENDERS = {{"male", Gender::Male}, {"female", Gender::Female}};

const NameTable<Area> AREAS = {{"northern", Area::Northern}, {"southern", Area::Southern}, {"central", Area::Central}};

const NameTable<Group> GROUPS = {{"story", Group::Story},
                                 {"news", Group::News},
                                 {"audiobook", Group::Audiobook},
                                 {"interview", Group::Interview},
                                 {"review", Group::Review}};

const NameTable<Emotion> EMOTIONS = {{"neutral", Emotion::Neutral},
                                     {"serious", Emotion::Serious},
                                     {"monotone", Emotion::Monotone},
                                     {"sad", Emotion::Sad},
                                     {"surprised", Emotion::Surprised},
                                     {"happy", Emotion::Happy},
                                     {"angry", Emotion::Angry}};

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

template <typename T> std::optional<T> lookup(const NameTable<T>& table, const std::string& name) {
  auto lowered = toLower(name);
  for (const auto& entry : table)
  {
    if (lowered == entry.first)
    {
      return entry.second;
    }
  }
  return std::nullopt;
}

template <typename T> std::string nameOf(const NameTable<T>& table, T value) {
  for (const auto& entry : table)
  {
    if (entry.second == value)
    {
      return entry.first;
    }
  }
  return "unspecified";
}

template <typename T> std::vector<std::string> namesOf(const NameTable<T>& table) {
  std::vector<std::string> names;
  for (const auto& entry : table)
  {
    names.emplace_back(entry.first);
  }
  return names;
}

template <typename T>
T resolveField(const char* field,
               const NameTable<T>& table,
               const std::optional<std::string>& explicitValue,
               const std::optional<std::string>& defaultValue) {
  const std::optional<std::string>& chosen = explicitValue ? explicitValue : defaultValue;
  if (!chosen)
  {
    return T::Unspecified;
  }

  auto value = lookup(table, *chosen);
  if (!value)
  {
    std::string expected;
    for (const auto& entry : table)
    {
      expected += expected.empty() ? "" : ", ";
      expected += entry.first;
    }
    throw InvalidParameterError(field, "unknown value '" + *chosen + "' (expected one of: " + expected + ")");
  }
  return *value;
}

} // namespace

VoiceParameters resolveVoice(const VoiceSelection& explicitParams, const VoiceSelection& defaults) {
  VoiceParameters voice;
  voice.gender = resolveField("gender", GENDERS, explicitParams.gender, defaults.gender);
  voice.area = resolveField("area", AREAS, explicitParams.area, defaults.area);
  voice.group = resolveField("group", GROUPS, explicitParams.group, defaults.group);
  voice.emotion = resolveField("emotion", EMOTIONS, explicitParams.emotion, defaults.emotion);
  return voice;
}

std::string toString(Gender value) { return nameOf(GENDERS, value); }
std::string toString(Area value) { return nameOf(AREAS, value); }
std::string toString(Group value) { return nameOf(GROUPS, value); }
std::string toString(Emotion value) { return nameOf(EMOTIONS, value); }

std::string toString(const VoiceParameters& voice) {
  return "gender=" + toString(voice.gender) + " area=" + toString(voice.area) + " group=" + toString(voice.group) +
         " emotion=" + toString(voice.emotion);
}

std::optional<Gender> parseGender(const std::string& name) { return lookup(GENDERS, name); }
std::optional<Area> parseArea(const std::string& name) { return lookup(AREAS, name); }
std::optional<Group> parseGroup(const std::string& name) { return lookup(GROUPS, name); }
std::optional<Emotion> parseEmotion(const std::string& name) { return lookup(EMOTIONS, name); }

std::vector<std::string> genderNames() { return namesOf(GENDERS); }
std::vector<std::string> areaNames() { return namesOf(AREAS); }
std::vector<std::string> groupNames() { return namesOf(GROUPS); }
std::vector<std::string> emotionNames() { return namesOf(EMOTIONS); }

} // namespace vietvoice

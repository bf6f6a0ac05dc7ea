#ifndef VIETVOICE_VOICE_PARAMETERS_H
#define VIETVOICE_VOICE_PARAMETERS_H

#include <optional>
#include <string>
#include <vector>

namespace vietvoice {

enum class Gender
{
  Unspecified,
  Male,
  Female
};

enum class Area
{
  Unspecified,
  Northern,
  Southern,
  Central
};

enum class Group
{
  Unspecified,
  Story,
  News,
  Audiobook,
  Interview,
  Review
};

enum class Emotion
{
  Unspecified,
  Neutral,
  Serious,
  Monotone,
  Sad,
  Surprised,
  Happy,
  Angry
};

// Resolved once per request and shared read-only by every chunk
struct VoiceParameters
{
  Gender gender = Gender::Unspecified;
  Area area = Area::Unspecified;
  Group group = Group::Unspecified;
  Emotion emotion = Emotion::Unspecified;

  bool operator==(const VoiceParameters& other) const {
    return gender == other.gender && area == other.area && group == other.group && emotion == other.emotion;
  }
  bool operator!=(const VoiceParameters& other) const { return !(*this == other); }
};

// Raw, unvalidated values as they arrive from a caller or a config file
struct VoiceSelection
{
  std::optional<std::string> gender;
  std::optional<std::string> area;
  std::optional<std::string> group;
  std::optional<std::string> emotion;
};

// Explicit value > configured default > unspecified, field by field.
// Throws InvalidParameterError naming the field for a value outside its
// enumeration.
VoiceParameters resolveVoice(const VoiceSelection& explicitParams, const VoiceSelection& defaults);

std::string toString(Gender value);
std::string toString(Area value);
std::string toString(Group value);
std::string toString(Emotion value);
std::string toString(const VoiceParameters& voice);

// Case-insensitive; std::nullopt when the name is not a member
std::optional<Gender> parseGender(const std::string& name);
std::optional<Area> parseArea(const std::string& name);
std::optional<Group> parseGroup(const std::string& name);
std::optional<Emotion> parseEmotion(const std::string& name);

std::vector<std::string> genderNames();
std::vector<std::string> areaNames();
std::vector<std::string> groupNames();
std::vector<std::string> emotionNames();

} // namespace vietvoice

#endif // VIETVOICE_VOICE_PARAMETERS_H

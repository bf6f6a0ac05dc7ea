#include "ReferenceCatalog.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "Errors.hpp"

using namespace vietvoice;

namespace {

template <typename T, typename Parser>
T readCategory(const json& item, const char* key, Parser parse, std::size_t index) {
  if (!item.contains(key) || item[key].is_null())
  {
    return T::Unspecified;
  }
  if (!item[key].is_string())
  {
    throw std::runtime_error("Reference sample " + std::to_string(index) + ": " + key + " must be a string");
  }
  auto name = item[key].get<std::string>();
  if (name.empty())
  {
    return T::Unspecified;
  }
  auto value = parse(name);
  if (!value)
  {
    throw std::runtime_error("Reference sample " + std::to_string(index) + ": unknown " + key + " '" + name + "'");
  }
  return *value;
}

} // namespace

bool ReferenceSample::matches(const VoiceParameters& voice) const {
  return (voice.gender == Gender::Unspecified || voice.gender == gender) &&
         (voice.area == Area::Unspecified || voice.area == area) &&
         (voice.group == Group::Unspecified || voice.group == group) &&
         (voice.emotion == Emotion::Unspecified || voice.emotion == emotion);
}

ReferenceCatalog::ReferenceCatalog(std::vector<ReferenceSample> samples) : m_samples(std::move(samples)) {}

ReferenceCatalog ReferenceCatalog::fromJson(const json& root, const std::string& baseDir) {
  if (!root.is_array())
  {
    throw std::runtime_error("Reference catalog must be a JSON array");
  }

  std::vector<ReferenceSample> samples;
  samples.reserve(root.size());
  for (std::size_t i = 0; i < root.size(); i++)
  {
    const auto& item = root[i];
    if (!item.is_object() || !item.contains("file") || !item["file"].is_string() || !item.contains("text") ||
        !item["text"].is_string())
    {
      throw std::runtime_error("Reference sample " + std::to_string(i) + " needs string 'file' and 'text'");
    }

    ReferenceSample sample;
    sample.file = item["file"].get<std::string>();
    if (!baseDir.empty() && std::filesystem::path(sample.file).is_relative())
    {
      sample.file = (std::filesystem::path(baseDir) / sample.file).string();
    }
    sample.text = item["text"].get<std::string>();
    sample.gender = readCategory<Gender>(item, "gender", parseGender, i);
    sample.area = readCategory<Area>(item, "area", parseArea, i);
    sample.group = readCategory<Group>(item, "group", parseGroup, i);
    sample.emotion = readCategory<Emotion>(item, "emotion", parseEmotion, i);
    samples.push_back(std::move(sample));
  }

  spdlog::debug("Loaded {} reference sample(s)", samples.size());
  return ReferenceCatalog(std::move(samples));
}

ReferenceCatalog ReferenceCatalog::load(const std::string& path) {
  spdlog::debug("Parsing reference catalog at {}", path);
  std::ifstream catalogFile(path);
  if (!catalogFile)
  {
    throw std::runtime_error("Cannot open reference catalog " + path);
  }

  json root;
  try
  {
    root = json::parse(catalogFile);
  }
  catch (const json::exception& e)
  {
    throw std::runtime_error("Malformed reference catalog " + path + ": " + e.what());
  }

  return fromJson(root, std::filesystem::absolute(path).parent_path().string());
}

std::vector<const ReferenceSample*> ReferenceCatalog::filter(const VoiceParameters& voice) const {
  std::vector<const ReferenceSample*> matches;
  for (const auto& sample : m_samples)
  {
    if (sample.matches(voice))
    {
      matches.push_back(&sample);
    }
  }
  return matches;
}

const ReferenceSample& ReferenceCatalog::select(const VoiceParameters& voice, std::size_t iteration) const {
  auto matches = filter(voice);
  if (matches.empty())
  {
    throw InvalidParameterError("voice", "no reference sample matches " + toString(voice));
  }
  if (iteration >= matches.size())
  {
    throw InvalidParameterError("sample_iteration",
                                "is " + std::to_string(iteration) + " but only " + std::to_string(matches.size()) +
                                    " sample(s) match " + toString(voice));
  }
  return *matches[iteration];
}

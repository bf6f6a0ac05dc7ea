#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "Errors.hpp"
#include "ReferenceCatalog.hpp"

using namespace vietvoice;

namespace {

const char* CATALOG = R"([
  {"file": "a.wav", "text": "một", "gender": "Female", "area": "northern", "group": "story", "emotion": "neutral"},
  {"file": "b.wav", "text": "hai", "gender": "female", "area": "southern", "group": "news", "emotion": "happy"},
  {"file": "/abs/c.wav", "text": "ba", "gender": "male", "area": "northern", "group": "story", "emotion": "sad"}
])";

VoiceParameters voiceOf(Gender gender, Area area = Area::Unspecified) {
  VoiceParameters voice;
  voice.gender = gender;
  voice.area = area;
  return voice;
}

} // namespace

TEST(ReferenceCatalog, LoadsSamplesAndResolvesPaths) {
  auto catalog = ReferenceCatalog::fromJson(json::parse(CATALOG), "/refs");
  ASSERT_EQ(catalog.samples().size(), 3u);

  const auto& first = catalog.samples()[0];
  EXPECT_EQ(first.file, (std::filesystem::path("/refs") / "a.wav").string());
  EXPECT_EQ(first.text, "một");
  EXPECT_EQ(first.gender, Gender::Female);
  EXPECT_EQ(first.group, Group::Story);
  EXPECT_EQ(catalog.samples()[2].file, "/abs/c.wav");
}

TEST(ReferenceCatalog, UnspecifiedMatchesEverything) {
  auto catalog = ReferenceCatalog::fromJson(json::parse(CATALOG));
  EXPECT_EQ(catalog.filter(VoiceParameters{}).size(), 3u);
}

TEST(ReferenceCatalog, FiltersOnEverySpecifiedField) {
  auto catalog = ReferenceCatalog::fromJson(json::parse(CATALOG));

  EXPECT_EQ(catalog.filter(voiceOf(Gender::Female)).size(), 2u);
  auto northernFemale = catalog.filter(voiceOf(Gender::Female, Area::Northern));
  ASSERT_EQ(northernFemale.size(), 1u);
  EXPECT_EQ(northernFemale[0]->text, "một");
}

TEST(ReferenceCatalog, SelectsByIteration) {
  auto catalog = ReferenceCatalog::fromJson(json::parse(CATALOG));
  EXPECT_EQ(catalog.select(voiceOf(Gender::Female), 0).text, "một");
  EXPECT_EQ(catalog.select(voiceOf(Gender::Female), 1).text, "hai");
}

TEST(ReferenceCatalog, SelectReportsFields) {
  auto catalog = ReferenceCatalog::fromJson(json::parse(CATALOG));

  VoiceParameters unmatched = voiceOf(Gender::Male, Area::Central);
  try
  {
    catalog.select(unmatched, 0);
    FAIL() << "expected InvalidParameterError";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "voice");
  }

  try
  {
    catalog.select(voiceOf(Gender::Female), 2);
    FAIL() << "expected InvalidParameterError";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "sample_iteration");
  }
}

TEST(ReferenceCatalog, RejectsMalformedEntries) {
  EXPECT_THROW(ReferenceCatalog::fromJson(json::object()), std::runtime_error);
  EXPECT_THROW(ReferenceCatalog::fromJson(json::parse(R"([{"text": "no file"}])")), std::runtime_error);
  EXPECT_THROW(ReferenceCatalog::fromJson(json::parse(R"([{"file": "a.wav", "text": "x", "gender": "robot"}])")),
               std::runtime_error);
}

TEST(ReferenceCatalog, LoadsFromFile) {
  auto dir = std::filesystem::temp_directory_path() / "vietvoice_catalog_test";
  std::filesystem::create_directories(dir);
  auto path = dir / "references.json";
  {
    std::ofstream out(path);
    out << CATALOG;
  }

  auto catalog = ReferenceCatalog::load(path.string());
  EXPECT_EQ(catalog.samples()[1].file, (std::filesystem::absolute(dir) / "b.wav").string());
  std::filesystem::remove_all(dir);

  EXPECT_THROW(ReferenceCatalog::load(path.string()), std::runtime_error);
}

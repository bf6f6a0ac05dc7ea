#include <gtest/gtest.h>

#include "Errors.hpp"
#include "VoiceParameters.hpp"

using namespace vietvoice;

TEST(VoiceParameters, ExplicitValueWins) {
  VoiceSelection explicitParams;
  explicitParams.gender = "female";
  VoiceSelection defaults;
  defaults.gender = "male";
  defaults.area = "southern";

  auto voice = resolveVoice(explicitParams, defaults);
  EXPECT_EQ(voice.gender, Gender::Female);
  EXPECT_EQ(voice.area, Area::Southern);
  EXPECT_EQ(voice.group, Group::Unspecified);
  EXPECT_EQ(voice.emotion, Emotion::Unspecified);
}

TEST(VoiceParameters, NothingGivenIsUnspecified) {
  EXPECT_EQ(resolveVoice(VoiceSelection{}, VoiceSelection{}), VoiceParameters{});
}

TEST(VoiceParameters, MatchesCaseInsensitively) {
  VoiceSelection explicitParams;
  explicitParams.emotion = "HaPpY";
  explicitParams.group = "AUDIOBOOK";
  auto voice = resolveVoice(explicitParams, VoiceSelection{});
  EXPECT_EQ(voice.emotion, Emotion::Happy);
  EXPECT_EQ(voice.group, Group::Audiobook);
}

TEST(VoiceParameters, UnknownValueNamesField) {
  VoiceSelection explicitParams;
  explicitParams.area = "western";
  try
  {
    resolveVoice(explicitParams, VoiceSelection{});
    FAIL() << "expected InvalidParameterError";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "area");
    EXPECT_NE(std::string(e.what()).find("western"), std::string::npos);
  }
}

TEST(VoiceParameters, ExplicitEmptyStringIsInvalid) {
  VoiceSelection explicitParams;
  explicitParams.gender = "";
  EXPECT_THROW(resolveVoice(explicitParams, VoiceSelection{}), InvalidParameterError);
}

TEST(VoiceParameters, InvalidDefaultIsReported) {
  VoiceSelection defaults;
  defaults.emotion = "bored";
  EXPECT_THROW(resolveVoice(VoiceSelection{}, defaults), InvalidParameterError);
}

TEST(VoiceParameters, NamesRoundTrip) {
  for (const auto& name : emotionNames())
  {
    auto emotion = parseEmotion(name);
    ASSERT_TRUE(emotion.has_value()) << name;
    EXPECT_EQ(toString(*emotion), name);
  }
  EXPECT_EQ(genderNames().size(), 2u);
  EXPECT_EQ(areaNames().size(), 3u);
  EXPECT_EQ(groupNames().size(), 5u);
  EXPECT_EQ(emotionNames().size(), 7u);
  EXPECT_EQ(toString(Gender::Unspecified), "unspecified");
  EXPECT_FALSE(parseGroup("podcast").has_value());
}

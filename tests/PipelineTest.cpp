#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "Errors.hpp"
#include "FakeSynthesizer.hpp"
#include "Pipeline.hpp"
#include "WavFile.hpp"

using namespace vietvoice;
using vietvoice::testing::FakeSynthesizer;

namespace {

const std::string LONG_TEXT = "Xin chào. Đây là một câu dài hơn giới hạn ký tự cho phép, nên nó cần được chia nhỏ. "
                              "Hôm nay trời đẹp, chúng ta cùng đi dạo trong công viên nhé!";

ServiceConfig smallChunks(std::size_t threads = 1) {
  ServiceConfig config;
  config.segmentation.maxChars = 20;
  config.synthesisThreads = threads;
  config.audio.minTargetSeconds = 0.0;
  return config;
}

SynthesisRequest requestFor(const std::string& text) {
  SynthesisRequest request;
  request.text = text;
  return request;
}

} // namespace

TEST(Pipeline, EmptyTextIsRejectedBeforeSynthesis) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  EXPECT_THROW(pipeline.segmentAndResolve("", VoiceSelection{}), InvalidInputError);
  EXPECT_THROW(pipeline.synthesize(requestFor("  \n ")), InvalidInputError);
  EXPECT_EQ(fake->calls.load(), 0u);
}

TEST(Pipeline, TextAboveCeilingIsRejected) {
  auto config = smallChunks();
  config.maxInputChars = 10;
  Pipeline pipeline(std::make_shared<FakeSynthesizer>(), config);

  EXPECT_NO_THROW(pipeline.segmentAndResolve("chào bạn", VoiceSelection{}));
  EXPECT_THROW(pipeline.segmentAndResolve("chào tất cả các bạn", VoiceSelection{}), InvalidInputError);
}

TEST(Pipeline, ResolvesVoiceOncePerRequest) {
  auto config = smallChunks();
  config.voiceDefaults.gender = "male";
  config.voiceDefaults.area = "central";
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, config);

  auto request = requestFor(LONG_TEXT);
  request.voice.gender = "female";
  request.voice.emotion = "sad";
  pipeline.synthesize(request);

  ASSERT_GT(fake->voices.size(), 1u);
  VoiceParameters expected;
  expected.gender = Gender::Female;
  expected.area = Area::Central;
  expected.emotion = Emotion::Sad;
  for (const auto& voice : fake->voices)
  {
    EXPECT_EQ(voice, expected);
  }
}

TEST(Pipeline, InvalidVoiceFailsBeforeSynthesis) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  auto request = requestFor(LONG_TEXT);
  request.voice.group = "podcast";
  EXPECT_THROW(pipeline.synthesize(request), InvalidParameterError);
  EXPECT_EQ(fake->calls.load(), 0u);
}

TEST(Pipeline, ValidatesSpeed) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  auto request = requestFor("Xin chào.");
  request.speed = 3.0f;
  try
  {
    pipeline.prepare(request);
    FAIL() << "expected InvalidParameterError";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "speed");
  }

  request.speed = 1.5f;
  EXPECT_FLOAT_EQ(pipeline.prepare(request).options.speed, 1.5f);
  EXPECT_FLOAT_EQ(pipeline.prepare(requestFor("Xin chào.")).options.speed, 0.9f);
}

TEST(Pipeline, SpeedReachesEveryChunk) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  auto request = requestFor(LONG_TEXT);
  request.speed = 1.25f;
  pipeline.synthesize(request);
  for (float speed : fake->speeds)
  {
    EXPECT_FLOAT_EQ(speed, 1.25f);
  }
}

TEST(Pipeline, NormalizesBeforeSegmenting) {
  Pipeline pipeline(std::make_shared<FakeSynthesizer>(), ServiceConfig{});
  auto prepared = pipeline.segmentAndResolve("  a;b:c(d)   efg! ", VoiceSelection{});
  ASSERT_EQ(prepared.chunks.size(), 1u);
  EXPECT_EQ(prepared.chunks[0].content, "a,b,c,d, efg!");
}

TEST(Pipeline, ParallelFanOutMatchesSequential) {
  auto sequential = Pipeline(std::make_shared<FakeSynthesizer>(), smallChunks(1)).synthesize(requestFor(LONG_TEXT));
  auto parallel = Pipeline(std::make_shared<FakeSynthesizer>(), smallChunks(4)).synthesize(requestFor(LONG_TEXT));

  EXPECT_EQ(parallel, sequential);
}

TEST(Pipeline, StatsDescribeTheRun) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks(2));

  SynthesisStats stats;
  auto audio = pipeline.synthesize(requestFor(LONG_TEXT), stats);
  EXPECT_EQ(stats.chunkCount, fake->calls.load());
  EXPECT_GT(stats.chunkCount, 1u);
  EXPECT_DOUBLE_EQ(stats.audioSeconds, audio.durationSeconds);
  EXPECT_GE(stats.inferSeconds, 0.0);
}

TEST(Pipeline, FailingChunkAbortsWithItsIndex) {
  for (std::size_t threads : {1u, 3u})
  {
    auto fake = std::make_shared<FakeSynthesizer>();
    fake->failChunk = 2;
    Pipeline pipeline(fake, smallChunks(threads));

    try
    {
      pipeline.synthesize(requestFor(LONG_TEXT));
      FAIL() << "expected SynthesisBackendError";
    }
    catch (const SynthesisBackendError& e)
    {
      EXPECT_EQ(e.chunkIndex(), 2u) << threads << " thread(s)";
    }
  }
}

TEST(Pipeline, EmptyWaveformIsBackendError) {
  auto fake = std::make_shared<FakeSynthesizer>();
  fake->silentChunk = 1;
  Pipeline pipeline(fake, smallChunks());

  try
  {
    pipeline.synthesize(requestFor(LONG_TEXT));
    FAIL() << "expected SynthesisBackendError";
  }
  catch (const SynthesisBackendError& e)
  {
    EXPECT_EQ(e.chunkIndex(), 1u);
  }
}

TEST(Pipeline, SampleRateMismatchIsFatal) {
  auto fake = std::make_shared<FakeSynthesizer>();
  fake->rateOverrides[1] = 16000;
  Pipeline pipeline(fake, smallChunks());

  EXPECT_THROW(pipeline.synthesize(requestFor(LONG_TEXT)), FormatMismatchError);
}

TEST(Pipeline, SynthesizeAllRejectsEmptyChunkList) {
  Pipeline pipeline(std::make_shared<FakeSynthesizer>(), smallChunks());
  EXPECT_THROW(pipeline.synthesizeAll({}, VoiceParameters{}, SynthesisOptions{}), InvalidInputError);
}

TEST(Pipeline, DeferredDeliveryRoundTrip) {
  Pipeline pipeline(std::make_shared<FakeSynthesizer>(), smallChunks());

  auto audio = pipeline.synthesize(requestFor(LONG_TEXT));
  auto job = pipeline.registerJob(audio);
  EXPECT_EQ(pipeline.fetchJob(job.id), audio);
  EXPECT_EQ(job.sizeBytes, pipeline.fetchJobWav(job.id)->size());

  EXPECT_TRUE(pipeline.evictJob(job.id));
  EXPECT_THROW(pipeline.fetchJob(job.id), NotFoundError);
  EXPECT_THROW(pipeline.fetchJob("nonexistent"), NotFoundError);
}

TEST(Pipeline, RejectsInvalidConfig) {
  auto config = smallChunks();
  config.synthesisThreads = 0;
  EXPECT_THROW({ Pipeline pipeline(std::make_shared<FakeSynthesizer>(), config); }, InvalidParameterError);
  EXPECT_THROW({ Pipeline pipeline(nullptr, smallChunks()); }, std::runtime_error);
}

TEST(Pipeline, ReferenceNeedsBothHalves) {
  EXPECT_FALSE(pairReference("", "").has_value());

  auto paired = pairReference("ref.wav", "Xin chào");
  ASSERT_TRUE(paired.has_value());
  EXPECT_EQ(paired->file, "ref.wav");
  EXPECT_EQ(paired->text, "Xin chào");

  try
  {
    pairReference("ref.wav", "");
    FAIL() << "audio without transcript was accepted";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "reference_text");
  }
  try
  {
    pairReference("", "Xin chào");
    FAIL() << "transcript without audio was accepted";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "reference_audio");
  }
}

TEST(Pipeline, CallerReferenceReachesEveryChunk) {
  auto path = (std::filesystem::temp_directory_path() / "vietvoice_pipeline_reference.wav").string();
  writeWavFile(path, std::vector<float>(800, 0.25f), 8000);

  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  auto request = requestFor(LONG_TEXT);
  request.reference = ReferenceOverride{path, "  Tôi là   giọng mẫu. "};
  pipeline.synthesize(request);

  ASSERT_GT(fake->references.size(), 1u);
  for (const auto& reference : fake->references)
  {
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(reference->file, path);
    EXPECT_EQ(reference->text, "Tôi là giọng mẫu.");
  }

  std::filesystem::remove(path);
}

TEST(Pipeline, CatalogIsUsedWithoutCallerReference) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());
  pipeline.synthesize(requestFor(LONG_TEXT));

  ASSERT_FALSE(fake->references.empty());
  for (const auto& reference : fake->references)
  {
    EXPECT_FALSE(reference.has_value());
  }
}

TEST(Pipeline, CallerReferenceIsCheckedBeforeSynthesis) {
  auto fake = std::make_shared<FakeSynthesizer>();
  Pipeline pipeline(fake, smallChunks());

  auto missing = requestFor(LONG_TEXT);
  missing.reference = ReferenceOverride{"/nonexistent/vietvoice_reference.wav", "Xin chào"};
  try
  {
    pipeline.prepare(missing);
    FAIL() << "missing reference file was accepted";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "reference_audio");
  }

  auto path = (std::filesystem::temp_directory_path() / "vietvoice_pipeline_blank.wav").string();
  writeWavFile(path, std::vector<float>(80, 0.0f), 8000);
  auto blank = requestFor(LONG_TEXT);
  blank.reference = ReferenceOverride{path, " \n "};
  try
  {
    pipeline.prepare(blank);
    FAIL() << "blank transcript was accepted";
  }
  catch (const InvalidParameterError& e)
  {
    EXPECT_EQ(e.field(), "reference_text");
  }
  std::filesystem::remove(path);

  EXPECT_EQ(fake->calls.load(), 0u);
}

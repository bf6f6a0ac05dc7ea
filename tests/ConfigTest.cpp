#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "Config.hpp"
#include "Errors.hpp"

using namespace vietvoice;

namespace {

std::string fieldOf(const json& root) {
  try
  {
    parseServiceConfig(root);
  }
  catch (const InvalidParameterError& e)
  {
    return e.field();
  }
  return "";
}

} // namespace

TEST(Config, EmptyObjectGivesDefaults) {
  auto config = parseServiceConfig(json::object());
  EXPECT_EQ(config.logLevel, "info");
  EXPECT_EQ(config.segmentation.maxChars, 135u);
  EXPECT_DOUBLE_EQ(config.segmentation.minChunkRatio, 0.25);
  EXPECT_EQ(config.segmentation.mergeToleranceChars, 0u);
  EXPECT_EQ(config.maxInputChars, 500u);
  EXPECT_TRUE(config.normalizeText);
  EXPECT_DOUBLE_EQ(config.audio.crossFadeSeconds, 0.1);
  EXPECT_DOUBLE_EQ(config.audio.minTargetSeconds, 1.0);
  EXPECT_EQ(config.audio.fadeCurve, FadeCurve::Linear);
  EXPECT_EQ(config.synthesisThreads, 1u);
  EXPECT_FLOAT_EQ(config.defaultSpeed, 0.9f);
  EXPECT_DOUBLE_EQ(config.jobs.lifespanSeconds, 4800.0);
  EXPECT_EQ(config.jobs.maxJobs, 256u);
  EXPECT_EQ(config.jobs.maxBytes, 512u * 1024 * 1024);
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8000);
  EXPECT_FALSE(config.voiceDefaults.gender.has_value());
}

TEST(Config, ReadsEverySection) {
  auto root = json::parse(R"({
    "log_level": "debug",
    "segmentation": {"max_chars": 80, "min_chunk_ratio": 0.1, "merge_tolerance_chars": 4,
                     "max_input_chars": 1000, "normalize_text": false},
    "audio": {"cross_fade_duration": 0.05, "min_target_duration": 0.5,
              "fade_curve": "equal_power", "peak_level": 0.9},
    "synthesis": {"threads": 4, "speed": 1.2},
    "voice": {"gender": "female", "area": "northern"},
    "jobs": {"lifespan_seconds": 60, "max_jobs": 10, "max_bytes": 0, "sweep_interval_seconds": 5},
    "server": {"host": "127.0.0.1", "port": 9000},
    "model": {"path": "model.onnx", "config": "/abs/model.json"}
  })");
  auto config = parseServiceConfig(root, "/data");

  EXPECT_EQ(config.logLevel, "debug");
  EXPECT_EQ(config.segmentation.maxChars, 80u);
  EXPECT_DOUBLE_EQ(config.segmentation.minChunkRatio, 0.1);
  EXPECT_EQ(config.segmentation.mergeToleranceChars, 4u);
  EXPECT_EQ(config.maxInputChars, 1000u);
  EXPECT_FALSE(config.normalizeText);
  EXPECT_DOUBLE_EQ(config.audio.crossFadeSeconds, 0.05);
  EXPECT_EQ(config.audio.fadeCurve, FadeCurve::EqualPower);
  EXPECT_FLOAT_EQ(config.audio.peakLevel, 0.9f);
  EXPECT_EQ(config.synthesisThreads, 4u);
  EXPECT_FLOAT_EQ(config.defaultSpeed, 1.2f);
  EXPECT_EQ(config.voiceDefaults.gender, std::optional<std::string>("female"));
  EXPECT_EQ(config.voiceDefaults.area, std::optional<std::string>("northern"));
  EXPECT_EQ(config.jobs.maxJobs, 10u);
  EXPECT_EQ(config.jobs.maxBytes, 0u);
  EXPECT_EQ(config.server.port, 9000);
  EXPECT_EQ(config.model.model, (std::filesystem::path("/data") / "model.onnx").string());
  EXPECT_EQ(config.model.config, "/abs/model.json");
}

TEST(Config, NamesOffendingKey) {
  EXPECT_EQ(fieldOf(json::parse(R"({"segmentation": {"max_chars": 0}})")), "segmentation.max_chars");
  EXPECT_EQ(fieldOf(json::parse(R"({"segmentation": {"max_chars": -3}})")), "segmentation.max_chars");
  EXPECT_EQ(fieldOf(json::parse(R"({"segmentation": {"max_chars": "ten"}})")), "segmentation.max_chars");
  EXPECT_EQ(fieldOf(json::parse(R"({"audio": {"cross_fade_duration": -0.1}})")), "audio.cross_fade_duration");
  EXPECT_EQ(fieldOf(json::parse(R"({"audio": {"min_target_duration": -1}})")), "audio.min_target_duration");
  EXPECT_EQ(fieldOf(json::parse(R"({"audio": {"fade_curve": "cubic"}})")), "audio.fade_curve");
  EXPECT_EQ(fieldOf(json::parse(R"({"synthesis": {"speed": 3.0}})")), "synthesis.speed");
  EXPECT_EQ(fieldOf(json::parse(R"({"synthesis": {"speed": 1e300}})")), "synthesis.speed");
  EXPECT_EQ(fieldOf(json::parse(R"({"synthesis": {"threads": 0}})")), "synthesis.threads");
  EXPECT_EQ(fieldOf(json::parse(R"({"voice": {"emotion": "bored"}})")), "voice.emotion");
  EXPECT_EQ(fieldOf(json::parse(R"({"log_level": "loud"})")), "log_level");
  EXPECT_EQ(fieldOf(json::parse(R"({"server": {"port": 70000}})")), "server.port");
  EXPECT_EQ(fieldOf(json::parse(R"({"server": {"port": 4294967297}})")), "server.port");
  EXPECT_EQ(fieldOf(json::parse(R"({"server": {"port": -4294967295}})")), "server.port");
  EXPECT_EQ(fieldOf(json::parse(R"([1, 2])")), "config");
}

TEST(Config, EvictionPolicyFollowsJobsSection) {
  JobsConfig jobs;
  jobs.lifespanSeconds = 10;
  jobs.maxJobs = 1;
  jobs.maxBytes = 0;
  auto policy = makeEvictionPolicy(jobs);

  auto now = Clock::now();
  std::vector<JobInfo> infos = {{"old", now - std::chrono::seconds(20), 1},
                                {"mid", now - std::chrono::seconds(5), 1},
                                {"new", now, 1}};
  EXPECT_EQ(policy->selectVictims(infos, now), (std::vector<std::string>{"old", "mid"}));
}

TEST(Config, LoadsFileAndResolvesPathsBesideIt) {
  auto dir = std::filesystem::temp_directory_path() / "vietvoice_config_test";
  std::filesystem::create_directories(dir);
  auto path = dir / "config.json";
  {
    std::ofstream out(path);
    out << R"({"model": {"path": "voices/model.onnx"}, "synthesis": {"threads": 2}})";
  }

  auto config = loadServiceConfig(path.string());
  EXPECT_EQ(config.synthesisThreads, 2u);
  EXPECT_EQ(config.model.model, (std::filesystem::absolute(dir) / "voices/model.onnx").string());
  std::filesystem::remove_all(dir);
}

TEST(Config, MissingOrMalformedFileThrows) {
  EXPECT_THROW(loadServiceConfig("/nonexistent/vietvoice.json"), std::runtime_error);

  auto path = std::filesystem::temp_directory_path() / "vietvoice_bad_config.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(loadServiceConfig(path.string()), std::runtime_error);
  std::filesystem::remove(path);
}

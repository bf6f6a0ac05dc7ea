#include "Config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "SegmentSynthesizer.hpp"

namespace vietvoice {

namespace {

long long readInteger(const json& section, const char* key, long long fallback, const std::string& path) {
  if (!section.contains(key))
  {
    return fallback;
  }
  const auto& value = section[key];
  if (!value.is_number_integer())
  {
    throw InvalidParameterError(path + key, "must be an integer");
  }
  return value.get<long long>();
}

double readNumber(const json& section, const char* key, double fallback, const std::string& path) {
  if (!section.contains(key))
  {
    return fallback;
  }
  const auto& value = section[key];
  if (!value.is_number())
  {
    throw InvalidParameterError(path + key, "must be a number");
  }
  return value.get<double>();
}

std::string readString(const json& section, const char* key, const std::string& fallback, const std::string& path) {
  if (!section.contains(key))
  {
    return fallback;
  }
  const auto& value = section[key];
  if (!value.is_string())
  {
    throw InvalidParameterError(path + key, "must be a string");
  }
  return value.get<std::string>();
}

std::optional<std::string> readOptionalString(const json& section, const char* key, const std::string& path) {
  if (!section.contains(key) || section[key].is_null())
  {
    return std::nullopt;
  }
  return readString(section, key, "", path);
}

std::size_t readCount(const json& section, const char* key, std::size_t fallback, const std::string& path) {
  long long value = readInteger(section, key, static_cast<long long>(fallback), path);
  if (value < 0)
  {
    throw InvalidParameterError(path + key, "must not be negative");
  }
  return static_cast<std::size_t>(value);
}

std::string resolvePath(const std::string& path, const std::string& baseDir) {
  if (path.empty() || baseDir.empty() || std::filesystem::path(path).is_absolute())
  {
    return path;
  }
  return (std::filesystem::path(baseDir) / path).string();
}

// Load JSON section for text segmentation
void parseSegmentation(const json& root, ServiceConfig& config) {
  if (!root.contains("segmentation"))
  {
    return;
  }
  const auto& section = root["segmentation"];
  config.segmentation.maxChars = readCount(section, "max_chars", config.segmentation.maxChars, "segmentation.");
  config.segmentation.minChunkRatio =
      readNumber(section, "min_chunk_ratio", config.segmentation.minChunkRatio, "segmentation.");
  config.segmentation.mergeToleranceChars =
      readCount(section, "merge_tolerance_chars", config.segmentation.mergeToleranceChars, "segmentation.");
  config.maxInputChars = readCount(section, "max_input_chars", config.maxInputChars, "segmentation.");
  if (section.contains("normalize_text"))
  {
    if (!section["normalize_text"].is_boolean())
    {
      throw InvalidParameterError("segmentation.normalize_text", "must be true or false");
    }
    config.normalizeText = section["normalize_text"].get<bool>();
  }
}

// Load JSON section for assembling chunk audio
void parseAudio(const json& root, ServiceConfig& config) {
  if (!root.contains("audio"))
  {
    return;
  }
  const auto& section = root["audio"];
  config.audio.crossFadeSeconds = readNumber(section, "cross_fade_duration", config.audio.crossFadeSeconds, "audio.");
  config.audio.minTargetSeconds = readNumber(section, "min_target_duration", config.audio.minTargetSeconds, "audio.");
  config.audio.peakLevel =
      static_cast<float>(readNumber(section, "peak_level", static_cast<double>(config.audio.peakLevel), "audio."));
  if (section.contains("fade_curve"))
  {
    try
    {
      config.audio.fadeCurve = parseFadeCurve(readString(section, "fade_curve", "linear", "audio."));
    }
    catch (const InvalidParameterError& e)
    {
      throw InvalidParameterError("audio." + e.field(), e.reason());
    }
  }
}

void parseSynthesis(const json& root, ServiceConfig& config) {
  if (root.contains("synthesis"))
  {
    const auto& section = root["synthesis"];
    config.synthesisThreads = readCount(section, "threads", config.synthesisThreads, "synthesis.");
    double speed = readNumber(section, "speed", static_cast<double>(config.defaultSpeed), "synthesis.");
    if (!(speed >= MIN_SPEED && speed <= MAX_SPEED))
    {
      throw InvalidParameterError("synthesis.speed", "must be within [0.25, 2.0]");
    }
    config.defaultSpeed = static_cast<float>(speed);
  }

  if (root.contains("voice"))
  {
    const auto& section = root["voice"];
    config.voiceDefaults.gender = readOptionalString(section, "gender", "voice.");
    config.voiceDefaults.area = readOptionalString(section, "area", "voice.");
    config.voiceDefaults.group = readOptionalString(section, "group", "voice.");
    config.voiceDefaults.emotion = readOptionalString(section, "emotion", "voice.");
  }
}

void parseJobs(const json& root, ServiceConfig& config) {
  if (root.contains("jobs"))
  {
    const auto& section = root["jobs"];
    config.jobs.lifespanSeconds = readNumber(section, "lifespan_seconds", config.jobs.lifespanSeconds, "jobs.");
    config.jobs.maxJobs = readCount(section, "max_jobs", config.jobs.maxJobs, "jobs.");
    config.jobs.maxBytes = readCount(section, "max_bytes", config.jobs.maxBytes, "jobs.");
    config.jobs.sweepIntervalSeconds =
        readNumber(section, "sweep_interval_seconds", config.jobs.sweepIntervalSeconds, "jobs.");
  }

  if (root.contains("server"))
  {
    const auto& section = root["server"];
    config.server.host = readString(section, "host", config.server.host, "server.");
    long long port = readInteger(section, "port", config.server.port, "server.");
    if (port <= 0 || port > 65535)
    {
      throw InvalidParameterError("server.port", "must be within [1, 65535]");
    }
    config.server.port = static_cast<int>(port);
  }
}

} // namespace

ServiceConfig parseServiceConfig(const json& root, const std::string& baseDir) {
  if (!root.is_object())
  {
    throw InvalidParameterError("config", "top level must be a JSON object");
  }

  ServiceConfig config;
  config.logLevel = readString(root, "log_level", config.logLevel, "");

  parseSegmentation(root, config);
  parseAudio(root, config);
  parseSynthesis(root, config);
  parseJobs(root, config);

  if (root.contains("model"))
  {
    const auto& section = root["model"];
    config.model.model = resolvePath(readString(section, "path", "", "model."), baseDir);
    config.model.config = resolvePath(readString(section, "config", "", "model."), baseDir);
  }

  validateServiceConfig(config);
  return config;
}

ServiceConfig loadServiceConfig(const std::string& path) {
  spdlog::debug("Parsing service config at {}", path);
  std::ifstream configFile(path);
  if (!configFile)
  {
    throw std::runtime_error("Cannot open config file " + path);
  }

  json root;
  try
  {
    root = json::parse(configFile);
  }
  catch (const json::exception& e)
  {
    throw std::runtime_error("Malformed config file " + path + ": " + e.what());
  }

  auto baseDir = std::filesystem::absolute(path).parent_path().string();
  return parseServiceConfig(root, baseDir);
}

void validateServiceConfig(const ServiceConfig& config) {
  auto level = spdlog::level::from_str(config.logLevel);
  if (level == spdlog::level::off && config.logLevel != "off")
  {
    throw InvalidParameterError("log_level", "unknown level '" + config.logLevel + "'");
  }

  if (config.segmentation.maxChars == 0)
  {
    throw InvalidParameterError("segmentation.max_chars", "must be positive");
  }
  if (config.segmentation.minChunkRatio < 0.0 || config.segmentation.minChunkRatio > 1.0)
  {
    throw InvalidParameterError("segmentation.min_chunk_ratio", "must be within [0, 1]");
  }
  if (config.maxInputChars == 0)
  {
    throw InvalidParameterError("segmentation.max_input_chars", "must be positive");
  }

  if (config.audio.crossFadeSeconds < 0.0)
  {
    throw InvalidParameterError("audio.cross_fade_duration", "must not be negative");
  }
  if (config.audio.minTargetSeconds < 0.0)
  {
    throw InvalidParameterError("audio.min_target_duration", "must not be negative");
  }
  if (config.audio.peakLevel < 0.0f || config.audio.peakLevel > 1.0f)
  {
    throw InvalidParameterError("audio.peak_level", "must be within [0, 1]");
  }

  if (config.synthesisThreads == 0)
  {
    throw InvalidParameterError("synthesis.threads", "must be at least 1");
  }
  if (config.defaultSpeed < MIN_SPEED || config.defaultSpeed > MAX_SPEED)
  {
    throw InvalidParameterError("synthesis.speed", "must be within [0.25, 2.0]");
  }

  try
  {
    resolveVoice(VoiceSelection{}, config.voiceDefaults);
  }
  catch (const InvalidParameterError& e)
  {
    throw InvalidParameterError("voice." + e.field(), e.reason());
  }

  if (config.jobs.lifespanSeconds <= 0.0)
  {
    throw InvalidParameterError("jobs.lifespan_seconds", "must be positive");
  }
  if (config.jobs.sweepIntervalSeconds <= 0.0)
  {
    throw InvalidParameterError("jobs.sweep_interval_seconds", "must be positive");
  }
  if (config.server.port <= 0 || config.server.port > 65535)
  {
    throw InvalidParameterError("server.port", "must be within [1, 65535]");
  }
}

std::unique_ptr<EvictionPolicy> makeEvictionPolicy(const JobsConfig& config) {
  std::vector<std::unique_ptr<EvictionPolicy>> policies;
  auto lifespan = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(config.lifespanSeconds));
  policies.push_back(std::make_unique<TtlEvictionPolicy>(lifespan));
  if (config.maxJobs > 0 || config.maxBytes > 0)
  {
    policies.push_back(std::make_unique<CapacityEvictionPolicy>(config.maxJobs, config.maxBytes));
  }
  return std::make_unique<CompositeEvictionPolicy>(std::move(policies));
}

} // namespace vietvoice

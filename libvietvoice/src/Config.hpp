#ifndef VIETVOICE_CONFIG_H
#define VIETVOICE_CONFIG_H

#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "Assembler.hpp"
#include "JobStore.hpp"
#include "Segmenter.hpp"
#include "VoiceParameters.hpp"

using json = nlohmann::json;

namespace vietvoice {

struct JobsConfig
{
  double lifespanSeconds = 4800.0;
  std::size_t maxJobs = 256;
  std::size_t maxBytes = 512 * 1024 * 1024;
  double sweepIntervalSeconds = 60.0;
};

struct ServerConfig
{
  std::string host = "0.0.0.0";
  int port = 8000;
};

struct ModelPaths
{
  std::string model;
  std::string config;
};

// Loaded once at startup and never mutated afterwards; anything that varies
// per request travels in SynthesisRequest instead.
struct ServiceConfig
{
  std::string logLevel = "info";

  SegmenterConfig segmentation;
  std::size_t maxInputChars = 500;
  bool normalizeText = true;

  AssemblerConfig audio;

  std::size_t synthesisThreads = 1;
  float defaultSpeed = 0.9f;
  VoiceSelection voiceDefaults;

  JobsConfig jobs;
  ServerConfig server;
  ModelPaths model;
};

// Every key is optional. Relative model paths are resolved against baseDir.
// Throws InvalidParameterError naming the offending key.
ServiceConfig parseServiceConfig(const json& root, const std::string& baseDir = "");
ServiceConfig loadServiceConfig(const std::string& path);

void validateServiceConfig(const ServiceConfig& config);

std::unique_ptr<EvictionPolicy> makeEvictionPolicy(const JobsConfig& config);

} // namespace vietvoice

#endif // VIETVOICE_CONFIG_H

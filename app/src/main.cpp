#include "VietVoice.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using namespace vietvoice;

namespace {

struct CliParams
{
  std::string text;
  std::string output;

  std::string model;
  std::string modelConfig;
  std::string config;

  VoiceSelection voice;
  std::optional<float> speed;
  std::optional<std::size_t> sampleIteration;
  std::optional<ReferenceOverride> reference;

  std::optional<std::size_t> maxChars;
  std::optional<double> crossFadeSeconds;
  std::optional<double> minTargetSeconds;
  std::optional<std::size_t> threads;

  bool debug = false;
  bool quiet = false;
  bool help = false;
};

std::string join(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names)
  {
    joined += joined.empty() ? name : "|" + name;
  }
  return joined;
}

void printUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [options] TEXT OUTPUT.wav\n"
            << "\n"
            << "options:\n"
            << "  --model PATH                 ONNX model (default: model.onnx in the data directory)\n"
            << "  --model-config PATH          model JSON config (default: MODEL.json)\n"
            << "  --config PATH                service config JSON\n"
            << "  --gender NAME                " << join(genderNames()) << "\n"
            << "  --area NAME                  " << join(areaNames()) << "\n"
            << "  --group NAME                 " << join(groupNames()) << "\n"
            << "  --emotion NAME               " << join(emotionNames()) << "\n"
            << "  --speed N                    speaking rate in [0.25, 2.0]\n"
            << "  --sample-iteration N         pick the N-th matching reference sample\n"
            << "  --reference-audio PATH       imitate this WAV instead of a catalog sample\n"
            << "  --reference-text TEXT        transcript of --reference-audio\n"
            << "  --max-chars N                maximum characters per chunk\n"
            << "  --cross-fade-duration SEC    overlap between chunks\n"
            << "  --min-target-duration SEC    pad shorter output with silence\n"
            << "  --threads N                  chunks synthesized in parallel\n"
            << "  --debug                      print debug messages\n"
            << "  --quiet                      print warnings and errors only\n"
            << "  --help                       show this message\n";
}

std::string requireValue(int& i, int argc, char** argv) {
  std::string option = argv[i];
  if (i + 1 >= argc)
  {
    throw InvalidParameterError(option, "missing value");
  }
  return argv[++i];
}

double parseDouble(const std::string& option, const std::string& value) {
  std::size_t used = 0;
  double result = 0.0;
  try
  {
    result = std::stod(value, &used);
  }
  catch (const std::logic_error&)
  {
    throw InvalidParameterError(option, "'" + value + "' is not a number");
  }
  if (used != value.size())
  {
    throw InvalidParameterError(option, "'" + value + "' is not a number");
  }
  return result;
}

std::size_t parseCount(const std::string& option, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
  {
    throw InvalidParameterError(option, "'" + value + "' is not a non-negative integer");
  }
  try
  {
    return static_cast<std::size_t>(std::stoull(value));
  }
  catch (const std::out_of_range&)
  {
    throw InvalidParameterError(option, "'" + value + "' is too large");
  }
}

CliParams parseArgs(int argc, char** argv) {
  CliParams params;
  std::vector<std::string> positional;
  std::string referenceAudio;
  std::string referenceText;

  for (int i = 1; i < argc; i++)
  {
    std::string arg = argv[i];
    if (arg == "--model")
    {
      params.model = requireValue(i, argc, argv);
    }
    else if (arg == "--model-config")
    {
      params.modelConfig = requireValue(i, argc, argv);
    }
    else if (arg == "--config")
    {
      params.config = requireValue(i, argc, argv);
    }
    else if (arg == "--gender")
    {
      params.voice.gender = requireValue(i, argc, argv);
    }
    else if (arg == "--area")
    {
      params.voice.area = requireValue(i, argc, argv);
    }
    else if (arg == "--group")
    {
      params.voice.group = requireValue(i, argc, argv);
    }
    else if (arg == "--emotion")
    {
      params.voice.emotion = requireValue(i, argc, argv);
    }
    else if (arg == "--speed")
    {
      double speed = parseDouble(arg, requireValue(i, argc, argv));
      if (!(speed >= MIN_SPEED && speed <= MAX_SPEED))
      {
        throw InvalidParameterError(arg, "must be within [0.25, 2.0]");
      }
      params.speed = static_cast<float>(speed);
    }
    else if (arg == "--sample-iteration")
    {
      params.sampleIteration = parseCount(arg, requireValue(i, argc, argv));
    }
    else if (arg == "--reference-audio")
    {
      referenceAudio = requireValue(i, argc, argv);
    }
    else if (arg == "--reference-text")
    {
      referenceText = requireValue(i, argc, argv);
    }
    else if (arg == "--max-chars")
    {
      params.maxChars = parseCount(arg, requireValue(i, argc, argv));
    }
    else if (arg == "--cross-fade-duration")
    {
      params.crossFadeSeconds = parseDouble(arg, requireValue(i, argc, argv));
    }
    else if (arg == "--min-target-duration")
    {
      params.minTargetSeconds = parseDouble(arg, requireValue(i, argc, argv));
    }
    else if (arg == "--threads")
    {
      params.threads = parseCount(arg, requireValue(i, argc, argv));
    }
    else if (arg == "--debug")
    {
      params.debug = true;
    }
    else if (arg == "--quiet")
    {
      params.quiet = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      params.help = true;
    }
    else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
    {
      throw InvalidParameterError(arg, "unknown option");
    }
    else
    {
      positional.push_back(arg);
    }
  }

  try
  {
    params.reference = pairReference(referenceAudio, referenceText);
  }
  catch (const InvalidParameterError& e)
  {
    bool audioMissing = e.field() == "reference_audio";
    throw InvalidParameterError(audioMissing ? "--reference-audio" : "--reference-text",
                                audioMissing ? "required with --reference-text" : "required with --reference-audio");
  }

  if (!params.help)
  {
    if (positional.size() != 2)
    {
      throw InvalidParameterError("arguments", "expected TEXT and OUTPUT.wav");
    }
    params.text = positional[0];
    params.output = positional[1];
  }
  return params;
}

ServiceConfig buildConfig(const CliParams& params) {
  ServiceConfig config;
  if (!params.config.empty())
  {
    config = loadServiceConfig(params.config);
  }
  else
  {
    auto defaultConfig = FileManager::findDataFile("config.json");
    if (!defaultConfig.empty())
    {
      config = loadServiceConfig(defaultConfig.string());
    }
  }

  if (params.maxChars)
  {
    config.segmentation.maxChars = *params.maxChars;
  }
  if (params.crossFadeSeconds)
  {
    config.audio.crossFadeSeconds = *params.crossFadeSeconds;
  }
  if (params.minTargetSeconds)
  {
    config.audio.minTargetSeconds = *params.minTargetSeconds;
  }
  if (params.threads)
  {
    config.synthesisThreads = *params.threads;
  }
  if (!params.model.empty())
  {
    config.model.model = params.model;
    config.model.config = params.modelConfig;
  }
  else if (!params.modelConfig.empty())
  {
    config.model.config = params.modelConfig;
  }

  if (config.model.model.empty())
  {
    auto defaultModel = FileManager::findDataFile("model.onnx");
    if (defaultModel.empty())
    {
      throw InvalidParameterError("--model", "no model given and none found in the data directory");
    }
    config.model.model = defaultModel.string();
  }

  validateServiceConfig(config);
  return config;
}

} // namespace

int main(int argc, char** argv) {
  CliParams params;
  try
  {
    params = parseArgs(argc, argv);
  }
  catch (const InvalidParameterError& e)
  {
    std::cerr << e.what() << "\n\n";
    printUsage(argv[0]);
    return 2;
  }

  if (params.help)
  {
    printUsage(argv[0]);
    return 0;
  }

  if (params.debug)
  {
    spdlog::set_level(spdlog::level::debug);
  }
  else if (params.quiet)
  {
    spdlog::set_level(spdlog::level::warn);
  }

  try
  {
    auto config = buildConfig(params);
    if (!params.debug && !params.quiet)
    {
      spdlog::set_level(spdlog::level::from_str(config.logLevel));
    }

    auto synthesizer =
        std::make_shared<OnnxSynthesizer>(config.model.model, config.model.config, config.synthesisThreads);
    Pipeline pipeline(synthesizer, config);

    SynthesisRequest request;
    request.text = params.text;
    request.voice = params.voice;
    request.speed = params.speed;
    request.sampleIteration = params.sampleIteration;
    request.reference = params.reference;

    SynthesisStats stats;
    auto audio = pipeline.synthesize(request, stats);
    writeWavFile(params.output, audio.samples, audio.sampleRate);

    if (!params.quiet)
    {
      std::cout << "Wrote " << std::filesystem::absolute(params.output).string() << "\n"
                << "  duration:    " << audio.durationSeconds << " s\n"
                << "  sample rate: " << audio.sampleRate << " Hz\n"
                << "  size:        " << audio.sizeBytes() << " bytes\n"
                << "  chunks:      " << stats.chunkCount << "\n"
                << "  real-time factor: " << stats.realTimeFactor << std::endl;
    }
  }
  catch (const VietVoiceError& e)
  {
    spdlog::error("{}", e.what());
    return 1;
  }
  catch (const std::exception& e)
  {
    spdlog::error("Synthesis failed: {}", e.what());
    return 1;
  }

  return 0;
}

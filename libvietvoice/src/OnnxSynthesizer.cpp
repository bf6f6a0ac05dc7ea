#include "OnnxSynthesizer.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <utf8.h>

#include "Errors.hpp"
#include "TextNormalizer.hpp"
#include "WavFile.hpp"

using namespace vietvoice;

namespace {

std::string resolveRelative(const std::string& path, const std::string& baseDir) {
  if (path.empty() || baseDir.empty() || std::filesystem::path(path).is_absolute())
  {
    return path;
  }
  return (std::filesystem::path(baseDir) / path).string();
}

} // namespace

OnnxSynthesizer::OnnxSynthesizer(const std::string& modelPath, const std::string& modelConfigPath, std::size_t threads) {
  std::string configPath = modelConfigPath;
  if (configPath.empty())
  {
    configPath = modelPath + ".json";
  }

  spdlog::debug("Parsing model config at {}", configPath);
  std::ifstream modelConfigFile(configPath);
  if (!modelConfigFile)
  {
    throw std::runtime_error("Cannot open model config " + configPath);
  }
  json configRoot;
  try
  {
    configRoot = json::parse(modelConfigFile);
  }
  catch (const json::exception& e)
  {
    throw std::runtime_error("Malformed model config " + configPath + ": " + e.what());
  }

  modelConfig = parseModelConfig(configRoot, std::filesystem::absolute(configPath).parent_path().string());
  loadVocab(modelConfig.vocabPath);
  catalog = ReferenceCatalog::load(modelConfig.referencesPath);
  loadReferenceAudio();

  loadModel(modelPath, threads);
}

OnnxSynthesizer::~OnnxSynthesizer() {
  spdlog::debug("Destroying ONNX synthesizer");
}

// Load JSON config for the model's audio settings and data files
OnnxModelConfig OnnxSynthesizer::parseModelConfig(const json& configRoot, const std::string& baseDir) {
  OnnxModelConfig config;
  if (configRoot.contains("audio"))
  {
    auto audioValue = configRoot["audio"];
    config.sampleRate = audioValue.value("sample_rate", config.sampleRate);
    config.hopLength = audioValue.value("hop_length", config.hopLength);
    config.maxChunkSeconds = audioValue.value("max_chunk_duration", config.maxChunkSeconds);
  }

  if (!configRoot.contains("vocab") || !configRoot.contains("references"))
  {
    throw std::runtime_error("Model config needs 'vocab' and 'references' paths");
  }
  config.vocabPath = resolveRelative(configRoot["vocab"].get<std::string>(), baseDir);
  config.referencesPath = resolveRelative(configRoot["references"].get<std::string>(), baseDir);

  if (config.sampleRate <= 0 || config.hopLength <= 0 || config.maxChunkSeconds <= 0)
  {
    throw std::runtime_error("Model config audio settings must be positive");
  }
  return config;
}

void OnnxSynthesizer::loadModel(const std::string& modelPath, std::size_t threads) {
  spdlog::debug("Loading onnx model from {}", modelPath);
  session.env = Ort::Env(OrtLoggingLevel::ORT_LOGGING_LEVEL_WARNING, "vietvoice");
  session.env.DisableTelemetryEvents();

  session.options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
  session.options.SetIntraOpNumThreads(static_cast<int>(std::max<std::size_t>(threads, 1)));

  session.options.DisableCpuMemArena();
  session.options.DisableMemPattern();
  session.options.DisableProfiling();

  auto startTime = std::chrono::steady_clock::now();

#ifdef _WIN32
  auto modelPathW = std::wstring(modelPath.begin(), modelPath.end());
  auto modelPathStr = modelPathW.c_str();
#else
  auto modelPathStr = modelPath.c_str();
#endif

  try
  {
    session.onnx = Ort::Session(session.env, modelPathStr, session.options);
  }
  catch (const Ort::Exception& e)
  {
    throw std::runtime_error("Cannot load onnx model " + modelPath + ": " + e.what());
  }

  auto endTime = std::chrono::steady_clock::now();
  spdlog::debug("Loaded onnx model in {} second(s)", std::chrono::duration<double>(endTime - startTime).count());
}

// One character per line; the line number is its id
void OnnxSynthesizer::loadVocab(const std::string& vocabPath) {
  spdlog::debug("Loading vocabulary from {}", vocabPath);
  std::ifstream vocabFile(vocabPath);
  if (!vocabFile)
  {
    throw std::runtime_error("Cannot open vocabulary " + vocabPath);
  }

  std::string line;
  int32_t id = 0;
  while (std::getline(vocabFile, line))
  {
    if (!line.empty() && line.back() == '\r')
    {
      line.pop_back();
    }
    if (!utf8::is_valid(line.begin(), line.end()))
    {
      throw std::runtime_error("Vocabulary line " + std::to_string(id) + " is not valid UTF-8");
    }
    auto codepoints = utf8::utf8to32(line);
    if (codepoints.size() == 1)
    {
      vocab.emplace(codepoints.front(), id);
    }
    else
    {
      spdlog::debug("Skipping vocabulary line {} ({} code points)", id, codepoints.size());
    }
    id++;
  }

  if (vocab.empty())
  {
    throw std::runtime_error("Vocabulary " + vocabPath + " is empty");
  }
  spdlog::debug("Loaded {} vocabulary entries", vocab.size());
}

void OnnxSynthesizer::loadReferenceAudio() {
  if (catalog.empty())
  {
    throw std::runtime_error("Reference catalog has no samples");
  }

  for (const auto& sample : catalog.samples())
  {
    if (referenceAudio.count(sample.file) > 0)
    {
      continue;
    }
    referenceAudio.emplace(sample.file, decodeReference(sample.file));
  }
  spdlog::debug("Loaded audio for {} reference sample(s)", referenceAudio.size());
}

std::vector<int16_t> OnnxSynthesizer::decodeReference(const std::string& file) const {
  auto wav = readWavFile(file);
  if (wav.sampleRate != modelConfig.sampleRate)
  {
    throw std::runtime_error("Reference sample " + file + " is " + std::to_string(wav.sampleRate) +
                             " Hz, model expects " + std::to_string(modelConfig.sampleRate) + " Hz");
  }
  if (wav.samples.empty())
  {
    throw std::runtime_error("Reference sample " + file + " has no audio");
  }
  return toPcm16(wav.samples);
}

std::shared_ptr<const std::vector<int16_t>> OnnxSynthesizer::customReference(const std::string& file) {
  std::lock_guard<std::mutex> lock(customReferenceMutex);
  if (!customReferenceAudio || customReferenceFile != file)
  {
    customReferenceAudio = std::make_shared<const std::vector<int16_t>>(decodeReference(file));
    customReferenceFile = file;
    spdlog::debug("Decoded caller reference {} ({} samples)", file, customReferenceAudio->size());
  }
  return customReferenceAudio;
}

std::vector<int32_t> OnnxSynthesizer::textToIds(const std::string& text) const {
  std::vector<int32_t> ids;
  std::size_t unknown = 0;
  for (auto codepoint : utf8::utf8to32(text))
  {
    auto found = vocab.find(codepoint);
    if (found == vocab.end())
    {
      unknown++;
      ids.push_back(0);
    }
    else
    {
      ids.push_back(found->second);
    }
  }

  if (unknown > 0)
  {
    spdlog::warn("{} character(s) missing from the vocabulary in: {}", unknown, text);
  }
  return ids;
}

int64_t OnnxSynthesizer::estimateMaxDuration(std::size_t referenceSamples,
                                             const std::string& referenceText,
                                             std::size_t chunkChars,
                                             float speed) const {
  int64_t referenceFrames = static_cast<int64_t>(referenceSamples / modelConfig.hopLength) + 1;
  double referenceChars = static_cast<double>(std::max<std::size_t>(weightedLength(referenceText), 1));

  double framesPerChar = static_cast<double>(referenceFrames) / referenceChars;
  double generatedFrames = framesPerChar * static_cast<double>(chunkChars) / static_cast<double>(speed);
  double maxFrames = modelConfig.maxChunkSeconds * modelConfig.sampleRate / modelConfig.hopLength;

  return referenceFrames + static_cast<int64_t>(std::min(generatedFrames, maxFrames));
}

// Chunk text to mono audio in [-1, 1]
SynthesizedSegment OnnxSynthesizer::synthesize(const TextChunk& chunk,
                                               const VoiceParameters& voice,
                                               const SynthesisOptions& options) {
  // Session inputs are non-const pointers
  std::vector<int16_t> audio;
  std::string referenceText;
  if (options.reference)
  {
    try
    {
      audio = *customReference(options.reference->file);
    }
    catch (const std::runtime_error& e)
    {
      throw SynthesisBackendError(chunk.index, e.what());
    }
    referenceText = options.reference->text;
    spdlog::debug("Chunk {}: using caller reference {}", chunk.index, options.reference->file);
  }
  else
  {
    const auto& reference = catalog.select(voice, options.sampleIteration);
    audio = referenceAudio.at(reference.file);
    referenceText = reference.text;
    spdlog::debug("Chunk {}: using reference {}", chunk.index, reference.file);
  }

  std::vector<int32_t> textIds = textToIds(referenceText + " " + chunk.content);
  std::array<int64_t, 1> maxDuration{
      estimateMaxDuration(audio.size(), referenceText, chunk.estimatedChars, options.speed)};

  SynthesizedSegment segment;
  segment.chunkIndex = chunk.index;
  segment.sampleRate = modelConfig.sampleRate;

  try
  {
    auto memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault);

    std::vector<Ort::Value> inputTensors;
    std::array<int64_t, 3> audioShape{1, 1, static_cast<int64_t>(audio.size())};
    inputTensors.push_back(Ort::Value::CreateTensor<int16_t>(
        memoryInfo, audio.data(), audio.size(), audioShape.data(), audioShape.size()));

    std::array<int64_t, 2> textIdsShape{1, static_cast<int64_t>(textIds.size())};
    inputTensors.push_back(Ort::Value::CreateTensor<int32_t>(
        memoryInfo, textIds.data(), textIds.size(), textIdsShape.data(), textIdsShape.size()));

    std::array<int64_t, 1> maxDurationShape{1};
    inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
        memoryInfo, maxDuration.data(), maxDuration.size(), maxDurationShape.data(), maxDurationShape.size()));

    std::array<const char*, 3> inputNames = {"audio", "text_ids", "max_duration"};
    std::array<const char*, 1> outputNames = {"generated_signal"};

    auto startTime = std::chrono::steady_clock::now();
    auto outputTensors = session.onnx.Run(Ort::RunOptions{nullptr},
                                          inputNames.data(),
                                          inputTensors.data(),
                                          inputTensors.size(),
                                          outputNames.data(),
                                          outputNames.size());
    auto endTime = std::chrono::steady_clock::now();

    if ((outputTensors.size() != 1) || (!outputTensors.front().IsTensor()))
    {
      throw SynthesisBackendError(chunk.index, "invalid output tensors");
    }

    auto info = outputTensors.front().GetTensorTypeAndShapeInfo();
    std::size_t sampleCount = info.GetElementCount();
    segment.samples.reserve(sampleCount);

    switch (info.GetElementType())
    {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    {
      const float* signal = outputTensors.front().GetTensorData<float>();
      segment.samples.assign(signal, signal + sampleCount);
      break;
    }
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16:
    {
      const int16_t* signal = outputTensors.front().GetTensorData<int16_t>();
      for (std::size_t i = 0; i < sampleCount; i++)
      {
        segment.samples.push_back(static_cast<float>(signal[i]) / 32768.0f);
      }
      break;
    }
    default:
      throw SynthesisBackendError(chunk.index, "unsupported output element type");
    }

    segment.durationSeconds = static_cast<double>(sampleCount) / static_cast<double>(modelConfig.sampleRate);
    spdlog::debug("Chunk {}: synthesized {} second(s) of audio in {} second(s)",
                  chunk.index,
                  segment.durationSeconds,
                  std::chrono::duration<double>(endTime - startTime).count());
  }
  catch (const Ort::Exception& e)
  {
    throw SynthesisBackendError(chunk.index, e.what());
  }

  return segment;
}

#ifndef VIETVOICE_ONNX_SYNTHESIZER_H
#define VIETVOICE_ONNX_SYNTHESIZER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <onnxruntime_cxx_api.h>

#include "ReferenceCatalog.hpp"
#include "SegmentSynthesizer.hpp"

using json = nlohmann::json;

namespace vietvoice {

struct OnnxModelConfig
{
  int sampleRate = 24000;
  int hopLength = 256;
  double maxChunkSeconds = 15.0;

  std::string vocabPath;
  std::string referencesPath;
};

struct ModelSession
{
  Ort::Session onnx;
  Ort::SessionOptions options;
  Ort::Env env;

  ModelSession() : onnx(nullptr){};
};

// Voice-cloning model: imitates a reference recording selected by voice
// parameters and speaks the chunk text after the reference transcript.
class OnnxSynthesizer : public SegmentSynthesizer
{
public:
  // modelConfigPath defaults to modelPath + ".json"
  OnnxSynthesizer(const std::string& modelPath, const std::string& modelConfigPath, std::size_t threads = 1);
  ~OnnxSynthesizer() override;

  SynthesizedSegment synthesize(const TextChunk& chunk,
                                const VoiceParameters& voice,
                                const SynthesisOptions& options) override;

  int sampleRate() const override { return modelConfig.sampleRate; }

  const ReferenceCatalog& references() const { return catalog; }

  static OnnxModelConfig parseModelConfig(const json& configRoot, const std::string& baseDir);

  // Output frame budget for a chunk, in model frames
  int64_t estimateMaxDuration(std::size_t referenceSamples,
                              const std::string& referenceText,
                              std::size_t chunkChars,
                              float speed) const;

private:
  OnnxModelConfig modelConfig;
  std::map<char32_t, int32_t> vocab;
  ReferenceCatalog catalog;
  std::map<std::string, std::vector<int16_t>> referenceAudio;
  ModelSession session;

  // Last caller-supplied reference, decoded once and shared by its chunks
  std::mutex customReferenceMutex;
  std::string customReferenceFile;
  std::shared_ptr<const std::vector<int16_t>> customReferenceAudio;

  void loadModel(const std::string& modelPath, std::size_t threads);
  void loadVocab(const std::string& vocabPath);
  void loadReferenceAudio();
  std::vector<int16_t> decodeReference(const std::string& file) const;
  std::shared_ptr<const std::vector<int16_t>> customReference(const std::string& file);
  std::vector<int32_t> textToIds(const std::string& text) const;
};

} // namespace vietvoice

#endif // VIETVOICE_ONNX_SYNTHESIZER_H

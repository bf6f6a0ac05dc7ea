#include "ApiRequests.hpp"

#include <optional>

#include "Errors.hpp"
#include "WavFile.hpp"

namespace vietvoice {

namespace {

std::optional<std::string> optionalString(const json& root, const char* key) {
  if (!root.contains(key) || root[key].is_null())
  {
    return std::nullopt;
  }
  if (!root[key].is_string())
  {
    throw InvalidParameterError(key, "must be a string");
  }
  return root[key].get<std::string>();
}

} // namespace

SynthesisRequest parseSynthesisBody(const std::string& body) {
  json root;
  try
  {
    root = json::parse(body);
  }
  catch (const json::exception& e)
  {
    throw InvalidParameterError("body", std::string("malformed JSON: ") + e.what());
  }
  return parseSynthesisRequest(root);
}

SynthesisRequest parseSynthesisRequest(const json& root) {
  if (!root.is_object())
  {
    throw InvalidParameterError("body", "must be a JSON object");
  }

  SynthesisRequest request;
  if (!root.contains("text") || !root["text"].is_string())
  {
    throw InvalidParameterError("text", "is required and must be a string");
  }
  request.text = root["text"].get<std::string>();

  if (root.contains("speed") && !root["speed"].is_null())
  {
    if (!root["speed"].is_number())
    {
      throw InvalidParameterError("speed", "must be a number");
    }
    double speed = root["speed"].get<double>();
    if (!(speed >= MIN_SPEED && speed <= MAX_SPEED))
    {
      throw InvalidParameterError("speed", "must be within [0.25, 2.0]");
    }
    request.speed = static_cast<float>(speed);
  }

  auto format = optionalString(root, "output_format");
  if (format && *format != "wav")
  {
    throw InvalidParameterError("output_format", "unsupported format '" + *format + "' (expected: wav)");
  }

  request.voice.gender = optionalString(root, "gender");
  request.voice.group = optionalString(root, "group");
  request.voice.area = optionalString(root, "area");
  request.voice.emotion = optionalString(root, "emotion");

  if (root.contains("sample_iteration") && !root["sample_iteration"].is_null())
  {
    const auto& value = root["sample_iteration"];
    if (!value.is_number_integer() || value.get<long long>() < 0)
    {
      throw InvalidParameterError("sample_iteration", "must be a non-negative integer");
    }
    request.sampleIteration = value.get<std::size_t>();
  }

  auto referenceAudio = optionalString(root, "reference_audio");
  auto referenceText = optionalString(root, "reference_text");
  request.reference = pairReference(referenceAudio.value_or(""), referenceText.value_or(""));

  return request;
}

std::string synthesizeWav(const Pipeline& pipeline, const std::string& body) {
  auto audio = pipeline.synthesize(parseSynthesisBody(body));
  return encodeWav(audio.samples, audio.sampleRate);
}

int statusFor(const std::exception& error) {
  if (dynamic_cast<const InvalidInputError*>(&error) != nullptr ||
      dynamic_cast<const InvalidParameterError*>(&error) != nullptr)
  {
    return 400;
  }
  if (dynamic_cast<const NotFoundError*>(&error) != nullptr)
  {
    return 404;
  }
  return 500;
}

json errorBody(const std::exception& error) {
  json body = {{"detail", error.what()}};
  if (auto parameterError = dynamic_cast<const InvalidParameterError*>(&error))
  {
    body["field"] = parameterError->field();
  }
  else if (auto backendError = dynamic_cast<const SynthesisBackendError*>(&error))
  {
    body["chunk_index"] = backendError->chunkIndex();
  }
  return body;
}

json jobResponse(const JobSummary& job) {
  return {
      {"job_id", job.id},
      {"download_url", std::string(API_PREFIX) + "/download/" + job.id},
      {"duration_seconds", job.durationSeconds},
      {"sample_rate", job.sampleRate},
      {"format", "wav"},
      {"file_size_bytes", job.sizeBytes},
  };
}

json healthResponse(double uptimeSeconds) {
  // Whole seconds
  return {{"status", "healthy"}, {"uptime", static_cast<long long>(uptimeSeconds)}};
}

std::string wavFileName(const std::string& jobId) { return "vietvoice_" + jobId + ".wav"; }

} // namespace vietvoice

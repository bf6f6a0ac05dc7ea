#ifndef VIETVOICE_API_REQUESTS_H
#define VIETVOICE_API_REQUESTS_H

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "Assembler.hpp"
#include "JobStore.hpp"
#include "Pipeline.hpp"

using json = nlohmann::json;

namespace vietvoice {

constexpr const char* API_PREFIX = "/api/v1";
constexpr const char* DIRECT_DOWNLOAD_NAME = "synthesis_result.wav";

// Body of the synthesize routes. Throws InvalidParameterError naming the
// offending field; text limits are enforced later by the pipeline.
SynthesisRequest parseSynthesisBody(const std::string& body);
SynthesisRequest parseSynthesisRequest(const json& root);

// Synthesizes the body and returns the encoded WAV without touching the
// job store
std::string synthesizeWav(const Pipeline& pipeline, const std::string& body);

// HTTP status for an exception escaping a handler
int statusFor(const std::exception& error);
json errorBody(const std::exception& error);

json jobResponse(const JobSummary& job);
json healthResponse(double uptimeSeconds);

std::string wavFileName(const std::string& jobId);

} // namespace vietvoice

#endif // VIETVOICE_API_REQUESTS_H

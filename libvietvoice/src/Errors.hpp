#ifndef VIETVOICE_ERRORS_H
#define VIETVOICE_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vietvoice {

class VietVoiceError : public std::runtime_error
{
public:
  explicit VietVoiceError(const std::string& message) : std::runtime_error(message) {}
};

// Caller supplied unusable text (empty, too long, nothing speakable)
class InvalidInputError : public VietVoiceError
{
public:
  explicit InvalidInputError(const std::string& message) : VietVoiceError(message) {}
};

class InvalidParameterError : public VietVoiceError
{
public:
  InvalidParameterError(const std::string& field, const std::string& message)
      : VietVoiceError(field + ": " + message), m_field(field), m_reason(message) {}

  const std::string& field() const { return m_field; }
  const std::string& reason() const { return m_reason; }

private:
  std::string m_field;
  std::string m_reason;
};

// External model failed on one chunk; the whole job is aborted
class SynthesisBackendError : public VietVoiceError
{
public:
  SynthesisBackendError(std::size_t chunkIndex, const std::string& message)
      : VietVoiceError("chunk " + std::to_string(chunkIndex) + ": " + message), m_chunkIndex(chunkIndex) {}

  std::size_t chunkIndex() const { return m_chunkIndex; }

private:
  std::size_t m_chunkIndex;
};

class FormatMismatchError : public VietVoiceError
{
public:
  explicit FormatMismatchError(const std::string& message) : VietVoiceError(message) {}
};

class NotFoundError : public VietVoiceError
{
public:
  explicit NotFoundError(const std::string& jobId)
      : VietVoiceError("job '" + jobId + "' not found or has expired"), m_jobId(jobId) {}

  const std::string& jobId() const { return m_jobId; }

private:
  std::string m_jobId;
};

} // namespace vietvoice

#endif // VIETVOICE_ERRORS_H

#include "VietVoice.hpp"

#include "ApiRequests.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <httplib.h>
#include <spdlog/spdlog.h>

using namespace vietvoice;

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json; charset=utf-8";
constexpr const char* WAV_CONTENT_TYPE = "audio/wav";

struct ServerParams
{
  std::string config;
  std::string model;
  std::string modelConfig;
  std::string host;
  int port = 0;
  bool debug = false;
  bool quiet = false;
  bool help = false;
};

httplib::Server* g_server = nullptr;

void handleSignal(int) {
  if (g_server != nullptr)
  {
    g_server->stop();
  }
}

void printUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [options]\n"
            << "\n"
            << "options:\n"
            << "  --config PATH         service config JSON (default: config.json in the data directory)\n"
            << "  --model PATH          ONNX model\n"
            << "  --model-config PATH   model JSON config (default: MODEL.json)\n"
            << "  --host HOST           listen address\n"
            << "  --port PORT           listen port\n"
            << "  --debug               print debug messages\n"
            << "  --quiet               print warnings and errors only\n"
            << "  --help                show this message\n";
}

bool parseArgs(int argc, char** argv, ServerParams& params) {
  auto needsValue = [&](int i) {
    if (i + 1 >= argc)
    {
      std::cerr << "missing value for " << argv[i] << "\n";
      return false;
    }
    return true;
  };

  for (int i = 1; i < argc; i++)
  {
    std::string arg = argv[i];
    if (arg == "--config")
    {
      if (!needsValue(i)) return false;
      params.config = argv[++i];
    }
    else if (arg == "--model")
    {
      if (!needsValue(i)) return false;
      params.model = argv[++i];
    }
    else if (arg == "--model-config")
    {
      if (!needsValue(i)) return false;
      params.modelConfig = argv[++i];
    }
    else if (arg == "--host")
    {
      if (!needsValue(i)) return false;
      params.host = argv[++i];
    }
    else if (arg == "--port")
    {
      if (!needsValue(i)) return false;
      try
      {
        params.port = std::stoi(argv[++i]);
      }
      catch (const std::logic_error&)
      {
        std::cerr << "invalid port " << argv[i] << "\n";
        return false;
      }
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
    else
    {
      std::cerr << "unknown argument " << arg << "\n";
      return false;
    }
  }
  return true;
}

ServiceConfig buildConfig(const ServerParams& params) {
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
      throw InvalidParameterError("model.path", "no model given and none found in the data directory");
    }
    config.model.model = defaultModel.string();
  }

  if (!params.host.empty())
  {
    config.server.host = params.host;
  }
  if (params.port != 0)
  {
    config.server.port = params.port;
  }

  validateServiceConfig(config);
  return config;
}

void sendError(httplib::Response& res, const std::exception& error) {
  res.status = statusFor(error);
  if (res.status >= 500)
  {
    spdlog::error("{}", error.what());
  }
  else
  {
    spdlog::debug("Rejected request: {}", error.what());
  }
  res.set_content(errorBody(error).dump(), JSON_CONTENT_TYPE);
}

void sendWav(httplib::Response& res, const std::string& wav, const std::string& disposition) {
  res.set_header("Content-Disposition", disposition);
  res.set_content(wav, WAV_CONTENT_TYPE);
}

// Periodically applies the job store's eviction policy
class SweepThread
{
public:
  SweepThread(Pipeline& pipeline, double intervalSeconds)
      : m_pipeline(pipeline),
        m_interval(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(intervalSeconds))),
        m_thread([this]() { run(); }) {}

  ~SweepThread() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
    }
    m_wake.notify_all();
    m_thread.join();
  }

private:
  void run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_wake.wait_for(lock, m_interval, [this]() { return m_stopping; }))
    {
      std::size_t evicted = m_pipeline.sweepJobs();
      if (evicted > 0)
      {
        spdlog::info("Evicted {} expired job(s), {} remaining", evicted, m_pipeline.jobs().size());
      }
    }
  }

  Pipeline& m_pipeline;
  std::chrono::milliseconds m_interval;
  std::mutex m_mutex;
  std::condition_variable m_wake;
  bool m_stopping = false;
  std::thread m_thread;
};

} // namespace

int main(int argc, char** argv) {
  ServerParams params;
  if (!parseArgs(argc, argv, params))
  {
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

  std::unique_ptr<Pipeline> pipeline;
  ServiceConfig config;
  try
  {
    config = buildConfig(params);
    if (!params.debug && !params.quiet)
    {
      spdlog::set_level(spdlog::level::from_str(config.logLevel));
    }
    auto synthesizer =
        std::make_shared<OnnxSynthesizer>(config.model.model, config.model.config, config.synthesisThreads);
    pipeline = std::make_unique<Pipeline>(synthesizer, config);
  }
  catch (const std::exception& e)
  {
    spdlog::error("Startup failed: {}", e.what());
    return 1;
  }

  auto startTime = std::chrono::steady_clock::now();
  std::string prefix = API_PREFIX;

  httplib::Server server;
  server.set_default_headers({{"Server", "vietvoice-server"}});

  server.Get(prefix + "/health", [&](const httplib::Request&, httplib::Response& res) {
    auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    res.set_content(healthResponse(uptime).dump(), JSON_CONTENT_TYPE);
  });

  server.Post(prefix + "/synthesize", [&](const httplib::Request& req, httplib::Response& res) {
    try
    {
      sendWav(res, synthesizeWav(*pipeline, req.body), "inline; filename=\"speech.wav\"");
    }
    catch (const std::exception& e)
    {
      sendError(res, e);
    }
  });

  server.Post(prefix + "/synthesize/file", [&](const httplib::Request& req, httplib::Response& res) {
    try
    {
      auto job = pipeline->registerJob(pipeline->synthesize(parseSynthesisBody(req.body)));
      spdlog::info("Stored job {} ({} bytes)", job.id, job.sizeBytes);
      res.set_content(jobResponse(job).dump(), JSON_CONTENT_TYPE);
    }
    catch (const std::exception& e)
    {
      sendError(res, e);
    }
  });

  server.Post(prefix + "/synthesize/download", [&](const httplib::Request& req, httplib::Response& res) {
    try
    {
      sendWav(res, synthesizeWav(*pipeline, req.body),
              std::string("attachment; filename=\"") + DIRECT_DOWNLOAD_NAME + "\"");
    }
    catch (const std::exception& e)
    {
      sendError(res, e);
    }
  });

  server.Get(prefix + R"(/download/([0-9a-f]+))", [&](const httplib::Request& req, httplib::Response& res) {
    std::string jobId = req.matches[1];
    try
    {
      auto wav = pipeline->fetchJobWav(jobId);
      sendWav(res, *wav, "attachment; filename=\"" + wavFileName(jobId) + "\"");
    }
    catch (const std::exception& e)
    {
      sendError(res, e);
    }
  });

  server.Delete(prefix + R"(/download/([0-9a-f]+))", [&](const httplib::Request& req, httplib::Response& res) {
    std::string jobId = req.matches[1];
    if (pipeline->evictJob(jobId))
    {
      spdlog::debug("Deleted job {}", jobId);
      res.status = 204;
    }
    else
    {
      sendError(res, NotFoundError(jobId));
    }
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.body.empty())
    {
      json body = {{"detail", httplib::status_message(res.status)}};
      res.set_content(body.dump(), JSON_CONTENT_TYPE);
    }
  });

  SweepThread sweeper(*pipeline, config.jobs.sweepIntervalSeconds);

  g_server = &server;
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);

  spdlog::info("Listening on http://{}:{}{}", config.server.host, config.server.port, prefix);
  if (!server.listen(config.server.host, config.server.port))
  {
    spdlog::error("Cannot listen on {}:{}", config.server.host, config.server.port);
    g_server = nullptr;
    return 1;
  }

  g_server = nullptr;
  spdlog::info("Server stopped");
  return 0;
}

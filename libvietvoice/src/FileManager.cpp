#include "FileManager.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

using namespace vietvoice;

std::filesystem::path FileManager::getDataSharePath() {
  auto localPath = getLocalSharePath();
  if (std::filesystem::exists(localPath))
  {
    return localPath;
  }

  auto systemPath = getSystemSpecificSharePath();
  if (!systemPath.empty() && std::filesystem::exists(systemPath))
  {
    return systemPath;
  }

  spdlog::warn("Neither local './share/' directory nor {} exists", systemPath.string());
  return std::filesystem::path();
}

std::filesystem::path FileManager::findDataFile(const std::string& name) {
  auto sharePath = getDataSharePath();
  if (sharePath.empty())
  {
    return std::filesystem::path();
  }

  auto filePath = sharePath / name;
  if (!std::filesystem::exists(filePath))
  {
    spdlog::debug("{} not found in {}", name, sharePath.string());
    return std::filesystem::path();
  }
  return filePath;
}

std::filesystem::path FileManager::getLocalSharePath() {
  return std::filesystem::path("./share/");
}

std::filesystem::path FileManager::getSystemSpecificSharePath() {
#ifdef _WIN32
  auto appData = std::getenv("APPDATA");
  if (appData != nullptr)
  {
    return std::filesystem::path(appData) / "vietvoice/share";
  }
#elif defined(__APPLE__)
  auto home = std::getenv("HOME");
  if (home != nullptr)
  {
    return std::filesystem::path(home) / "Library/Application Support/vietvoice/share";
  }
#else
  auto dataHome = std::getenv("XDG_DATA_HOME");
  if (dataHome != nullptr)
  {
    return std::filesystem::path(dataHome) / "vietvoice/share";
  }
  else
  {
    auto home = std::getenv("HOME");
    if (home != nullptr)
    {
      return std::filesystem::path(home) / ".local/share/vietvoice/share";
    }
  }
#endif
  return std::filesystem::path();
}

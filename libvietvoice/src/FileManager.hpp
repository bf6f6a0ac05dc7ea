#ifndef VIETVOICE_FILEMANAGER_H
#define VIETVOICE_FILEMANAGER_H

#include <filesystem>
#include <string>

namespace vietvoice {

// Locates the installed data directory holding the default model, its
// config, vocabulary and reference samples
class FileManager
{
public:
  FileManager() = default;

  // Empty path when no candidate exists
  static std::filesystem::path getDataSharePath();

  // name inside the data directory, or empty if it is not there
  static std::filesystem::path findDataFile(const std::string& name);

  static std::filesystem::path getLocalSharePath();
  static std::filesystem::path getSystemSpecificSharePath();
};

} // namespace vietvoice

#endif // VIETVOICE_FILEMANAGER_H

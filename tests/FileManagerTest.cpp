#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>

#include "FileManager.hpp"

using namespace vietvoice;

#if !defined(_WIN32) && !defined(__APPLE__)
TEST(FileManager, PrefersXdgDataHome) {
  ::setenv("XDG_DATA_HOME", "/tmp/vietvoice-xdg", 1);
  EXPECT_EQ(FileManager::getSystemSpecificSharePath(), std::filesystem::path("/tmp/vietvoice-xdg/vietvoice/share"));
  ::unsetenv("XDG_DATA_HOME");
}

TEST(FileManager, FallsBackToHome) {
  ::unsetenv("XDG_DATA_HOME");
  ::setenv("HOME", "/tmp/vietvoice-home", 1);
  EXPECT_EQ(FileManager::getSystemSpecificSharePath(),
            std::filesystem::path("/tmp/vietvoice-home/.local/share/vietvoice/share"));
}
#endif

TEST(FileManager, MissingDataFileIsEmpty) {
  EXPECT_TRUE(FileManager::findDataFile("no-such-file-vietvoice.onnx").empty());
}

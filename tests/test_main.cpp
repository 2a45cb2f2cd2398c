#include <gtest/gtest.h>

#include <filesystem>

#include "logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  utils::LogConfig logCfg;
  logCfg.logFilePath =
      (std::filesystem::temp_directory_path() / "parfetch_test_logs").string();
  logCfg.minLevel = utils::LogLevel::WARN;
  logCfg.logToConsole = false;
  utils::Logger::initialize(logCfg);

  return RUN_ALL_TESTS();
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to the console
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

#ifndef COLONY_APP_NAME
#define COLONY_APP_NAME "ColonySim"
#endif

namespace ColonySim {
namespace {

constexpr size_t LOG_FILES_KEPT = 5;
constexpr size_t FLUSH_EVERY_N_MESSAGES = 50;
constexpr const char *LOG_FILE_PREFIX = "colony_";

class FileLogger {
public:
  static FileLogger &Instance() {
    static FileLogger instance;
    return instance;
  }

  void write(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_fileMutex);

    if (!m_initialized) {
      initialize();
    }

    if (!m_fileStream.is_open()) {
      return; // File logging unavailable, nothing else to do
    }

    // YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &timeNow);
#else
    localtime_r(&timeNow, &timeinfo);
#endif

    m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

    if (std::strcmp(level, "CRITICAL") == 0 ||
        ++m_messageCount >= FLUSH_EVERY_N_MESSAGES) {
      m_fileStream.flush();
      m_messageCount = 0;
    }
  }

private:
  FileLogger() = default;

  ~FileLogger() {
    if (m_fileStream.is_open()) {
      m_fileStream.flush();
      m_fileStream.close();
    }
  }

  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  void initialize() {
    m_initialized = true;

    char *prefPath = SDL_GetPrefPath("ColonySim", COLONY_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    cleanOldLogs(logDir, LOG_FILES_KEPT);

    auto timeNow =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &timeNow);
#else
    localtime_r(&timeNow, &timeinfo);
#endif

    std::ostringstream filename;
    filename << LOG_FILE_PREFIX << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
             << ".log";

    m_fileStream.open(logDir / filename.str(), std::ios::out | std::ios::app);
    if (m_fileStream.is_open()) {
      m_fileStream << "=== " << COLONY_APP_NAME << " Log ===\n"
                   << "Started: "
                   << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << "\n\n";
      m_fileStream.flush();
    }
  }

  void cleanOldLogs(const std::filesystem::path &logDir, size_t keepCount) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logFiles;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(LOG_FILE_PREFIX)) {
        logFiles.push_back(entry);
      }
    }

    if (logFiles.size() <= keepCount) {
      return;
    }

    // Oldest first
    std::sort(logFiles.begin(), logFiles.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
              });

    const size_t toRemove = logFiles.size() - keepCount;
    for (size_t i = 0; i < toRemove; ++i) {
      fs::remove(logFiles[i].path(), ec);
    }
  }

  std::mutex m_fileMutex;
  std::ofstream m_fileStream;
  bool m_initialized{false};
  size_t m_messageCount{0};
};

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  FileLogger::Instance().write(level, system, message);
}

} // namespace ColonySim

#endif // ifndef DEBUG

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hive {
namespace util {

namespace {

constexpr std::array<const char*, 4> COMPONENTS = {"default", "network", "topology", "app"};

std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized{false};  // loggers exist, possibly lazily at "off"
bool g_configured{false};   // Initialize() has run since the last Shutdown()

// Must be called with g_mutex held.
void CreateLoggers(spdlog::level::level_enum level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  g_loggers.clear();
  for (const char* name : COMPONENTS) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = std::move(logger);
  }
  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->error("cannot open log file {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_configured) {
    return;
  }
  CreateLoggers(spdlog::level::from_str(log_level), log_to_file, log_file_path);
  g_configured = true;
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
  g_configured = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    CreateLoggers(spdlog::level::off, false, "");
  }
  auto it = g_loggers.find(name);
  if (it == g_loggers.end()) {
    return g_loggers["default"];
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto parsed = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

bool LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it == g_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

}  // namespace util
}  // namespace hive

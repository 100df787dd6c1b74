#include "core/loader.h"
#include "core/pipeline.h"
#include "core/report.h"
#include "util/config.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <iostream>

namespace fs = std::filesystem;

inline void init_logging(const Config& config) {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd,
                              std::chrono::floor<minutes>(SysClock::now()));
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  Config config;
  try {
    config.read_args(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  ensure_directories_exist({"logs"});
  init_logging(config);
  if (!config.config_path.empty())
    spdlog::info("[main] config {}", config.config_path);

  try {
    auto candles = read_csv(config.input);
    auto analysis = run_pipeline(candles, config);

    std::cout << buy_table(analysis);

    if (!config.out_path.empty())
      write_report(analysis, config.out_path);
  } catch (const std::exception& e) {
    spdlog::error("[main] {}", e.what());
    std::cerr << e.what() << '\n';
    return 1;
  }

  return 0;
}

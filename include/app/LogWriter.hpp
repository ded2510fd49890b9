#pragma once

#include <filesystem>
#include <fstream>
#include <thread>
#include <stop_token>
#include <chrono>
#include "store/IStore.hpp"

namespace sloguard::app {

// Appends a timestamped exposition block every `interval` to hourly chunk
// files sloguard_YYYY-MM-DD_HH.prom under `log_dir`.
class LogWriter {
public:
  LogWriter(const sloguard::store::IStore& store, std::filesystem::path log_dir,
            std::chrono::milliseconds interval = std::chrono::milliseconds(60000));
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void start();
  void stop();

  // Writes one block now. Returns false if the chunk file could not be opened.
  bool write_once();

  // Chunk for the UTC hour containing `at`.
  [[nodiscard]] std::filesystem::path chunk_path(
      std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) const;

private:
  void run(std::stop_token st);
  bool write_block(std::ofstream& file, std::chrono::system_clock::time_point now);

  const sloguard::store::IStore& store_;
  std::filesystem::path log_dir_;
  std::chrono::milliseconds interval_;
  std::jthread thread_;
};

} // namespace sloguard::app

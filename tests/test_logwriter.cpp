#include "minitest.hpp"
#include "test_support.hpp"
#include "app/LogWriter.hpp"
#include "store/MemoryStore.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include <string>
#include <unistd.h>

static std::filesystem::path test_dir(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("sloguard_logwriter_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static int count_blocks(const std::filesystem::path& dir) {
  int ts_count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    std::ifstream f(entry.path());
    std::string line;
    while (std::getline(f, line)) {
      if (line.starts_with("# sloguard_scrape_timestamp_ms ")) ++ts_count;
    }
  }
  return ts_count;
}

TEST(logwriter_creates_directory) {
  auto dir = test_dir("mkdir");
  std::filesystem::remove_all(dir);
  ASSERT_TRUE(!std::filesystem::exists(dir));

  sloguard::store::MemoryStore store;
  sloguard::app::LogWriter writer(store, dir);
  ASSERT_TRUE(std::filesystem::is_directory(dir));

  std::filesystem::remove_all(dir);
}

TEST(logwriter_chunk_naming) {
  auto dir = test_dir("name");
  sloguard::store::MemoryStore store;
  sloguard::app::LogWriter writer(store, dir);
  auto p = writer.chunk_path();
  ASSERT_TRUE(p.parent_path() == dir);
  auto name = p.filename().string();
  ASSERT_TRUE(name.starts_with("sloguard_"));
  ASSERT_EQ(p.extension().string(), std::string(".prom"));
  ASSERT_EQ(name.size(), std::string("sloguard_2024-05-01_13.prom").size());

  // 2024-05-01T13:59:59Z and 14:00:00Z fall in adjacent chunks
  std::chrono::system_clock::time_point at{std::chrono::seconds(1714571999)};
  ASSERT_EQ(writer.chunk_path(at).filename().string(), std::string("sloguard_2024-05-01_13.prom"));
  ASSERT_EQ(writer.chunk_path(at + std::chrono::seconds(1)).filename().string(),
            std::string("sloguard_2024-05-01_14.prom"));
  std::filesystem::remove_all(dir);
}

TEST(logwriter_write_once_appends_blocks) {
  auto dir = test_dir("once");
  std::filesystem::remove_all(dir);

  sloguard::store::MemoryStore store;
  store.create_service(testsupport::service("checkout"));
  sloguard::app::LogWriter writer(store, dir);
  ASSERT_TRUE(writer.write_once());
  ASSERT_TRUE(writer.write_once());
  ASSERT_EQ(count_blocks(dir), 2);

  std::ifstream f(writer.chunk_path());
  std::string all((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  ASSERT_TRUE(all.find("sloguard_services_total{state=\"active\"} 1") != std::string::npos);

  std::filesystem::remove_all(dir);
}

TEST(logwriter_background_thread) {
  auto dir = test_dir("thread");
  std::filesystem::remove_all(dir);

  sloguard::store::MemoryStore store;
  sloguard::app::LogWriter writer(store, dir, std::chrono::milliseconds(100));
  writer.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(450));
  auto t0 = std::chrono::steady_clock::now();
  writer.stop();
  // Stop interrupts the sleep instead of waiting it out
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(500));

  int file_count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().extension() == ".prom") ++file_count;
  }
  ASSERT_TRUE(file_count >= 1);
  ASSERT_TRUE(count_blocks(dir) >= 2);

  std::filesystem::remove_all(dir);
}

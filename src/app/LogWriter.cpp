#include "app/LogWriter.hpp"
#include "app/Exposition.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <charconv>
#include <cerrno>
#include <condition_variable>
#include <mutex>

namespace sloguard::app {

LogWriter::LogWriter(const sloguard::store::IStore& store, std::filesystem::path log_dir,
                     std::chrono::milliseconds interval)
    : store_(store), log_dir_(std::move(log_dir)), interval_(interval) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "sloguard: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

LogWriter::~LogWriter() { stop(); }

void LogWriter::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LogWriter::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

bool LogWriter::write_block(std::ofstream& file, std::chrono::system_clock::time_point now) {
  std::string body = exposition_to_prometheus(collect_exposition(store_));

  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count();
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);

  file.write("# sloguard_scrape_timestamp_ms ", 31);
  file.write(ts_buf, ptr - ts_buf);
  file.put('\n');
  file.write(body.data(), static_cast<std::streamsize>(body.size()));
  file.flush();
  return static_cast<bool>(file);
}

bool LogWriter::write_once() {
  auto now = std::chrono::system_clock::now();
  auto path = chunk_path(now);
  std::ofstream file(path, std::ios::app);
  if (!file) {
    std::fprintf(stderr, "sloguard: LogWriter: failed to open %s: %s\n",
                 path.c_str(), std::strerror(errno));
    return false;
  }
  return write_block(file, now);
}

void LogWriter::run(std::stop_token st) {
  std::ofstream file;
  std::filesystem::path current_path;

  std::fprintf(stderr, "sloguard: LogWriter: writing to %s/ (interval %lldms)\n",
               log_dir_.c_str(), static_cast<long long>(interval_.count()));

  std::mutex m;
  std::condition_variable_any cv;
  while (!st.stop_requested()) {
    auto now = std::chrono::system_clock::now();
    auto required_path = chunk_path(now);

    // Rotate on hour boundary
    if (required_path != current_path) {
      if (file.is_open()) {
        file.flush();
        file.close();
      }
      file.open(required_path, std::ios::app);
      if (!file) {
        std::fprintf(stderr, "sloguard: LogWriter: failed to open %s: %s\n",
                     required_path.c_str(), std::strerror(errno));
        std::unique_lock lk(m);
        cv.wait_for(lk, st, std::chrono::seconds(1), []{ return false; });
        continue;
      }
      current_path = required_path;
    }

    if (!write_block(file, now)) {
      std::fprintf(stderr, "sloguard: LogWriter: write to %s failed\n", current_path.c_str());
      file.close();
      current_path.clear();
    }

    // Interruptible sleep so stop() does not wait out a full interval
    std::unique_lock lk(m);
    cv.wait_until(lk, st, now + interval_, []{ return false; });
  }

  if (file.is_open()) {
    file.flush();
    file.close();
  }
}

std::filesystem::path LogWriter::chunk_path(std::chrono::system_clock::time_point at) const {
  auto t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  ::gmtime_r(&t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "sloguard_%04d-%02d-%02d_%02d.prom",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace sloguard::app

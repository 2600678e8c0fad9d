#include "verbose_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace sable::driver {

namespace {

// Format current time as HH:MM:SS
auto FormatTime() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time_t_now, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%H:%M:%S");
  return oss.str();
}

}  // namespace

void VerboseLogger::Write(std::string_view category, std::string_view message) {
  std::scoped_lock lock(write_mutex_);
  fmt::print(sink_, "[sable][{}][{}] {}\n", FormatTime(), category, message);
  std::fflush(sink_);
}

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) return;
  Write("phase", fmt::format("{}: begin", phase_name));
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double seconds) {
  if (!Enabled(1)) return;
  Write("phase", fmt::format("{}: done ({:.2f}s)", phase_name, seconds));
}

void VerboseLogger::Progress(
    std::string_view phase_name, double elapsed_seconds) {
  if (!Enabled(1)) return;
  Write(
      "progress",
      fmt::format("{}: still running ({:.0f}s)...", phase_name, elapsed_seconds));
}

void VerboseLogger::Log(std::string_view category, std::string_view message) {
  if (!Enabled(1)) return;
  Write(category, message);
}

PhaseTimer::PhaseTimer(
    VerboseLogger& logger, std::string phase_name, bool enable_heartbeat)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()),
      enabled_(logger.Enabled(1)),
      heartbeat_enabled_(enable_heartbeat && enabled_) {
  if (enabled_) {
    logger_.PhaseBegin(phase_name_);
  }
  if (heartbeat_enabled_) {
    heartbeat_thread_ = std::jthread(
        [this](std::stop_token st) { HeartbeatLoop(std::move(st)); });
  }
}

PhaseTimer::~PhaseTimer() {
  // Wake the heartbeat thread; the jthread destructor requests stop and
  // joins, but the condition variable needs a notify as well.
  if (heartbeat_enabled_) {
    heartbeat_thread_.request_stop();
    heartbeat_cv_.notify_all();
    heartbeat_thread_.join();
  }

  if (enabled_) {
    auto end = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
    logger_.PhaseDone(phase_name_, duration.count() / 1000.0);
  }
}

void PhaseTimer::HeartbeatLoop(std::stop_token stop_token) {
  constexpr auto kThreshold = std::chrono::seconds(10);
  constexpr auto kInterval = std::chrono::seconds(10);

  // Wait for initial threshold
  {
    std::unique_lock lock(heartbeat_mutex_);
    if (heartbeat_cv_.wait_for(lock, stop_token, kThreshold, [&] {
          return stop_token.stop_requested();
        })) {
      return;  // Stopped before threshold
    }
  }

  while (!stop_token.stop_requested()) {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    auto elapsed_secs =
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    logger_.Progress(phase_name_, static_cast<double>(elapsed_secs));

    std::unique_lock lock(heartbeat_mutex_);
    if (heartbeat_cv_.wait_for(lock, stop_token, kInterval, [&] {
          return stop_token.stop_requested();
        })) {
      return;  // Stopped during interval wait
    }
  }
}

}  // namespace sable::driver

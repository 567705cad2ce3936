#pragma once

#include "adaptive_cache/cache_system.hpp"
#include "adaptive_cache/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace adaptive_cache {

enum class CleanupEventType { ExpiredRemoval, Optimization, Background, Error };

const char *to_string(CleanupEventType type);

struct CleanupEvent {
  CleanupEventType type;
  TimePoint timestamp;
  std::string message;
};

struct CleanupResult {
  bool success{false};
  std::size_t expired_removed{0};
  Duration duration{0};
  std::vector<std::string> errors;
};

struct CleanupPerformance {
  double average_expired_per_run{0.0};
  // error events / events, over the last hour
  double error_rate{0.0};
  std::size_t events_last_hour{0};
  double efficiency{0.0};
};

struct CleanupStats {
  std::uint64_t total_expired_removed{0};
  std::uint64_t total_optimizations{0};
  std::uint64_t background_runs{0};
  std::optional<TimePoint> last_cleanup;
  std::optional<TimePoint> last_optimization;
  bool background_active{false};
  Duration interval{0};
  Duration uptime{0};
  std::size_t managed_systems{0};
  std::size_t recent_events{0};
  std::map<std::string, std::size_t> event_summary;
  CleanupPerformance performance;
};

struct CleanupReport {
  CleanupStats summary;
  std::vector<CacheSystemStats> systems;
  std::vector<CleanupEvent> recent_events;
  std::vector<std::string> recommendations;
};

inline constexpr std::size_t kMaxCleanupEvents = 100;
inline constexpr std::size_t kReportedCleanupEvents = 20;
inline constexpr std::uint64_t kOptimizeEveryRuns = 10;

// Periodic maintenance over one or more cache systems. The systems are not
// owned and must outlive the service.
class CleanupService {
public:
  CleanupService(std::vector<ICacheSystem *> systems, Duration interval,
                 NowFn now = system_now());
  ~CleanupService();

  CleanupService(const CleanupService &) = delete;
  CleanupService &operator=(const CleanupService &) = delete;

  void start_background_cleanup();
  void stop_background_cleanup();
  bool background_active() const;

  // Both rethrow after recording an error event.
  std::size_t remove_expired_entries();
  void optimize_cache();

  // One scheduled pass. Never throws.
  void perform_background_cleanup();
  CleanupResult force_cleanup(bool include_optimization = true);

  CleanupStats cleanup_stats() const;
  CleanupReport cleanup_report() const;
  std::vector<CleanupEvent> recent_events() const;
  std::optional<TimePoint> last_cleanup() const;

  // Stops the thread and drops the event log.
  void dispose();

private:
  void run();
  bool should_optimize_locked(TimePoint now) const;
  void record_event(CleanupEventType type, std::string message);
  void record_event_locked(CleanupEventType type, std::string message,
                           TimePoint now);
  void prune_events_locked(TimePoint now);
  CleanupStats stats_locked(TimePoint now) const;
  std::vector<std::string> recommendations_locked(const CleanupStats &stats,
                                                  TimePoint now) const;

  std::vector<ICacheSystem *> systems_;
  Duration interval_;
  NowFn now_;

  mutable std::mutex mu_;
  std::deque<CleanupEvent> events_;
  std::uint64_t total_expired_removed_{0};
  std::uint64_t total_optimizations_{0};
  std::uint64_t background_runs_{0};
  std::optional<TimePoint> last_cleanup_;
  std::optional<TimePoint> last_optimization_;
  std::optional<TimePoint> started_at_;

  // Serializes passes so a forced cleanup never overlaps a scheduled one.
  std::mutex pass_mu_;

  mutable std::mutex thread_mu_;
  std::condition_variable cv_;
  bool stop_{false};
  std::thread worker_;
};

std::string render_cleanup_report(const CleanupReport &report);

} // namespace adaptive_cache

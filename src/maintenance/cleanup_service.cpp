#include "adaptive_cache/cleanup_service.hpp"
#include "adaptive_cache/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace adaptive_cache {
namespace {

constexpr auto kEventRetention = std::chrono::hours(1);
constexpr auto kOptimizeAfter = std::chrono::minutes(10);
constexpr auto kLowActivityAfter = std::chrono::minutes(60);

Duration elapsed_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<Duration>(
      std::chrono::steady_clock::now() - start);
}

std::int64_t to_ms(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace

const char *to_string(CleanupEventType type) {
  switch (type) {
  case CleanupEventType::ExpiredRemoval:
    return "expired_removal";
  case CleanupEventType::Optimization:
    return "optimization";
  case CleanupEventType::Background:
    return "background";
  case CleanupEventType::Error:
    return "error";
  }
  return "unknown";
}

CleanupService::CleanupService(std::vector<ICacheSystem *> systems,
                               Duration interval, NowFn now)
    : systems_(std::move(systems)), interval_(interval), now_(std::move(now)) {
}

CleanupService::~CleanupService() { stop_background_cleanup(); }

void CleanupService::start_background_cleanup() {
  {
    std::lock_guard lock(thread_mu_);
    if (worker_.joinable())
      return;
    stop_ = false;
    worker_ = std::thread([this] { run(); });
  }
  {
    std::lock_guard lock(mu_);
    started_at_ = now_();
  }
  record_event(CleanupEventType::Background,
               "background cleanup started with " +
                   std::to_string(interval_.count()) + "ms interval");
  logger()->info("background cleanup started, interval {}ms",
                 interval_.count());
}

void CleanupService::stop_background_cleanup() {
  std::thread worker;
  {
    std::lock_guard lock(thread_mu_);
    if (!worker_.joinable())
      return;
    stop_ = true;
    worker = std::move(worker_);
  }
  cv_.notify_all();
  worker.join();
  {
    std::lock_guard lock(mu_);
    started_at_.reset();
  }
  record_event(CleanupEventType::Background, "background cleanup stopped");
  logger()->info("background cleanup stopped");
}

bool CleanupService::background_active() const {
  std::lock_guard lock(thread_mu_);
  return worker_.joinable();
}

void CleanupService::run() {
  std::unique_lock lock(thread_mu_);
  while (!stop_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_; }))
      break;
    lock.unlock();
    perform_background_cleanup();
    lock.lock();
  }
}

std::size_t CleanupService::remove_expired_entries() {
  record_event(CleanupEventType::ExpiredRemoval,
               "starting expired entries removal");
  std::size_t removed = 0;
  try {
    for (auto *system : systems_)
      removed += system->remove_expired_entries();
  } catch (const std::exception &e) {
    record_event(CleanupEventType::Error,
                 std::string("error removing expired entries: ") + e.what());
    throw;
  } catch (...) {
    record_event(CleanupEventType::Error,
                 "error removing expired entries: unknown error");
    throw;
  }

  std::lock_guard lock(mu_);
  const auto now = now_();
  total_expired_removed_ += removed;
  last_cleanup_ = now;
  record_event_locked(CleanupEventType::ExpiredRemoval,
                      "removed " + std::to_string(removed) +
                          " expired entries from " +
                          std::to_string(systems_.size()) + " caches",
                      now);
  return removed;
}

void CleanupService::optimize_cache() {
  record_event(CleanupEventType::Optimization, "starting cache optimization");
  try {
    for (auto *system : systems_)
      if (auto *opt = system->as_optimizable())
        opt->optimize();
  } catch (const std::exception &e) {
    record_event(CleanupEventType::Error,
                 std::string("error during cache optimization: ") + e.what());
    throw;
  } catch (...) {
    record_event(CleanupEventType::Error,
                 "error during cache optimization: unknown error");
    throw;
  }

  std::lock_guard lock(mu_);
  const auto now = now_();
  ++total_optimizations_;
  last_cleanup_ = now;
  last_optimization_ = now;
  record_event_locked(CleanupEventType::Optimization,
                      "cache optimization completed", now);
}

bool CleanupService::should_optimize_locked(TimePoint now) const {
  if (background_runs_ % kOptimizeEveryRuns == 0)
    return true;
  return last_optimization_.has_value() &&
         now - *last_optimization_ >= kOptimizeAfter;
}

void CleanupService::perform_background_cleanup() {
  std::lock_guard pass(pass_mu_);
  const auto start = std::chrono::steady_clock::now();
  {
    std::lock_guard lock(mu_);
    ++background_runs_;
  }
  try {
    const auto removed = remove_expired_entries();
    bool optimize;
    {
      std::lock_guard lock(mu_);
      optimize = should_optimize_locked(now_());
    }
    if (optimize)
      optimize_cache();

    std::lock_guard lock(mu_);
    const auto now = now_();
    prune_events_locked(now);
    record_event_locked(CleanupEventType::Background,
                        "background cleanup completed in " +
                            std::to_string(elapsed_since(start).count()) +
                            "ms, removed " + std::to_string(removed) +
                            " entries",
                        now);
  } catch (const std::exception &e) {
    record_event(CleanupEventType::Error,
                 std::string("background cleanup failed: ") + e.what());
    logger()->error("background cleanup failed: {}", e.what());
  } catch (...) {
    record_event(CleanupEventType::Error,
                 "background cleanup failed: unknown error");
    logger()->error("background cleanup failed: unknown error");
  }
}

CleanupResult CleanupService::force_cleanup(bool include_optimization) {
  std::lock_guard pass(pass_mu_);
  const auto start = std::chrono::steady_clock::now();
  CleanupResult result;
  try {
    result.expired_removed = remove_expired_entries();
    if (include_optimization)
      optimize_cache();
    result.success = true;
  } catch (const std::exception &e) {
    result.errors.emplace_back(e.what());
    logger()->error("forced cleanup failed: {}", e.what());
  } catch (...) {
    result.errors.emplace_back("unknown error");
    logger()->error("forced cleanup failed: unknown error");
  }
  result.duration = elapsed_since(start);
  return result;
}

void CleanupService::record_event(CleanupEventType type, std::string message) {
  std::lock_guard lock(mu_);
  record_event_locked(type, std::move(message), now_());
}

void CleanupService::record_event_locked(CleanupEventType type,
                                         std::string message, TimePoint now) {
  events_.push_back({type, now, std::move(message)});
  while (events_.size() > kMaxCleanupEvents)
    events_.pop_front();
}

void CleanupService::prune_events_locked(TimePoint now) {
  const auto cutoff = now - kEventRetention;
  events_.erase(std::remove_if(events_.begin(), events_.end(),
                               [&](const CleanupEvent &e) {
                                 return e.timestamp < cutoff;
                               }),
                events_.end());
}

CleanupStats CleanupService::stats_locked(TimePoint now) const {
  CleanupStats s;
  s.total_expired_removed = total_expired_removed_;
  s.total_optimizations = total_optimizations_;
  s.background_runs = background_runs_;
  s.last_cleanup = last_cleanup_;
  s.last_optimization = last_optimization_;
  s.background_active = started_at_.has_value();
  s.interval = interval_;
  if (started_at_)
    s.uptime = std::chrono::duration_cast<Duration>(now - *started_at_);
  s.managed_systems = systems_.size();
  s.recent_events = events_.size();

  std::size_t errors_total = 0;
  std::size_t errors_last_hour = 0;
  for (const auto &e : events_) {
    ++s.event_summary[to_string(e.type)];
    const bool recent = now - e.timestamp < kEventRetention;
    if (recent)
      ++s.performance.events_last_hour;
    if (e.type == CleanupEventType::Error) {
      ++errors_total;
      if (recent)
        ++errors_last_hour;
    }
  }

  auto &p = s.performance;
  if (background_runs_ > 0) {
    p.average_expired_per_run = static_cast<double>(total_expired_removed_) /
                                static_cast<double>(background_runs_);
    const double removal = total_expired_removed_ > 0 ? 1.0 : 0.5;
    const double penalty = static_cast<double>(errors_total) /
                           static_cast<double>(events_.size() + 1);
    p.efficiency = std::clamp(removal - penalty, 0.0, 1.0);
  }
  if (p.events_last_hour > 0)
    p.error_rate = static_cast<double>(errors_last_hour) /
                   static_cast<double>(p.events_last_hour);
  return s;
}

CleanupStats CleanupService::cleanup_stats() const {
  std::lock_guard lock(mu_);
  return stats_locked(now_());
}

std::vector<std::string>
CleanupService::recommendations_locked(const CleanupStats &stats,
                                       TimePoint now) const {
  std::vector<std::string> out;
  if (stats.performance.average_expired_per_run > 100)
    out.emplace_back("High number of expired entries detected. Consider "
                     "shortening TTL values.");
  if (stats.performance.error_rate > 0.1) {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "Error rate is high (%.1f%%). Check cache system health.",
                  stats.performance.error_rate * 100.0);
    out.emplace_back(buf);
  }
  if (stats.background_runs < kOptimizeEveryRuns && !events_.empty() &&
      now - events_.front().timestamp > kLowActivityAfter)
    out.emplace_back("Low cleanup activity. Verify background cleanup is "
                     "properly configured.");
  return out;
}

CleanupReport CleanupService::cleanup_report() const {
  CleanupReport report;
  // System stats take each system's own lock; collect them before ours.
  report.systems.reserve(systems_.size());
  for (const auto *system : systems_)
    report.systems.push_back(system->system_stats());

  std::lock_guard lock(mu_);
  const auto now = now_();
  report.summary = stats_locked(now);
  const auto n = std::min(events_.size(), kReportedCleanupEvents);
  report.recent_events.assign(events_.end() - static_cast<std::ptrdiff_t>(n),
                              events_.end());
  report.recommendations = recommendations_locked(report.summary, now);

  if (!report.systems.empty()) {
    double utilization = 0.0;
    for (const auto &s : report.systems)
      utilization += s.utilization;
    utilization /= static_cast<double>(report.systems.size());
    if (utilization > 0.9)
      report.recommendations.emplace_back(
          "High cache utilization detected. Consider increasing cache sizes.");
    else if (utilization < 0.2)
      report.recommendations.emplace_back(
          "Low cache utilization. Consider optimizing cache strategies or "
          "reducing sizes.");
  }
  if (report.recommendations.empty())
    report.recommendations.emplace_back(
        "Cache cleanup is operating optimally!");
  return report;
}

std::vector<CleanupEvent> CleanupService::recent_events() const {
  std::lock_guard lock(mu_);
  return {events_.begin(), events_.end()};
}

std::optional<TimePoint> CleanupService::last_cleanup() const {
  std::lock_guard lock(mu_);
  return last_cleanup_;
}

void CleanupService::dispose() {
  stop_background_cleanup();
  std::lock_guard lock(mu_);
  events_.clear();
}

std::string render_cleanup_report(const CleanupReport &report) {
  std::ostringstream os;
  const auto &s = report.summary;
  os << "total_expired_removed:" << s.total_expired_removed << "\n";
  os << "total_optimizations:" << s.total_optimizations << "\n";
  os << "background_runs:" << s.background_runs << "\n";
  os << "background_active:" << (s.background_active ? 1 : 0) << "\n";
  os << "cleanup_interval_ms:" << s.interval.count() << "\n";
  os << "uptime_ms:" << s.uptime.count() << "\n";
  os << "last_cleanup_ms:" << (s.last_cleanup ? to_ms(*s.last_cleanup) : 0)
     << "\n";
  os << "managed_systems:" << s.managed_systems << "\n";
  os << "recent_events:" << s.recent_events << "\n";
  for (const auto &[type, count] : s.event_summary)
    os << "events_" << type << ":" << count << "\n";
  os << "average_expired_per_run:" << s.performance.average_expired_per_run
     << "\n";
  os << "error_rate:" << s.performance.error_rate << "\n";
  os << "events_last_hour:" << s.performance.events_last_hour << "\n";
  os << "cleanup_efficiency:" << s.performance.efficiency << "\n";
  for (std::size_t i = 0; i < report.systems.size(); ++i) {
    const auto &sys = report.systems[i];
    os << "system" << i << ":" << sys.type << "," << sys.strategy
       << ",entries=" << sys.entries << ",expired=" << sys.expired_entries
       << ",utilization=" << sys.utilization << "\n";
  }
  for (const auto &e : report.recent_events)
    os << "event:" << to_ms(e.timestamp) << "," << to_string(e.type) << ","
       << e.message << "\n";
  for (const auto &r : report.recommendations)
    os << "recommendation:" << r << "\n";
  return os.str();
}

} // namespace adaptive_cache

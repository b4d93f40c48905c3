#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace pulse {
class Ticker;
}

namespace pulse::util {

struct Counter {
  std::atomic<uint64_t> v{0};
  void inc(uint64_t d=1) { v.fetch_add(d, std::memory_order_relaxed); }
  uint64_t get() const   { return v.load(std::memory_order_relaxed); }
};

struct Gauge {
  std::atomic<double> v{0.0};
  void set(double d) { v.store(d, std::memory_order_relaxed); }
  double get() const { return v.load(std::memory_order_relaxed); }
};

class MetricRegistry {
public:
  static MetricRegistry& instance();

  ~MetricRegistry();

  // References stay valid for the registry's lifetime.
  Counter& counter(const std::string& name);
  Gauge&   gauge(const std::string& name);

  // Background reporter: logs snapshotJson() at Info every periodMs.
  // Restarts when already running; periodMs == 0 only stops it.
  void startReporter(unsigned periodMs);
  void stopReporter();
  bool reporterRunning() const;

  // {"counters":{k:v,...},"gauges":{k:v,...}}
  std::string snapshotJson() const;

private:
  MetricRegistry();
  MetricRegistry(const MetricRegistry&) = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  mutable std::mutex mx_;
  std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
  std::unordered_map<std::string, std::unique_ptr<Gauge>>   gauges_;

  mutable std::mutex      reporterMx_;
  std::unique_ptr<Ticker> reporter_;
  std::thread             thr_;
};

} // namespace pulse::util

// Shorthand macros
#define PULSE_METRIC_INC(name, d) ::pulse::util::MetricRegistry::instance().counter(name).inc(d)
#define PULSE_METRIC_HIT(name)    ::pulse::util::MetricRegistry::instance().counter(name).inc(1)
#define PULSE_METRIC_SET(name, v) ::pulse::util::MetricRegistry::instance().gauge(name).set(v)

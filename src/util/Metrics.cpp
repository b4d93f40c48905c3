#include "pulse/util/Metrics.hpp"

#include "pulse/Ticker.hpp"
#include "pulse/util/Logger.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <chrono>
#include <map>

namespace pulse::util {

MetricRegistry& MetricRegistry::instance() {
  // The reporter logs from ~MetricRegistry, so logger() must be built first
  // (and therefore destroyed last).
  (void)logger();
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::MetricRegistry() = default;

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

Counter& MetricRegistry::counter(const std::string& name) {
  std::lock_guard<std::mutex> lk(mx_);
  auto& slot = counters_[name];
  if (!slot) slot = std::make_unique<Counter>();
  return *slot;
}

Gauge& MetricRegistry::gauge(const std::string& name) {
  std::lock_guard<std::mutex> lk(mx_);
  auto& slot = gauges_[name];
  if (!slot) slot = std::make_unique<Gauge>();
  return *slot;
}

void MetricRegistry::startReporter(unsigned periodMs) {
  stopReporter();
  if (periodMs == 0) return;

  std::lock_guard<std::mutex> lk(reporterMx_);
  reporter_ = std::make_unique<Ticker>(std::chrono::milliseconds(periodMs));
  Ticker* t = reporter_.get();

  // Ends on its own once stopReporter() closes the ticker.
  thr_ = std::thread([this, t]{
    for (const Tick& tick : t->output()) {
      logger().log(LogLevel::Info, "metrics",
                   { {"seq", std::to_string(tick.seq)}, {"snapshot", snapshotJson()} });
    }
  });
}

void MetricRegistry::stopReporter() {
  std::unique_ptr<Ticker> t;
  std::thread th;
  {
    std::lock_guard<std::mutex> lk(reporterMx_);
    t  = std::move(reporter_);
    th = std::move(thr_);
  }
  if (t) (void)t->close();
  if (th.joinable()) th.join();
}

bool MetricRegistry::reporterRunning() const {
  std::lock_guard<std::mutex> lk(reporterMx_);
  return reporter_ != nullptr;
}

std::string MetricRegistry::snapshotJson() const {
  // Sorted so snapshots are stable across calls.
  std::map<std::string, uint64_t> c;
  std::map<std::string, double>   g;
  {
    std::lock_guard<std::mutex> lk(mx_);
    for (auto& kv : counters_) c[kv.first] = kv.second->get();
    for (auto& kv : gauges_)   g[kv.first] = kv.second->get();
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("counters");
  w.StartObject();
  for (auto& kv : c) {
    w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
    w.Uint64(kv.second);
  }
  w.EndObject();
  w.Key("gauges");
  w.StartObject();
  for (auto& kv : g) {
    w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
    w.Double(kv.second);
  }
  w.EndObject();
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace pulse::util

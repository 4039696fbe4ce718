#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>

#include <string>

#include "macros.h"
#include "timer.h"

namespace modelhost {

// registry behind GET /metrics. metrics register themselves at static
// initialization through the macros below.
class Metrics final {
 public:
  static Metrics& Instance() {
    static Metrics metrics;
    return metrics;
  }

  Metrics(const Metrics&) = delete;
  Metrics& operator=(const Metrics&) = delete;

  // prometheus text exposition of every registered metric
  std::string GetString() const {
    return prometheus::TextSerializer().Serialize(registry_.Collect());
  }

  prometheus::Gauge& AddGauge(const std::string& name,
                              const std::string& help) {
    return prometheus::BuildGauge()
        .Name(name)
        .Help(help)
        .Register(registry_)
        .Add({});
  }

  prometheus::Counter& AddCounter(const std::string& name,
                                  const std::string& help) {
    return prometheus::BuildCounter()
        .Name(name)
        .Help(help)
        .Register(registry_)
        .Add({});
  }

 private:
  Metrics() = default;

  prometheus::Registry registry_;
};

// on destruction, adds the seconds since construction to the counter
class AutoCounter final {
 public:
  explicit AutoCounter(prometheus::Counter* counter) : counter_(counter) {}

  ~AutoCounter() { counter_->Increment(timer_.elapsed_seconds()); }

 private:
  prometheus::Counter* counter_;
  Timer timer_;
};

}  // namespace modelhost

// NOLINTBEGIN(bugprone-macro-parentheses)

#define DEFINE_GAUGE(name, help)    \
  prometheus::Gauge& GAUGE_##name = \
      modelhost::Metrics::Instance().AddGauge(#name, help);

#define GAUGE_SET(name, value) GAUGE_##name.Set(value);

#define DEFINE_COUNTER(name, help)      \
  prometheus::Counter& COUNTER_##name = \
      modelhost::Metrics::Instance().AddCounter(#name, help);

#define COUNTER_INC(name) COUNTER_##name.Increment();

// time the rest of the enclosing scope into a seconds counter
#define AUTO_COUNTER(name) \
  modelhost::AutoCounter MODELHOST_ANON_VAR(name)(&COUNTER_##name);

// NOLINTEND(bugprone-macro-parentheses)

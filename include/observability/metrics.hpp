#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <atomic>
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

namespace statement_recon {
namespace observability {

/**
 * Metrics collection for the reconciliation engine.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  size_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram on destruction
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  void reset();

 private:
  struct Counter {
    double value{0.0};
  };

  struct Gauge {
    double value{0.0};
  };

  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Counter> counters_;
  std::unordered_map<std::string, Gauge> gauges_;
  std::unordered_map<std::string, Histogram> histograms_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace statement_recon

#endif  // METRICS_HPP_

#ifndef STATEMENTS_OBSERVABILITY_METRICS_HPP_
#define STATEMENTS_OBSERVABILITY_METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace statements {
namespace observability {

/**
 * Run metrics for a statement job: counters, gauges and histograms,
 * exported in Prometheus text format.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Attach a HELP line to a metric name.
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  size_t histogramCount(const std::string& name) const;

  // Observes the lifetime of the timer, in seconds, into a histogram.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const char* fallback) const;

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace statements

#endif  // STATEMENTS_OBSERVABILITY_METRICS_HPP_

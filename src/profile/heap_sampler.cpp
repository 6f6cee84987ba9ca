#include "profile/heap_sampler.hpp"

#include "profile/heap_probe.hpp"

#include <utility>

namespace benchlab::profile {

namespace {

// Sized for several minutes at the default 100 ms cadence without growth.
constexpr std::size_t kInitialSampleCapacity = 1024;

} // namespace

HeapSizeSampler::HeapSizeSampler(SamplerOptions options, core::logging::Logger* logger)
    : HeapSizeSampler(options, &ProbeLiveHeapBytes, std::make_unique<ThreadSamplingTimer>(),
                      logger) {}

HeapSizeSampler::HeapSizeSampler(SamplerOptions options, HeapProbe probe,
                                 std::unique_ptr<ISamplingTimer> timer,
                                 core::logging::Logger* logger)
    : options_(options), probe_(std::move(probe)), timer_(std::move(timer)), logger_(logger) {}

HeapSizeSampler::~HeapSizeSampler() {
  if (timer_ != nullptr) {
    timer_->Stop();
  }
}

std::string HeapSizeSampler::Description() const {
  return "Naive heap average";
}

void HeapSizeSampler::BeforeIteration(const results::BenchmarkParams& benchmark_params,
                                      const IterationParams& iteration_params) {
  (void)benchmark_params;
  (void)iteration_params;

  // A missed AfterIteration must not leak samples into this iteration.
  if (timer_ != nullptr) {
    timer_->Stop();
  }
  samples_.clear();
  samples_.reserve(kInitialSampleCapacity);
  probe_unavailable_logged_ = false;

  if (timer_ == nullptr || !probe_) {
    if (logger_ != nullptr) {
      logger_->Warn("heap sampler is not configured; iteration runs without heap data");
    }
    return;
  }

  std::string error;
  if (!timer_->Start(options_.initial_delay, options_.period, [this] { RecordSample(); },
                     error)) {
    if (logger_ != nullptr) {
      logger_->Warn("heap sampler disabled for this iteration", {{"error", error}});
    }
    return;
  }

  if (logger_ != nullptr) {
    logger_->Debug("heap sampling started",
                   {{"initial_delay_ms", std::to_string(options_.initial_delay.count())},
                    {"period_ms", std::to_string(options_.period.count())}});
  }
}

std::vector<results::Result> HeapSizeSampler::AfterIteration(
    const results::BenchmarkParams& benchmark_params, const IterationParams& iteration_params) {
  (void)benchmark_params;
  (void)iteration_params;

  if (timer_ != nullptr) {
    timer_->Stop();
  }

  std::vector<results::Result> observations;
  observations.reserve(samples_.size() * 2U);
  for (const std::uint64_t bytes : samples_) {
    const double value = static_cast<double>(bytes);
    observations.push_back(results::MakeScalarResult(std::string(kHeapAvgLabel), value,
                                                     std::string(kHeapUnit),
                                                     results::AggregationPolicy::kAverage));
    observations.push_back(results::MakeScalarResult(std::string(kHeapMaxLabel), value,
                                                     std::string(kHeapUnit),
                                                     results::AggregationPolicy::kMax));
  }

  if (logger_ != nullptr) {
    logger_->Debug("heap sampling stopped", {{"samples", std::to_string(samples_.size())}});
  }

  samples_.clear();
  return observations;
}

bool HeapSizeSampler::sampling() const {
  return timer_ != nullptr && timer_->running();
}

void HeapSizeSampler::RecordSample() {
  const std::optional<std::uint64_t> bytes = probe_();
  if (!bytes.has_value()) {
    if (!probe_unavailable_logged_ && logger_ != nullptr) {
      logger_->Debug("live heap size is not available on this platform");
    }
    probe_unavailable_logged_ = true;
    return;
  }
  samples_.push_back(bytes.value());
}

} // namespace benchlab::profile

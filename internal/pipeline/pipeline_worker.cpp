#include "pipeline_worker.hpp"

#include "internal/observability/logging.hpp"

namespace rowcast::pipeline {

PipelineWorker::PipelineWorker(std::shared_ptr<ChangePipeline> pipeline, std::chrono::milliseconds poll_interval)
    : pipeline_(std::move(pipeline)), poll_interval_(poll_interval) {
}

PipelineWorker::~PipelineWorker() {
  Stop();
}

void PipelineWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&PipelineWorker::Run, this);
}

void PipelineWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PipelineWorker::Run() {
  ROWCAST_LOG_INFO("pipeline worker started", {observability::IntField("poll_interval_ms", poll_interval_.count())});

  for (;;) {
    RunStats stats;
    try {
      stats = pipeline_->RunOnce();
    } catch (const std::exception& e) {
      // peek itself failed (source or repository unreachable)
      ROWCAST_LOG_WARN("pipeline pass failed", {observability::StringField("error", e.what())});
      stats.failed = 1;
    }

    std::unique_lock lock(mutex_);
    if (!running_) break;
    if (stats.processed == 0 || stats.failed > 0) {
      cv_.wait_for(lock, poll_interval_, [&] { return !running_; });
      if (!running_) break;
    }
  }

  ROWCAST_LOG_INFO("pipeline worker stopped");
}

} // namespace rowcast::pipeline

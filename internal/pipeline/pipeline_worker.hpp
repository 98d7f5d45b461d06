#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/pipeline/change_pipeline.hpp"

namespace rowcast::pipeline {

/*
  Background thread driving ChangePipeline::RunOnce().

  Sleeps poll_interval when a pass found nothing or failed; Stop()
  interrupts the sleep.
*/
class PipelineWorker {
 public:
  PipelineWorker(std::shared_ptr<ChangePipeline> pipeline, std::chrono::milliseconds poll_interval);
  ~PipelineWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ChangePipeline> pipeline_;
  std::chrono::milliseconds       poll_interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace rowcast::pipeline

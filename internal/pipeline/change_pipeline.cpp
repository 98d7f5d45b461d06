#include "change_pipeline.hpp"

#include "internal/decoder/payload_decoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace rowcast::pipeline {

ChangePipeline::ChangePipeline(std::shared_ptr<stream::StreamCursor> cursor, std::shared_ptr<engine::VisibilityEngine> engine,
                               std::shared_ptr<dispatch::Dispatcher> dispatcher, std::size_t batch_size)
    : cursor_(std::move(cursor)), engine_(std::move(engine)), dispatcher_(std::move(dispatcher)), batch_size_(batch_size == 0 ? 1 : batch_size) {
}

RunStats ChangePipeline::RunOnce() {
  observability::SpanScope span("Pipeline.RunOnce");
  auto&                    metrics = observability::Metrics::Instance();

  RunStats stats;
  for (const auto& change : cursor_->Peek(batch_size_)) {
    const auto position = util::FormatLsn(change.position);

    std::optional<model::ChangeEvent> event;
    try {
      event = decoder::DecodePayload(change.payload, change.position);
    } catch (const util::DecodeError& e) {
      ROWCAST_LOG_ERROR("undecodable change; cursor held", {observability::StringField("position", position),
                                                             observability::StringField("error", e.what()),
                                                             observability::TruncatedField("payload", change.payload)});
      span.RecordException(e.what());
      metrics.RecordEvent("unknown", "decode_error");
      ++stats.failed;
      break;
    }

    const char* kind = event ? model::KindName(event->kind) : "none";
    try {
      if (event) {
        dispatcher_->Accept(engine_->Evaluate(*event));
      }
      cursor_->Advance(change.position);
    } catch (const std::exception& e) {
      ROWCAST_LOG_WARN("change not dispatched; will retry",
                       {observability::StringField("position", position), observability::StringField("kind", kind),
                        observability::StringField("error", e.what())});
      span.RecordException(e.what());
      metrics.RecordEvent(kind, "failed");
      ++stats.failed;
      break;
    }

    metrics.RecordEvent(kind, "dispatched");
    ++stats.processed;
  }

  span.SetAttribute("rowcast.processed", static_cast<std::int64_t>(stats.processed));
  span.SetAttribute("rowcast.failed", static_cast<std::int64_t>(stats.failed));
  return stats;
}

} // namespace rowcast::pipeline

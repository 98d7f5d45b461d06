#include "fanout_hub.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rowcast::dispatch {

SubscriberChannel::SubscriberChannel(std::string user_id, std::optional<std::string> entity, std::size_t capacity)
    : user_id_(std::move(user_id)), entity_(std::move(entity)), capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<Delivery> SubscriberChannel::Next(std::chrono::milliseconds wait) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, wait, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Delivery delivery = std::move(queue_.front());
  queue_.pop_front();
  return delivery;
}

void SubscriberChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SubscriberChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t SubscriberChannel::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool SubscriberChannel::Wants(const model::ChangeEvent& event) const {
  return !entity_ || *entity_ == event.EntityName();
}

bool SubscriberChannel::IsDuplicate(util::Lsn position) const {
  return position != 0 && position <= last_position_;
}

FanoutHub::FanoutHub(std::size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

std::shared_ptr<SubscriberChannel> FanoutHub::Connect(const std::string& user_id, std::optional<std::string> entity) {
  if (user_id.empty()) {
    throw util::InvalidArgument("subscriber user_id is required");
  }
  auto channel = std::make_shared<SubscriberChannel>(user_id, std::move(entity), queue_capacity_);

  std::lock_guard lock(mutex_);
  channels_.emplace(user_id, channel);
  ROWCAST_LOG_INFO("subscriber connected", {observability::StringField("user_id", user_id), observability::IntField("channels", channels_.size())});
  return channel;
}

void FanoutHub::Disconnect(const std::shared_ptr<SubscriberChannel>& channel) {
  channel->Close();

  std::lock_guard lock(mutex_);
  auto [begin, end] = channels_.equal_range(channel->UserId());
  for (auto it = begin; it != end; ++it) {
    if (it->second == channel) {
      channels_.erase(it);
      break;
    }
  }
}

void FanoutHub::Accept(const model::VisibilityResult& result) {
  const auto position = result.event.position;

  std::lock_guard lock(mutex_);

  // channels taking this event; each stays locked until the push
  std::vector<std::pair<SubscriberChannel*, std::unique_lock<std::mutex>>> targets;
  for (const auto& user_id : result.visible_subscribers) {
    auto [begin, end] = channels_.equal_range(user_id);
    for (auto it = begin; it != end; ++it) {
      auto* channel = it->second.get();
      if (!channel->Wants(result.event)) continue;

      std::unique_lock channel_lock(channel->mutex_);
      if (channel->closed_ || channel->IsDuplicate(position)) continue;
      if (channel->queue_.size() >= channel->capacity_) {
        throw util::Unavailable("subscriber " + user_id + " queue is full (" + std::to_string(channel->capacity_) + ")");
      }
      targets.emplace_back(channel, std::move(channel_lock));
    }
  }

  for (auto& [channel, channel_lock] : targets) {
    channel->queue_.push_back({position, result.event, result.is_rls_enabled});
    if (position != 0) channel->last_position_ = position;
    channel_lock.unlock();
    channel->cv_.notify_one();
  }
}

std::size_t FanoutHub::ConnectedCount() const {
  std::lock_guard lock(mutex_);
  return channels_.size();
}

void FanoutHub::CloseAll() {
  std::lock_guard lock(mutex_);
  for (auto& [_, channel] : channels_) {
    channel->Close();
  }
  channels_.clear();
}

} // namespace rowcast::dispatch

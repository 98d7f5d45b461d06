#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"

namespace rowcast::dispatch {

struct Delivery {
  util::Lsn          position = 0;
  model::ChangeEvent event;
  bool               is_rls_enabled = false;
};

/*
  One connected subscriber: a bounded FIFO of deliveries.

  Only FanoutHub pushes; the transport side pops with Next().
*/
class SubscriberChannel {
 public:
  SubscriberChannel(std::string user_id, std::optional<std::string> entity, std::size_t capacity);

  const std::string& UserId() const {
    return user_id_;
  }

  // Blocks up to wait. nullopt when nothing arrived or the channel is closed and drained.
  std::optional<Delivery> Next(std::chrono::milliseconds wait);

  void Close();
  bool IsClosed() const;

  std::size_t Pending() const;

 private:
  friend class FanoutHub;

  bool Wants(const model::ChangeEvent& event) const;

  // caller holds mutex_
  bool IsDuplicate(util::Lsn position) const;

  std::string                user_id_;
  std::optional<std::string> entity_;
  std::size_t                capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Delivery>    queue_;
  util::Lsn               last_position_ = 0;
  bool                    closed_        = false;
};

/*
  FanoutHub

  Dispatcher that routes each visible subscriber's copy of an event to
  that user's connected channels. Subscribers that are not connected
  miss the event.

  Accept is all-or-nothing: if any target channel is full the call
  throws util::Unavailable and nothing is enqueued. A channel ignores
  an event whose position is not greater than the last one it took,
  which makes redelivery after a failed cursor advance harmless.
  Position 0 (not stream-backed) is never deduplicated.
*/
class FanoutHub final : public Dispatcher {
 public:
  explicit FanoutHub(std::size_t queue_capacity = 1024);

  // entity narrows the channel to one schema.table.
  std::shared_ptr<SubscriberChannel> Connect(const std::string& user_id, std::optional<std::string> entity = std::nullopt);

  void Disconnect(const std::shared_ptr<SubscriberChannel>& channel);

  void Accept(const model::VisibilityResult& result) override;

  std::size_t ConnectedCount() const;

  // Closes every channel; used on shutdown.
  void CloseAll();

 private:
  std::size_t queue_capacity_;

  mutable std::mutex                                             mutex_;
  std::multimap<std::string, std::shared_ptr<SubscriberChannel>> channels_;
};

} // namespace rowcast::dispatch

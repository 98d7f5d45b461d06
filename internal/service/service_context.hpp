#pragma once

#include <memory>

namespace rowcast::stream { class StreamCursor; }
namespace rowcast::engine { class VisibilityEngine; }
namespace rowcast::registry { class SubscriptionRegistry; }

namespace rowcast::service {

/*
  Dependency container shared by the admin service.
*/
struct ServiceContext {
  std::shared_ptr<rowcast::stream::StreamCursor>         cursor;
  std::shared_ptr<rowcast::engine::VisibilityEngine>     engine;
  std::shared_ptr<rowcast::registry::SubscriptionRegistry> registry;
};

}

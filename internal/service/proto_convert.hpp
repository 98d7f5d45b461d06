#pragma once

#include "internal/dispatch/fanout_hub.hpp"
#include "internal/model/visibility_result.hpp"
#include "rowcast/v1/change.pb.h"

namespace rowcast::service {

/*
  Model -> wire conversions for rowcast.v1.
*/

rowcast::v1::ChangeKind      ToProto(model::ChangeKind kind);
rowcast::v1::ErrorCategory   ToProto(model::ErrorCategory category);
rowcast::v1::ChangeEvent     ToProto(const model::ChangeEvent& event);
rowcast::v1::VisibilityError ToProto(const model::VisibilityError& error);
rowcast::v1::Delivery        ToProto(const dispatch::Delivery& delivery);

} // namespace rowcast::service

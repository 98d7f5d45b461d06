#pragma once

#include "rowcast/v1/change.pb.h"

#include "rowcast/v1/admin_service.pb.h"
#include "rowcast/v1/fanout_service.pb.h"

#include "rowcast/v1/admin_service.grpc.pb.h"
#include "rowcast/v1/fanout_service.grpc.pb.h"

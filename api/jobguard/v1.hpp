#pragma once

#include "jobguard/core/v1/value.pb.h"
#include "jobguard/core/v1/checkpoint.pb.h"

#include "jobguard/admin/v1/admin.pb.h"

#include "jobguard/services/v1/job_admin_service.pb.h"
#include "jobguard/services/v1/job_admin_service.grpc.pb.h"

namespace jobguard::v1 {
using namespace ::jobguard::core::v1;
using namespace ::jobguard::admin::v1;
using namespace ::jobguard::services::v1;
}

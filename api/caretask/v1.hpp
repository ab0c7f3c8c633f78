#pragma once

#include "caretask/v1/schedule.pb.h"
#include "caretask/v1/steps.pb.h"
#include "caretask/v1/extraction.pb.h"

#include "caretask/services/v1/care_task_service.pb.h"
#include "caretask/services/v1/care_task_service.grpc.pb.h"

namespace caretask::v1 {
using namespace ::caretask::services::v1;
}

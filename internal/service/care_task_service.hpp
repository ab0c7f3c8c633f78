#pragma once

#include <google/protobuf/empty.pb.h>

#include "caretask/services/v1/care_task_service.pb.h"
#include "service_context.hpp"

namespace caretask::service {

class CareTaskService {
public:
  explicit CareTaskService(ServiceContext ctx);

  caretask::services::v1::CreateActionableStepsResponse
  CreateActionableSteps(const caretask::services::v1::CreateActionableStepsRequest& req);

  caretask::services::v1::CreateActionableStepsResponse
  CreateActionableStepsFromExtraction(const caretask::services::v1::CreateActionableStepsFromExtractionRequest& req);

  caretask::services::v1::GetActionableStepsResponse
  GetActionableSteps(const caretask::services::v1::GetActionableStepsRequest& req);

  caretask::services::v1::GetDueNotificationsResponse
  GetDueNotifications(const caretask::services::v1::GetDueNotificationsRequest& req);

  void MarkCompleted(const caretask::services::v1::MarkCompletedRequest& req);

  void CancelNoteSchedules(const caretask::services::v1::CancelNoteSchedulesRequest& req);

  caretask::services::v1::ListScheduleStatesResponse
  ListScheduleStates(const caretask::services::v1::ListScheduleStatesRequest& req);

  caretask::services::v1::HydrateDueCacheResponse HydrateDueCache();

private:
  ServiceContext ctx_;
};

}

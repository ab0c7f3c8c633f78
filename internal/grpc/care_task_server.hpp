#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "caretask/services/v1/care_task_service.grpc.pb.h"
#include "internal/service/care_task_service.hpp"

namespace caretask::grpc {

class CareTaskServer final : public caretask::services::v1::CareTaskService::Service {
public:
  explicit CareTaskServer(std::shared_ptr<caretask::service::CareTaskService> svc);

  ::grpc::Status CreateActionableSteps(::grpc::ServerContext*,
                                       const caretask::services::v1::CreateActionableStepsRequest*,
                                       caretask::services::v1::CreateActionableStepsResponse*) override;

  ::grpc::Status CreateActionableStepsFromExtraction(::grpc::ServerContext*,
                                                     const caretask::services::v1::CreateActionableStepsFromExtractionRequest*,
                                                     caretask::services::v1::CreateActionableStepsResponse*) override;

  ::grpc::Status GetActionableSteps(::grpc::ServerContext*,
                                    const caretask::services::v1::GetActionableStepsRequest*,
                                    caretask::services::v1::GetActionableStepsResponse*) override;

  ::grpc::Status GetDueNotifications(::grpc::ServerContext*,
                                     const caretask::services::v1::GetDueNotificationsRequest*,
                                     caretask::services::v1::GetDueNotificationsResponse*) override;

  ::grpc::Status MarkCompleted(::grpc::ServerContext*,
                               const caretask::services::v1::MarkCompletedRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status CancelNoteSchedules(::grpc::ServerContext*,
                                     const caretask::services::v1::CancelNoteSchedulesRequest*,
                                     google::protobuf::Empty*) override;

  ::grpc::Status ListScheduleStates(::grpc::ServerContext*,
                                    const caretask::services::v1::ListScheduleStatesRequest*,
                                    caretask::services::v1::ListScheduleStatesResponse*) override;

  ::grpc::Status HydrateDueCache(::grpc::ServerContext*,
                                 const google::protobuf::Empty*,
                                 caretask::services::v1::HydrateDueCacheResponse*) override;

private:
  std::shared_ptr<caretask::service::CareTaskService> service_;
};

}

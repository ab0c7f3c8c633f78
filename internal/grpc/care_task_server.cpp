#include "care_task_server.hpp"
#include "grpc_error.hpp"

namespace caretask::grpc {

using namespace caretask::services::v1;

CareTaskServer::CareTaskServer(std::shared_ptr<caretask::service::CareTaskService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CareTaskServer::CreateActionableSteps(::grpc::ServerContext*,
                                                     const CreateActionableStepsRequest* req,
                                                     CreateActionableStepsResponse* resp) {
  try {
    *resp = service_->CreateActionableSteps(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::CreateActionableStepsFromExtraction(::grpc::ServerContext*,
                                                                   const CreateActionableStepsFromExtractionRequest* req,
                                                                   CreateActionableStepsResponse* resp) {
  try {
    *resp = service_->CreateActionableStepsFromExtraction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::GetActionableSteps(::grpc::ServerContext*,
                                                  const GetActionableStepsRequest* req,
                                                  GetActionableStepsResponse* resp) {
  try {
    *resp = service_->GetActionableSteps(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::GetDueNotifications(::grpc::ServerContext*,
                                                   const GetDueNotificationsRequest* req,
                                                   GetDueNotificationsResponse* resp) {
  try {
    *resp = service_->GetDueNotifications(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::MarkCompleted(::grpc::ServerContext*,
                                             const MarkCompletedRequest* req,
                                             google::protobuf::Empty*) {
  try {
    service_->MarkCompleted(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::CancelNoteSchedules(::grpc::ServerContext*,
                                                   const CancelNoteSchedulesRequest* req,
                                                   google::protobuf::Empty*) {
  try {
    service_->CancelNoteSchedules(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::ListScheduleStates(::grpc::ServerContext*,
                                                  const ListScheduleStatesRequest* req,
                                                  ListScheduleStatesResponse* resp) {
  try {
    *resp = service_->ListScheduleStates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CareTaskServer::HydrateDueCache(::grpc::ServerContext*,
                                               const google::protobuf::Empty*,
                                               HydrateDueCacheResponse* resp) {
  try {
    *resp = service_->HydrateDueCache();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}

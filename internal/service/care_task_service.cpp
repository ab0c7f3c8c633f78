#include "care_task_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/core/actionable_step_processor.hpp"
#include "internal/core/extracted_payload_parser.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace caretask::service {

using namespace caretask::services::v1;

namespace {

void RequireField(const std::string& value, const char* name) {
  if (value.empty()) {
    throw caretask::util::ValidationError(std::string(name) + " is required");
  }
}

// Request identifiers copied onto the RPC span and any failure log.
struct RpcTags {
  std::string_view note_id;
  std::string_view step_id;
  std::string_view patient_id;
};

template <typename Fn>
auto ObserveRpc(std::string_view route, const RpcTags& tags, Fn&& fn) {
  caretask::observability::SpanScope span(route);
  for (const auto& [key, value] : {std::pair{"caretask.note_id", tags.note_id}, std::pair{"caretask.step_id", tags.step_id},
                                   std::pair{"caretask.patient_id", tags.patient_id}}) {
    if (!value.empty()) {
      span.SetAttribute(key, value);
    }
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    caretask::observability::Metrics::Instance().RecordRequest(route, success);
    caretask::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CARETASK_LOG_ERROR("RPC failed", {caretask::observability::StringField("route", route), caretask::observability::StringField("error", ex.what()),
                                      caretask::observability::StringField("note_id", tags.note_id),
                                      caretask::observability::StringField("step_id", tags.step_id),
                                      caretask::observability::StringField("patient_id", tags.patient_id)});
    record(false);
    throw;
  }
}

CreateActionableStepsResponse ToResponse(const std::vector<std::string>& ids) {
  CreateActionableStepsResponse resp;
  for (const auto& id : ids) {
    resp.add_step_ids(id);
  }
  return resp;
}

} // namespace

CareTaskService::CareTaskService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateActionableStepsResponse CareTaskService::CreateActionableSteps(const CreateActionableStepsRequest& req) {
  return ObserveRpc("CareTaskService.CreateActionableSteps", {.note_id = req.note_id(), .patient_id = req.patient_id()}, [&] {
    RequireField(req.note_id(), "note_id");

    std::vector<caretask::v1::ChecklistItem> checklist(req.checklist().begin(), req.checklist().end());
    std::vector<caretask::v1::PlanItem>      plan(req.plan().begin(), req.plan().end());
    return ToResponse(ctx_.processor->CreateActionableSteps(req.note_id(), req.patient_id(), checklist, plan));
  });
}

CreateActionableStepsResponse CareTaskService::CreateActionableStepsFromExtraction(const CreateActionableStepsFromExtractionRequest& req) {
  return ObserveRpc("CareTaskService.CreateActionableStepsFromExtraction", {.note_id = req.note_id(), .patient_id = req.patient_id()}, [&] {
    RequireField(req.note_id(), "note_id");
    RequireField(req.patient_id(), "patient_id");

    auto parsed = caretask::core::ParseExtractedPayload(req.extracted_json(), req.patient_id());
    return ToResponse(ctx_.processor->CreateActionableSteps(req.note_id(), req.patient_id(), parsed.checklist, parsed.plan));
  });
}

GetActionableStepsResponse CareTaskService::GetActionableSteps(const GetActionableStepsRequest& req) {
  return ObserveRpc("CareTaskService.GetActionableSteps", {.note_id = req.note_id()}, [&] {
    RequireField(req.note_id(), "note_id");

    GetActionableStepsResponse resp;
    for (auto& step : ctx_.processor->GetActionableSteps(req.note_id())) {
      *resp.add_steps() = std::move(step);
    }
    return resp;
  });
}

GetDueNotificationsResponse CareTaskService::GetDueNotifications(const GetDueNotificationsRequest& req) {
  return ObserveRpc("CareTaskService.GetDueNotifications", {.note_id = req.note_id(), .patient_id = req.patient_id()}, [&] {
    RequireField(req.note_id(), "note_id");
    RequireField(req.patient_id(), "patient_id");

    GetDueNotificationsResponse resp;
    for (auto& notification : ctx_.scheduler->GetDueNotifications(req.note_id(), req.patient_id())) {
      *resp.add_notifications() = std::move(notification);
    }
    return resp;
  });
}

void CareTaskService::MarkCompleted(const MarkCompletedRequest& req) {
  ObserveRpc("CareTaskService.MarkCompleted", {.note_id = req.note_id(), .step_id = req.step_id(), .patient_id = req.patient_id()}, [&] {
    RequireField(req.note_id(), "note_id");
    RequireField(req.step_id(), "step_id");

    ctx_.scheduler->MarkCompleted(req.note_id(), req.patient_id(), req.step_id());
  });
}

void CareTaskService::CancelNoteSchedules(const CancelNoteSchedulesRequest& req) {
  ObserveRpc("CareTaskService.CancelNoteSchedules", {.note_id = req.note_id()}, [&] {
    RequireField(req.note_id(), "note_id");

    ctx_.scheduler->CancelNoteSchedules(req.note_id());
  });
}

ListScheduleStatesResponse CareTaskService::ListScheduleStates(const ListScheduleStatesRequest& req) {
  return ObserveRpc("CareTaskService.ListScheduleStates", {.note_id = req.note_id()}, [&] {
    RequireField(req.note_id(), "note_id");

    ListScheduleStatesResponse resp;
    for (auto& state : ctx_.scheduler->ListScheduleStates(req.note_id())) {
      *resp.add_states() = std::move(state);
    }
    return resp;
  });
}

HydrateDueCacheResponse CareTaskService::HydrateDueCache() {
  return ObserveRpc("CareTaskService.HydrateDueCache", {}, [&] {
    HydrateDueCacheResponse resp;
    resp.set_entries_written(ctx_.scheduler->HydrateDueCache());
    return resp;
  });
}

} // namespace caretask::service

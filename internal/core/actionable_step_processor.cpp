#include "internal/core/actionable_step_processor.hpp"

#include <stdexcept>

#include "internal/core/record_mapping.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/core/store_ops.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/recurrence.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace caretask::core {

using namespace caretask::v1;
using observability::IntField;
using observability::StringField;

ActionableStepProcessor::ActionableStepProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<Scheduler> scheduler,
                                                 std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), scheduler_(std::move(scheduler)), clock_(std::move(clock)) {
  if (!repository_ || !scheduler_ || !clock_) {
    throw std::invalid_argument("ActionableStepProcessor requires a repository, a scheduler and a clock");
  }
}

std::vector<std::string> ActionableStepProcessor::CreateActionableSteps(const std::string& note_id, const std::string& patient_id,
                                                                        const std::vector<ChecklistItem>& checklist,
                                                                        const std::vector<PlanItem>& plan) {
  if (note_id.empty()) throw util::ValidationError("note_id is required");

  for (std::size_t i = 0; i < plan.size(); ++i) {
    if (!plan[i].has_schedule()) {
      throw util::ValidationError("plan item " + std::to_string(i) + " has no schedule");
    }
    try {
      schedule::ValidateScheduleDefinition(plan[i].schedule());
    } catch (const util::ValidationError& e) {
      throw util::ValidationError("plan item " + std::to_string(i) + ": " + e.what());
    }
    if (plan[i].patient_id().empty() && patient_id.empty()) {
      throw util::ValidationError("plan item " + std::to_string(i) + " has no patient_id");
    }
  }

  scheduler_->CancelNoteSchedules(note_id);

  std::size_t deleted = 0;
  RunInTransaction(*repository_, "replace actionable steps", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->DeleteActionableSteps(tx, note_id, deleted), "delete actionable steps");
  });

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<db::model::ActionableStepRecord> steps;
  steps.reserve(checklist.size() + plan.size());

  for (const auto& item : checklist) {
    db::model::ActionableStepRecord step;
    step.id            = util::NewId();
    step.note_id       = note_id;
    step.patient_id    = patient_id;
    step.type          = STEP_TYPE_CHECKLIST;
    step.status        = STEP_STATUS_PENDING;
    step.description   = item.description();
    step.priority      = item.priority();
    step.due_date_ms   = util::ToUnixMillis(now + kChecklistDueAfter);
    step.created_at_ms = now_ms;
    step.position      = static_cast<int32_t>(steps.size());
    steps.push_back(std::move(step));
  }

  for (const auto& item : plan) {
    const auto start = item.has_start_date() ? util::FromProto(item.start_date()) : now;

    db::model::ActionableStepRecord step;
    step.id            = util::NewId();
    step.note_id       = note_id;
    step.patient_id    = item.patient_id().empty() ? patient_id : item.patient_id();
    step.type          = STEP_TYPE_PLAN;
    step.status        = STEP_STATUS_SCHEDULED;
    step.description   = item.description();
    step.schedule_json = ScheduleToJson(item.schedule());
    step.start_date_ms = util::ToUnixMillis(start);
    step.due_date_ms   = util::ToUnixMillis(start + util::Days(item.schedule().duration()));
    step.created_at_ms = now_ms;
    step.position      = static_cast<int32_t>(steps.size());

    scheduler_->StoreScheduleState(note_id, step.id, step.patient_id, step.description, item.schedule());
    steps.push_back(std::move(step));
  }

  RunInTransaction(*repository_, "insert actionable steps", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertActionableSteps(tx, steps), "insert actionable steps");
  });

  std::vector<std::string> ids;
  ids.reserve(steps.size());
  for (const auto& step : steps) {
    ids.push_back(step.id);
  }

  CARETASK_LOG_INFO("actionable steps created", {StringField("note_id", note_id),
                    IntField("checklist", static_cast<std::int64_t>(checklist.size())),
                    IntField("plan", static_cast<std::int64_t>(plan.size())), IntField("replaced", static_cast<std::int64_t>(deleted))});
  return ids;
}

std::vector<ActionableStep> ActionableStepProcessor::GetActionableSteps(const std::string& note_id) {
  const auto records = RunInTransaction(*repository_, "get actionable steps",
                                        [&](db::Transaction& tx) { return repository_->ListActionableSteps(tx, note_id); });

  std::vector<ActionableStep> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToActionableStep(record));
  }
  return out;
}

} // namespace caretask::core

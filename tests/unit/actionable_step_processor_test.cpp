#include "internal/core/actionable_step_processor.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>

#include "internal/cache/memory_due_cache.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using caretask::core::ActionableStepProcessor;
using caretask::core::Scheduler;
using caretask::util::ManualTimeSource;
using caretask::v1::ChecklistItem;
using caretask::v1::PlanItem;
using std::chrono::hours;

struct Fixture {
  std::shared_ptr<ManualTimeSource>                       clock;
  std::shared_ptr<caretask::cache::MemoryDueCache>        cache;
  std::shared_ptr<Scheduler>                              scheduler;
  std::shared_ptr<ActionableStepProcessor>                processor;
};

caretask::util::TimePoint Now() {
  return caretask::util::ParseDate("2025-03-10") + hours(9);
}

Fixture MakeFixture() {
  Fixture f;
  f.clock         = std::make_shared<ManualTimeSource>(Now());
  auto repository = std::make_shared<caretask::db::memory::MemoryRepository>();
  f.cache         = std::make_shared<caretask::cache::MemoryDueCache>(f.clock);
  f.scheduler     = std::make_shared<Scheduler>(repository, f.cache, f.clock);
  f.processor     = std::make_shared<ActionableStepProcessor>(repository, f.scheduler, f.clock);
  return f;
}

ChecklistItem Checklist(const std::string& description, caretask::v1::Priority priority) {
  ChecklistItem item;
  item.set_description(description);
  item.set_priority(priority);
  return item;
}

PlanItem FixedTimePlan(const std::string& description) {
  PlanItem item;
  item.set_description(description);
  auto* schedule = item.mutable_schedule();
  schedule->set_type(caretask::v1::SCHEDULE_TYPE_FIXED_TIME);
  schedule->set_duration(5);
  schedule->add_specific_times("08:00");
  schedule->add_specific_times("20:00");
  return item;
}

bool ThrowsValidation(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const caretask::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestCreateAndReadBackSteps() {
  auto f = MakeFixture();

  const auto plan = FixedTimePlan("Take amoxicillin");
  const auto ids  = f.processor->CreateActionableSteps("note-1", "patient-1",
                                                       {Checklist("Buy a thermometer", caretask::v1::PRIORITY_HIGH)}, {plan});
  assert(ids.size() == 2);
  assert(ids[0] != ids[1]);

  const auto steps = f.processor->GetActionableSteps("note-1");
  assert(steps.size() == 2);

  const auto& checklist = steps[0];
  assert(checklist.id() == ids[0]);
  assert(checklist.type() == caretask::v1::STEP_TYPE_CHECKLIST);
  assert(checklist.status() == caretask::v1::STEP_STATUS_PENDING);
  assert(checklist.priority() == caretask::v1::PRIORITY_HIGH);
  assert(checklist.patient_id() == "patient-1");
  assert(checklist.description() == "Buy a thermometer");
  assert(caretask::util::FromProto(checklist.due_date()) == Now() + hours(24));
  assert(!checklist.has_schedule());

  const auto& step = steps[1];
  assert(step.id() == ids[1]);
  assert(step.type() == caretask::v1::STEP_TYPE_PLAN);
  assert(step.status() == caretask::v1::STEP_STATUS_SCHEDULED);
  assert(step.patient_id() == "patient-1");
  assert(google::protobuf::util::MessageDifferencer::Equals(step.schedule(), plan.schedule()));
  assert(caretask::util::FromProto(step.start_date()) == Now());
  assert(caretask::util::FromProto(step.due_date()) == Now() + caretask::util::Days(5));

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 1);
  assert(states[0].step_id() == ids[1]);
  assert(states[0].patient_id() == "patient-1");
  assert(states[0].total_occurrences() == 5);
  assert(google::protobuf::util::MessageDifferencer::Equals(states[0].schedule(), plan.schedule()));

  f.clock->Set(caretask::util::ParseDate("2025-03-10") + hours(20));
  const auto due = f.scheduler->GetDueNotifications("note-1", "patient-1");
  assert(due.size() == 1);
  assert(due[0].description() == "Take amoxicillin");
}

void TestPlanItemKeepsItsOwnPatientAndStart() {
  auto f = MakeFixture();

  auto plan = FixedTimePlan("Physiotherapy");
  plan.set_patient_id("patient-9");
  const auto start = caretask::util::ParseDate("2025-04-01");
  *plan.mutable_start_date() = caretask::util::ToProto(start);

  f.processor->CreateActionableSteps("note-1", "patient-1", {}, {plan});
  const auto steps = f.processor->GetActionableSteps("note-1");
  assert(steps.size() == 1);
  assert(steps[0].patient_id() == "patient-9");
  assert(caretask::util::FromProto(steps[0].start_date()) == start);
  assert(caretask::util::FromProto(steps[0].due_date()) == start + caretask::util::Days(5));
  assert(f.scheduler->ListScheduleStates("note-1")[0].patient_id() == "patient-9");
}

void TestEmptyPayloadCreatesNothing() {
  auto f = MakeFixture();
  assert(f.processor->CreateActionableSteps("note-1", "patient-1", {}, {}).empty());
  assert(f.processor->GetActionableSteps("note-1").empty());
  assert(f.scheduler->ListScheduleStates("note-1").empty());
}

void TestRecreateReplacesStepsAndSchedules() {
  auto f = MakeFixture();
  const auto first = f.processor->CreateActionableSteps("note-1", "patient-1", {Checklist("Old task", caretask::v1::PRIORITY_LOW)},
                                                        {FixedTimePlan("Old plan")});

  const auto second = f.processor->CreateActionableSteps("note-1", "patient-1", {}, {FixedTimePlan("New plan")});
  assert(second.size() == 1);

  const auto steps = f.processor->GetActionableSteps("note-1");
  assert(steps.size() == 1);
  assert(steps[0].description() == "New plan");

  std::size_t active = 0;
  for (const auto& state : f.scheduler->ListScheduleStates("note-1")) {
    if (state.is_active()) {
      ++active;
      assert(state.step_id() == second[0]);
    } else {
      assert(state.step_id() == first[1]);
    }
  }
  assert(active == 1);
}

void TestInvalidPlanLeavesStateUntouched() {
  auto f = MakeFixture();
  const auto ids = f.processor->CreateActionableSteps("note-1", "patient-1", {}, {FixedTimePlan("Take amoxicillin")});

  auto bad = FixedTimePlan("Broken");
  bad.mutable_schedule()->set_specific_times(1, "25:00");
  assert(ThrowsValidation([&] { f.processor->CreateActionableSteps("note-1", "patient-1", {}, {bad}); }));

  PlanItem no_schedule;
  no_schedule.set_description("No schedule");
  assert(ThrowsValidation([&] { f.processor->CreateActionableSteps("note-1", "patient-1", {}, {no_schedule}); }));

  assert(ThrowsValidation([&] { f.processor->CreateActionableSteps("note-1", "", {}, {FixedTimePlan("Nobody")}); }));

  const auto steps = f.processor->GetActionableSteps("note-1");
  assert(steps.size() == 1);
  assert(steps[0].id() == ids[0]);

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 1);
  assert(states[0].is_active());
}

void TestExhaustedPlanStepIsCompleted() {
  auto f = MakeFixture();

  auto plan = FixedTimePlan("Single dose");
  plan.mutable_schedule()->set_duration(1);
  const auto ids = f.processor->CreateActionableSteps("note-1", "patient-1", {Checklist("Call pharmacy", caretask::v1::PRIORITY_MEDIUM)}, {plan});

  f.scheduler->MarkCompleted("note-1", "patient-1", ids[1]);

  const auto steps = f.processor->GetActionableSteps("note-1");
  assert(steps[0].status() == caretask::v1::STEP_STATUS_PENDING);
  assert(steps[1].status() == caretask::v1::STEP_STATUS_COMPLETED);
}

} // namespace

int main() {
  TestCreateAndReadBackSteps();
  TestPlanItemKeepsItsOwnPatientAndStart();
  TestEmptyPayloadCreatesNothing();
  TestRecreateReplacesStepsAndSchedules();
  TestInvalidPlanLeavesStateUntouched();
  TestExhaustedPlanStepIsCompleted();

  std::cout << "caretask_unit_actionable_step_processor: pass\n";
  return 0;
}

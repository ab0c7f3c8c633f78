#pragma once

#include <memory>
#include <string>
#include <vector>

#include "caretask/v1/steps.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace caretask::core {

class Scheduler;

/*
  Turns a note's checklist/plan payload into persisted steps.

  Creation fully replaces the note's previous steps and schedules.
  Checklist steps precede plan steps, each group in input order.
*/
class ActionableStepProcessor {
 public:
  // Checklist deadline relative to creation.
  static constexpr std::chrono::hours kChecklistDueAfter{24};

  ActionableStepProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<Scheduler> scheduler,
                          std::shared_ptr<const util::TimeSource> clock);

  // Throws util::ValidationError before any write when a plan item carries
  // an incomplete schedule definition.
  std::vector<std::string> CreateActionableSteps(const std::string& note_id, const std::string& patient_id,
                                                 const std::vector<caretask::v1::ChecklistItem>& checklist,
                                                 const std::vector<caretask::v1::PlanItem>& plan);

  std::vector<caretask::v1::ActionableStep> GetActionableSteps(const std::string& note_id);

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<Scheduler>              scheduler_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace caretask::core

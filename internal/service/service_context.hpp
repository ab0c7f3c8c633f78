#pragma once

#include <memory>

namespace caretask::core { class Scheduler; class ActionableStepProcessor; }

namespace caretask::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<caretask::core::Scheduler> scheduler;
  std::shared_ptr<caretask::core::ActionableStepProcessor> processor;
};

}

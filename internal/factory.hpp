#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace caretask::cache { class DueCache; }
namespace caretask::core { class Scheduler; class ActionableStepProcessor; }
namespace caretask::db { class Repository; }
namespace caretask::service { class CareTaskService; }
namespace caretask::util { class TimeSource; }

namespace caretask::factory {

/*
  Application

  Owns every long-lived component of the server.

  Build() is the composition root: the only place that knows
  concrete repository and cache types.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<cache::DueCache>                cache;
  std::shared_ptr<core::Scheduler>                scheduler;
  std::shared_ptr<core::ActionableStepProcessor>  processor;
  std::shared_ptr<service::CareTaskService>       service;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

std::shared_ptr<db::Repository> BuildRepository(const caretask::runtime::config::RuntimeConfig& config);

std::shared_ptr<cache::DueCache> BuildDueCache(const caretask::runtime::config::RuntimeConfig& config,
                                               std::shared_ptr<const util::TimeSource> clock);

Application Build(const caretask::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock);

} // namespace caretask::factory

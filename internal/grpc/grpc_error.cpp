#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace caretask::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace caretask::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e) || dynamic_cast<const CacheUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace caretask::grpc

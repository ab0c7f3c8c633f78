#include "internal/core/store_ops.hpp"

namespace caretask::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + db::ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")");
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(message);
  }
  throw util::StoreUnavailable(message);
}

} // namespace caretask::core

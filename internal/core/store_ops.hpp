#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace caretask::core {

// NotFound -> util::NotFound, anything else -> util::StoreUnavailable.
void ThrowIfDbError(const db::Result& result, const std::string& context);

/*
  Runs fn(tx) inside one repository transaction and commits it.

  Domain errors (util::*) pass through untouched. Any other failure from the
  backend (connection loss, driver exceptions) is logged and re-signalled as
  util::StoreUnavailable.
*/
template <typename Fn>
auto RunInTransaction(db::Repository& repository, std::string_view operation, Fn&& fn) {
  using R = std::invoke_result_t<Fn, db::Transaction&>;
  try {
    auto tx = repository.Begin();
    if constexpr (std::is_void_v<R>) {
      fn(*tx);
      tx->Commit();
    } else {
      R result = fn(*tx);
      tx->Commit();
      return result;
    }
  } catch (const util::ValidationError&) {
    throw;
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::StoreUnavailable& e) {
    CARETASK_LOG_ERROR("schedule store failure", {observability::StringField("operation", operation),
                       observability::StringField("error", e.what())});
    throw;
  } catch (const util::CacheUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    CARETASK_LOG_ERROR("schedule store failure", {observability::StringField("operation", operation),
                       observability::StringField("error", e.what())});
    throw util::StoreUnavailable(std::string(operation) + ": " + e.what());
  }
}

} // namespace caretask::core

#include "pg_pool.hpp"

namespace caretask::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_schedule_state",
               "INSERT INTO schedule_state(note_id,step_id,patient_id,description,schedule_json,total_occurrences,"
               "completed_occurrences,last_completion_ms,is_active,created_at_ms,next_occurrence_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9,$10,$11) "
               "ON CONFLICT(note_id,step_id) DO UPDATE SET patient_id=EXCLUDED.patient_id,"
               "description=EXCLUDED.description,schedule_json=EXCLUDED.schedule_json,"
               "total_occurrences=EXCLUDED.total_occurrences,completed_occurrences=EXCLUDED.completed_occurrences,"
               "last_completion_ms=EXCLUDED.last_completion_ms,is_active=EXCLUDED.is_active,"
               "created_at_ms=EXCLUDED.created_at_ms,next_occurrence_ms=EXCLUDED.next_occurrence_ms");

  conn.prepare("complete_occurrence",
               "UPDATE schedule_state SET completed_occurrences=completed_occurrences+1,last_completion_ms=$3,"
               "next_occurrence_ms=$4 "
               "WHERE note_id=$1 AND step_id=$2 AND is_active "
               "RETURNING note_id,step_id,patient_id,description,schedule_json::text,total_occurrences,"
               "completed_occurrences,last_completion_ms,is_active,created_at_ms,next_occurrence_ms");

  conn.prepare("set_next_occurrence",
               "UPDATE schedule_state SET next_occurrence_ms=$3 WHERE note_id=$1 AND step_id=$2");

  conn.prepare("insert_actionable_step",
               "INSERT INTO actionable_step(id,note_id,patient_id,type,status,description,priority,schedule_json,"
               "start_date_ms,due_date_ms,created_at_ms,position) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace caretask::db::postgres

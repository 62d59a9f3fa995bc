#include "pg_pool.hpp"

namespace bookrec::db::postgres {

namespace {
constexpr int kConnectTimeoutSeconds = 5;
} // namespace

std::string BuildConninfo(const std::string& connection_uri, unsigned statement_timeout_ms) {
  const bool  is_uri  = connection_uri.rfind("postgres://", 0) == 0 || connection_uri.rfind("postgresql://", 0) == 0;
  std::string options = "-c statement_timeout=" + std::to_string(statement_timeout_ms);

  if (is_uri) {
    std::string encoded = options;
    for (std::size_t pos = 0; (pos = encoded.find(' ', pos)) != std::string::npos;) {
      encoded.replace(pos, 1, "%20");
    }
    const char sep = connection_uri.find('?') == std::string::npos ? '?' : '&';
    return connection_uri + sep + "connect_timeout=" + std::to_string(kConnectTimeoutSeconds) + "&options=" + encoded;
  }
  return connection_uri + " connect_timeout=" + std::to_string(kConnectTimeoutSeconds) + " options='" + options + "'";
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
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

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("fetch_candidates",
               "SELECT id::text, camera_id::text, COALESCE(user_id::text, ''), COALESCE(date::text, ''), "
               "start_time::text, end_time::text, status "
               "FROM bookings "
               "WHERE camera_id::text = ANY($1::text[]) "
               "AND ($2 = '' OR user_id::text = $2) "
               "AND status IN ('scheduled', 'confirmed') "
               "AND (date IS NULL OR date BETWEEN $3::date AND $4::date) "
               "ORDER BY id");

  conn.prepare("fetch_in_progress",
               "SELECT id::text, camera_id::text, COALESCE(user_id::text, ''), COALESCE(date::text, ''), "
               "start_time::text, end_time::text, status "
               "FROM bookings "
               "WHERE camera_id::text = ANY($1::text[]) "
               "AND ($2 = '' OR user_id::text = $2) "
               "AND status = 'recording' "
               "ORDER BY id");

  conn.prepare("fetch_statuses", "SELECT id::text, status FROM bookings WHERE id::text = ANY($1::text[])");

  conn.prepare("update_status",
               "UPDATE bookings SET status = $2, status_reason = NULLIF($3, '') "
               "WHERE id::text = $1 AND status = ANY($4::text[])");

  conn.prepare("booking_status", "SELECT status FROM bookings WHERE id::text = $1");

  conn.prepare("record_artifact",
               "INSERT INTO recordings(booking_id, camera_id, user_id, local_path, remote_url, size_bytes, started_at, uploaded_at) "
               "VALUES($1, $2, $3, $4, $5, $6, NULLIF($7, '')::timestamptz, now()) "
               "ON CONFLICT (booking_id) DO UPDATE SET remote_url = EXCLUDED.remote_url, size_bytes = EXCLUDED.size_bytes, "
               "uploaded_at = EXCLUDED.uploaded_at");

  conn.prepare("upsert_status",
               "INSERT INTO system_status(camera_id, node_id, user_id, is_recording, state, active_booking_id, consecutive_failures, "
               "pending_uploads, failed_uploads, storage_used_bytes, last_error, snapshot, last_heartbeat) "
               "VALUES($1, $2, $3, $4, $5, NULLIF($6, ''), $7, $8, $9, $10, NULLIF($11, ''), $12::jsonb, now()) "
               "ON CONFLICT (camera_id) DO UPDATE SET node_id = EXCLUDED.node_id, user_id = EXCLUDED.user_id, "
               "is_recording = EXCLUDED.is_recording, state = EXCLUDED.state, active_booking_id = EXCLUDED.active_booking_id, "
               "consecutive_failures = EXCLUDED.consecutive_failures, pending_uploads = EXCLUDED.pending_uploads, "
               "failed_uploads = EXCLUDED.failed_uploads, storage_used_bytes = EXCLUDED.storage_used_bytes, "
               "last_error = EXCLUDED.last_error, snapshot = EXCLUDED.snapshot, last_heartbeat = EXCLUDED.last_heartbeat");
}

void PgPool::Bootstrap() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  // bookings belongs to the booking application. The one column added here is
  // nullable and written only by update_status, so the application can ignore it.
  tx.exec("ALTER TABLE bookings ADD COLUMN IF NOT EXISTS status_reason TEXT;");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS recordings (booking_id TEXT PRIMARY KEY, camera_id TEXT NOT NULL, user_id TEXT, local_path TEXT NOT NULL, "
      "remote_url TEXT NOT NULL, size_bytes BIGINT NOT NULL DEFAULT 0, started_at TIMESTAMPTZ, uploaded_at TIMESTAMPTZ NOT NULL DEFAULT now());");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS recordings_booking_id_key ON recordings(booking_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS system_status (camera_id TEXT PRIMARY KEY, node_id TEXT NOT NULL, user_id TEXT, is_recording BOOLEAN NOT NULL, "
      "state TEXT NOT NULL, active_booking_id TEXT, consecutive_failures INTEGER NOT NULL DEFAULT 0, pending_uploads INTEGER NOT NULL DEFAULT 0, "
      "failed_uploads INTEGER NOT NULL DEFAULT 0, storage_used_bytes BIGINT NOT NULL DEFAULT 0, last_error TEXT, snapshot JSONB, "
      "last_heartbeat TIMESTAMPTZ NOT NULL DEFAULT now());");

  tx.exec("SELECT id, camera_id, user_id, date, start_time, end_time, status, status_reason FROM bookings LIMIT 1;");
  tx.commit();
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
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace bookrec::db::postgres

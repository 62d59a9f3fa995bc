#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace bookrec::db::postgres {

/*
  PgPool

  Connection pool shared by the booking source and the status sink.

  Design notes:
  -------------
  - libpqxx connections are NOT thread-safe; each caller holds its own
    connection for the duration of one statement or transaction.
  - Prepared statements are installed per connection.
  - Broken connections are dropped on release instead of pooled.

  Lifetime:
    Components own shared_ptr<PgPool>
    Callers acquire shared_ptr<pqxx::connection>
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4);

  // Acquire a ready-to-use connection. Throws pqxx::broken_connection.
  std::shared_ptr<pqxx::connection> Acquire();

  // Creates the tables the recorder owns and the booking columns it writes.
  void Bootstrap();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

// Adds connect_timeout and statement_timeout to a libpq URI or key=value string.
std::string BuildConninfo(const std::string& connection_uri, unsigned statement_timeout_ms);

} // namespace bookrec::db::postgres

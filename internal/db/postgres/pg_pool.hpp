#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace rowcast::db::postgres {

/*
  PgPool

  Bounded connection pool shared by PgRepository, PgAdmissionEvaluator
  and PgSlotSource.

  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe; do not share.
  - Prepared statements are installed per connection.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    Owners hold shared_ptr<PgPool>
    Callers hold shared_ptr<pqxx::connection>; dropping it returns the
    connection to the pool
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  // prepare_statements installs the repository statements on every new
  // connection; the realtime tables must exist before the first Acquire().
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16, bool prepare_statements = true);

  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& ConnInfo() const {
    return conninfo_;
  }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;
  bool        prepare_statements_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace rowcast::db::postgres

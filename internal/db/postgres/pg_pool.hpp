#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace geocache::db::postgres {

/*
  Bounded pool of geocode_cache connections.

  One connection per PgTx; pqxx connections are not shared between
  threads. Every connection gets the record and run statements
  prepared when it is opened. Acquire() blocks while max_connections
  are checked out, and a connection that comes back closed is dropped
  so the next Acquire() opens a fresh one.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // The returned handle goes back to the pool when the last copy is released.
  std::shared_ptr<pqxx::connection> Acquire();

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

} // namespace geocache::db::postgres

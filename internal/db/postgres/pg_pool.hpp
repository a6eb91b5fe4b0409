#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace livetv::db::postgres {

class PgPool;

// Checked-out connection; returns to the pool on destruction. A connection
// that is no longer open is dropped instead, freeing its slot.
class PgLease {
 public:
  PgLease(std::shared_ptr<PgPool> pool, std::unique_ptr<pqxx::connection> conn);
  ~PgLease();

  PgLease(PgLease&&) noexcept            = default;
  PgLease& operator=(PgLease&&)      = delete;

  pqxx::connection& operator*() const {
    return *conn_;
  }

 private:
  std::shared_ptr<PgPool>           pool_;
  std::unique_ptr<pqxx::connection> conn_;
};

/*
  Bounded pool of libpqxx connections. A pqxx::connection is not
  thread-safe, so each transaction leases one for its lifetime. The
  broker's statements are prepared once per connection when it opens.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 16, std::chrono::milliseconds acquire_timeout = std::chrono::seconds(10));

  // Blocks while every connection is leased; throws std::runtime_error
  // after acquire_timeout.
  PgLease Acquire();

 private:
  friend class PgLease;

  std::unique_ptr<pqxx::connection> Open();
  void                              Return(std::unique_ptr<pqxx::connection> conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_connections_ = 0;
};

} // namespace livetv::db::postgres

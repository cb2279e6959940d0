#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include "core/config.hpp"

#include <memory>
#include <mongocxx/database.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <optional>
#include <string>

/**
 * Connection pool for the CrowdSense database. Clients are leased per
 * operation with get_client(); database() resolves the configured database
 * on a leased client. The driver instance is created once per process.
 */
class MongoManager {
public:
  // Throws PersistenceError if the URI cannot be parsed.
  explicit MongoManager(const Config::PersistenceConfig &config);

  mongocxx::pool::entry get_client();
  mongocxx::database database(mongocxx::pool::entry &client) const;
  const std::string &database_name() const { return database_; }

  // Round trip to the server in milliseconds, or nullopt if unreachable.
  std::optional<double> ping();

private:
  static mongocxx::instance &driver_instance();

  std::string database_;
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP

#include "mongo_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <chrono>
#include <exception>
#include <mongocxx/uri.hpp>

mongocxx::instance &MongoManager::driver_instance() {
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const Config::PersistenceConfig &config)
    : database_(config.database) {
  driver_instance();
  if (database_.empty())
    throw PersistenceError("persistence database name is empty");

  try {
    pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri(config.uri));
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Invalid MongoDB URI for database '" << database_ << "': " << e.what());
    throw PersistenceError(std::string("MongoDB pool init failed: ") +
                           e.what());
  }
  LOG(LogLevel::INFO, LogComponent::IO_DATABASE,
      "MongoDB pool ready for database '" << database_ << "'");
}

mongocxx::pool::entry MongoManager::get_client() {
  try {
    return pool_->acquire();
  } catch (const std::exception &e) {
    throw PersistenceError(std::string("MongoDB client unavailable: ") +
                           e.what());
  }
}

mongocxx::database MongoManager::database(mongocxx::pool::entry &client) const {
  return (*client)[database_];
}

std::optional<double> MongoManager::ping() {
  using bsoncxx::builder::basic::kvp;
  using bsoncxx::builder::basic::make_document;

  const auto started = std::chrono::steady_clock::now();
  try {
    auto client = pool_->acquire();
    database(client).run_command(make_document(kvp("ping", 1)));
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "MongoDB ping failed: " << e.what());
    return std::nullopt;
  }
  const double elapsed_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - started)
                                .count();
  LOG(LogLevel::DEBUG, LogComponent::IO_DATABASE,
      "MongoDB ping " << elapsed_ms << " ms");
  return elapsed_ms;
}

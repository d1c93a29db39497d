#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/bus/bus_client.hpp"
#include "internal/bus/memory_broker.hpp"
#include "internal/cache/match_cache.hpp"
#include "internal/cache/memory_kv_cache.hpp"
#include "internal/core/delivery_lifecycle.hpp"
#include "internal/core/dispatch_engine.hpp"
#include "internal/core/response_relay.hpp"
#include "internal/core/rider_discovery.hpp"
#include "internal/core/settlement.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"
#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DISPATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if DISPATCH_BUS_ZMQ
#include "internal/bus/zmq_broker.hpp"
#endif
#if DISPATCH_CACHE_REDIS
#include "internal/cache/redis_kv_cache.hpp"
#endif

namespace dispatch::factory {

using namespace dispatch;

namespace {

constexpr std::uint64_t kDefaultMatchTtlSeconds     = 3600;
constexpr std::uint64_t kDefaultClaimTtlSeconds     = 3600;
constexpr double        kDefaultAdminChargePercent  = 10.0;
constexpr std::size_t   kDefaultPostgresConnections = 16;
constexpr std::uint32_t kDefaultBusPollMs           = 100;
constexpr std::uint32_t kDefaultRedisPort           = 6379;
constexpr std::uint32_t kDefaultRedisTimeoutMs      = 1000;

std::shared_ptr<db::Repository> BuildRepository(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DISPATCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto repo      = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repo->EnsureSchema();
    return repo;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DISPATCH_DB_POSTGRES
    const auto max_connections =
        database.postgres().max_connections() > 0 ? database.postgres().max_connections() : kDefaultPostgresConnections;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    auto repo = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repo->EnsureSchema();
    return repo;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

template <typename T>
T OrDefault(T value, T fallback) {
  return value > 0 ? value : fallback;
}

std::shared_ptr<cache::KeyValueCache> BuildCache(const dispatch::runtime::config::CacheConfig& config) {
  if (config.has_redis()) {
#if DISPATCH_CACHE_REDIS
    const auto&         redis = config.redis();
    cache::RedisOptions options;
    if (!redis.host().empty()) options.host = redis.host();
    options.port     = static_cast<int>(OrDefault(redis.port(), kDefaultRedisPort));
    options.password = redis.password();
    options.database = static_cast<int>(redis.database());
    options.timeout  = std::chrono::milliseconds(OrDefault(redis.timeout_ms(), kDefaultRedisTimeoutMs));
    if (!redis.key_prefix().empty()) options.key_prefix = redis.key_prefix();
    return std::make_shared<cache::RedisKeyValueCache>(std::move(options));
#else
    throw std::runtime_error("redis cache requested but not enabled at build time");
#endif
  }

  return std::make_shared<cache::MemoryKeyValueCache>();
}

std::shared_ptr<bus::Broker> BuildBroker(const dispatch::runtime::config::BusConfig& config, [[maybe_unused]] Application& app) {
  if (config.has_zmq()) {
#if DISPATCH_BUS_ZMQ
    const auto& zmq = config.zmq();
    if (!zmq.proxy_frontend_bind().empty() && !zmq.proxy_backend_bind().empty()) {
      app.forwarder = std::make_shared<bus::ZmqProxy>(zmq.proxy_frontend_bind(), zmq.proxy_backend_bind());
      app.forwarder->Start();
    }
    if (zmq.publish_endpoint().empty() || zmq.subscribe_endpoint().empty()) {
      throw std::runtime_error("bus.zmq needs publish_endpoint and subscribe_endpoint");
    }
    return std::make_shared<bus::ZmqBroker>(bus::ZmqEndpoints{zmq.publish_endpoint(), zmq.subscribe_endpoint()},
                                            config.consumer_queue_capacity(),
                                            std::chrono::milliseconds(OrDefault(zmq.poll_interval_ms(), kDefaultBusPollMs)));
#else
    throw std::runtime_error("zmq bus requested but not enabled at build time");
#endif
  }

  return std::make_shared<bus::MemoryBroker>(config.consumer_queue_capacity());
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto repository  = BuildRepository(config);
  auto connections = std::make_shared<registry::ConnectionRegistry>();

  auto kv      = BuildCache(config.cache());
  auto matches = std::make_shared<cache::MatchCache>(
      kv, std::chrono::seconds(OrDefault<std::uint64_t>(config.cache().match_ttl_seconds(), kDefaultMatchTtlSeconds)),
      std::chrono::seconds(OrDefault<std::uint64_t>(config.cache().claim_ttl_seconds(), kDefaultClaimTtlSeconds)));

  auto broker = BuildBroker(config.bus(), app);
  auto bus    = std::make_shared<bus::BusClient>(broker);
  bus->Connect();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::PricingTable pricing(config.pricing());

  const auto expiration = config.bus().request_expiration_ms() > 0 ? std::chrono::milliseconds(config.bus().request_expiration_ms())
                                                                   : core::kDefaultRequestExpiration;

  auto settlement = std::make_shared<core::Settlement>(
      repository, OrDefault(config.settlement().admin_charge_percent(), kDefaultAdminChargePercent));
  auto discovery  = std::make_shared<core::RiderDiscovery>(repository, matches, pricing, config.discovery());
  auto dispatcher = std::make_shared<core::DispatchEngine>(bus, matches, connections, expiration);
  auto relay      = std::make_shared<core::ResponseRelay>(repository, bus, matches, connections);
  auto lifecycle  = std::make_shared<core::DeliveryLifecycle>(repository, matches, connections, settlement);

  dispatcher->Start();
  relay->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = repository;
  ctx.connections = connections;
  ctx.matches     = matches;
  ctx.bus         = bus;
  ctx.discovery   = discovery;
  ctx.dispatcher  = dispatcher;
  ctx.relay       = relay;
  ctx.lifecycle   = lifecycle;
  ctx.pricing     = pricing;

  auto dispatch_service = std::make_shared<service::DispatchService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DispatchServer>(dispatch_service, ctx));
  app.bus = bus;

  DISPATCH_LOG_INFO("Application built", {observability::StringField("node_id", config.server().node_id()),
                                          observability::DoubleField("admin_charge_percent", settlement->AdminChargePercent())});

  return app;
}

} // namespace dispatch::factory

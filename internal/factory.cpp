#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/visibility_engine.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/fanout_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/change_pipeline.hpp"
#include "internal/registry/security_catalog.hpp"
#include "internal/registry/subscription_registry.hpp"
#include "internal/security/policy_admission_evaluator.hpp"
#include "internal/security/rls_visibility_evaluator.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stream/file_change_source.hpp"
#include "internal/stream/stream_cursor.hpp"
#if ROWCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROWCAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/security/pg_admission_evaluator.hpp"
#include "internal/stream/pg_slot_source.hpp"
#endif

namespace rowcast::factory {

using namespace rowcast;
namespace cfg = rowcast::runtime::config;

namespace {

security::DeleteVisibility ToDeleteVisibility(cfg::DeleteVisibility value) {
  switch (value) {
    case cfg::DELETE_VISIBILITY_ADMIT_ALL:
      return security::DeleteVisibility::kAdmitAll;
    case cfg::DELETE_VISIBILITY_EXCLUDE_ALL:
      return security::DeleteVisibility::kExcludeAll;
    default:
      return security::DeleteVisibility::kEvaluateIdentity;
  }
}

filter::DeleteFilterMode ToDeleteFilterMode(cfg::DeleteFilterMode value) {
  switch (value) {
    case cfg::DELETE_FILTER_IGNORE:
      return filter::DeleteFilterMode::kIgnore;
    case cfg::DELETE_FILTER_EXCLUDE:
      return filter::DeleteFilterMode::kExclude;
    default:
      return filter::DeleteFilterMode::kEvaluateIdentity;
  }
}

// Host database the security adapter and slot source talk to; empty when none.
std::string HostConnInfo(const cfg::RuntimeConfig& config) {
  if (config.source().has_postgres_slot() && !config.source().postgres_slot().connection_uri().empty()) {
    return config.source().postgres_slot().connection_uri();
  }
  if (config.database().has_postgres()) {
    return config.database().postgres().connection_uri();
  }
  return {};
}

std::shared_ptr<stream::ChangeSource> BuildSource(const cfg::RuntimeConfig& config) {
  const auto& source = config.source();
  if (source.has_file()) {
    if (source.file().path().empty()) {
      throw std::runtime_error("source.file.path is required");
    }
    return std::make_shared<stream::FileChangeSource>(source.file().path());
  }

  if (source.has_postgres_slot()) {
#if ROWCAST_DB_POSTGRES
    const auto conninfo = HostConnInfo(config);
    if (conninfo.empty()) {
      throw std::runtime_error("source.postgres_slot.connection_uri is required");
    }

    stream::PgSlotOptions options;
    options.slot_name   = source.postgres_slot().slot_name();
    options.publication = source.postgres_slot().publication();
    options.create_slot = source.postgres_slot().create_slot();

    auto slot = std::make_shared<stream::PgSlotSource>(std::make_shared<db::postgres::PgPool>(conninfo, 2, false), options);
    slot->EnsureSlot();
    return slot;
#else
    throw std::runtime_error("postgres slot source requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no change source configured");
}

std::shared_ptr<security::AdmissionEvaluator> BuildAdmission(const cfg::RuntimeConfig& config) {
  const auto& engine = config.engine();

#if ROWCAST_DB_POSTGRES
  const auto conninfo = HostConnInfo(config);
  if (!conninfo.empty() && engine.owner_policies_size() == 0) {
    ROWCAST_LOG_INFO("row security delegated to host database", {observability::StringField("role", engine.consuming_role())});
    auto pool = std::make_shared<db::postgres::PgPool>(conninfo, config.database().postgres().pool_size() > 0 ? config.database().postgres().pool_size() : 16, false);
    return std::make_shared<security::PgAdmissionEvaluator>(std::move(pool), engine.consuming_role(), engine.claims_setting());
  }
#endif

  auto evaluator = std::make_shared<security::PolicyAdmissionEvaluator>(engine.admission_shard_size());
  for (const auto& policy : engine.owner_policies()) {
    evaluator->AddPolicy(policy.entity(), security::PolicyAdmissionEvaluator::OwnerColumnPolicy(policy.column()));
    ROWCAST_LOG_INFO("owner policy registered",
                     {observability::StringField("entity", policy.entity()), observability::StringField("column", policy.column())});
  }
  return evaluator;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const cfg::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROWCAST_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->Bootstrap();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROWCAST_DB_POSTGRES
    db::postgres::PgRepository::BootstrapSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const cfg::RuntimeConfig& config) {
  Application app;
  const auto& engine_config = config.engine();

  // ------------------------------------------------------------------
  // Registry + cursor
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto catalog       = std::make_shared<registry::SecurityCatalog>(app.repository, engine_config.consuming_role());
  auto subscriptions = std::make_shared<registry::SubscriptionRegistry>(app.repository);
  auto cursor        = std::make_shared<stream::StreamCursor>(BuildSource(config), app.repository);

  // ------------------------------------------------------------------
  // Visibility engine
  // ------------------------------------------------------------------
  security::VisibilityOptions visibility;
  visibility.delete_visibility = ToDeleteVisibility(engine_config.delete_visibility());
  visibility.admission_timeout = std::chrono::milliseconds(engine_config.admission_timeout_ms());
  auto rls                     = std::make_shared<security::RlsVisibilityEvaluator>(BuildAdmission(config), visibility);

  filter::FilterOptions filter_options;
  filter_options.delete_filters = ToDeleteFilterMode(engine_config.delete_filters());

  auto visibility_engine = std::make_shared<engine::VisibilityEngine>(catalog, subscriptions, rls, filter::FilterEvaluator(filter_options));

  // ------------------------------------------------------------------
  // Fan-out + pipeline
  // ------------------------------------------------------------------
  app.hub = std::make_shared<dispatch::FanoutHub>(config.fanout().queue_capacity());

  auto change_pipeline = std::make_shared<pipeline::ChangePipeline>(cursor, visibility_engine, app.hub, engine_config.batch_size());
  app.worker           = std::make_shared<pipeline::PipelineWorker>(change_pipeline, std::chrono::milliseconds(engine_config.poll_interval_ms()));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.cursor   = cursor;
  ctx.engine   = visibility_engine;
  ctx.registry = subscriptions;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
  app.grpc_services.push_back(std::make_unique<grpc::FanoutServer>(app.hub, std::chrono::milliseconds(engine_config.poll_interval_ms())));

  ROWCAST_LOG_INFO("application built", {observability::StringField("source", cursor->SourceName()),
                                         observability::IntField("batch_size", engine_config.batch_size())});
  return app;
}

} // namespace rowcast::factory

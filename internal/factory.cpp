#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/geo/nominatim_geocoder.hpp"
#include "internal/index/index_cycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_engine.hpp"
#include "internal/scheduler/cache_scheduler.hpp"

namespace framecache::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<geo::Geocoder> BuildGeocoder(const framecache::runtime::config::GeocodeConfig& config, std::shared_ptr<geo::Geocoder> injected) {
  if (!config.enabled()) return nullptr;
  if (injected) return injected;

  geo::NominatimOptions options;
  options.endpoint   = config.endpoint();
  options.user_agent = config.user_agent();
  options.language   = config.language();
  options.timeout_ms = config.timeout_ms();
  return std::make_shared<geo::NominatimGeocoder>(std::move(options));
}

} // namespace

std::shared_ptr<core::ImageCache> Build(const framecache::runtime::config::RuntimeConfig& config, Capabilities capabilities) {
  if (!capabilities.extractor) {
    throw std::invalid_argument("metadata extractor is required");
  }

  const auto& sqlite = config.database().sqlite();

  // ------------------------------------------------------------------
  // Writer side
  // ------------------------------------------------------------------
  auto writer_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.busy_timeout_ms());
  const int schema_version = writer_db->EnsureSchema();
  auto writer = std::make_shared<db::sqlite::SqliteRepository>(std::move(writer_db));

  auto cycle = std::make_unique<index::IndexCycle>(writer, std::move(capabilities.extractor), config.library().picture_dir(),
                                                   config.scheduler().fast_first_scan());
  auto cache_scheduler = std::make_shared<scheduler::CacheScheduler>(std::move(cycle), std::chrono::milliseconds(config.scheduler().cycle_interval_ms()));

  // ------------------------------------------------------------------
  // Reader side
  // ------------------------------------------------------------------
  auto reader_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.busy_timeout_ms());
  auto reader    = std::make_shared<db::sqlite::SqliteRepository>(std::move(reader_db));

  auto geocoder     = BuildGeocoder(config.geocode(), std::move(capabilities.geocoder));
  auto query_engine = std::make_shared<query::QueryEngine>(reader, geocoder, config.library().portrait_pairs());

  FRAMECACHE_LOG_INFO("image cache ready", {StringField("picture_dir", config.library().picture_dir()), StringField("db", sqlite.path()),
                                            IntField("schema_version", schema_version), BoolField("geocode", geocoder != nullptr),
                                            BoolField("portrait_pairs", config.library().portrait_pairs())});

  return std::make_shared<core::ImageCache>(std::move(cache_scheduler), std::move(query_engine));
}

} // namespace framecache::factory

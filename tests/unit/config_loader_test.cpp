#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "framecache_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Throws(const std::filesystem::path& yaml_path) {
  try {
    (void)framecache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(library:
  picture_dir: /home/pi/Pictures
  portrait_pairs: true
database:
  sqlite:
    path: /home/pi/.local/framecache.db3
    busy_timeout_ms: 2500
scheduler:
  cycle_interval_ms: 10000
  fast_first_scan: false
  autostart: false
geocode:
  enabled: true
  endpoint: http://localhost:8080/reverse
  user_agent: test-agent
  language: de
  timeout_ms: 1500
logging:
  level: debug
)");

  auto config = framecache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.library().picture_dir() == "/home/pi/Pictures");
  assert(config.library().portrait_pairs());
  assert(config.database().sqlite().path() == "/home/pi/.local/framecache.db3");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.scheduler().cycle_interval_ms() == 10000);
  assert(!config.scheduler().fast_first_scan());
  assert(!config.scheduler().autostart());
  assert(config.geocode().enabled());
  assert(config.geocode().endpoint() == "http://localhost:8080/reverse");
  assert(config.geocode().language() == "de");
  assert(config.geocode().timeout_ms() == 1500);
  assert(config.logging().level() == "debug");
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(library:
  picture_dir: /pictures
database:
  sqlite:
    path: /tmp/framecache.db3
)");

  auto config = framecache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.library().portrait_pairs());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.scheduler().cycle_interval_ms() == 2000);
  assert(config.scheduler().fast_first_scan());
  assert(config.scheduler().autostart());
  assert(!config.geocode().enabled());
  assert(config.geocode().endpoint() == "https://nominatim.openstreetmap.org/reverse");
  assert(config.geocode().user_agent() == "framecache");
  assert(config.geocode().timeout_ms() == 5000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(library:
  picture_dir: "2024"
database:
  sqlite:
    path: "C:\\frames\\\"quoted\"\\db.sqlite"
)");

  auto config = framecache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.library().picture_dir() == "2024");
  assert(config.database().sqlite().path() == "C:\\frames\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(library:
  picture_dir: "line1\nline2☃"
database:
  sqlite:
    path: "/tmp/data"
)");

  auto config = framecache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.library().picture_dir() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(library:
  picture_dir: /pictures
unknown_field: 123
database:
  sqlite:
    path: "/tmp/data"
)");

  assert(Throws(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingPathsAreRejected() {
  const auto no_pictures = WriteYaml("missing_picture_dir",
                                     R"(database:
  sqlite:
    path: "/tmp/data"
)");
  assert(Throws(no_pictures));

  const auto no_db = WriteYaml("missing_db_path",
                               R"(library:
  picture_dir: /pictures
)");
  assert(Throws(no_db));
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsAreApplied();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingPathsAreRejected();

  std::cout << "framecache_unit_config_loader: pass\n";
  return 0;
}

#include "internal/control/command_table.hpp"

#include <google/protobuf/struct.pb.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>

#include "internal/factory.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using framecache::control::CommandTable;
using framecache::testing::FakeExtractor;
using framecache::testing::FakeGeocoder;
using framecache::testing::TempDir;
using framecache::testing::WriteFile;
using google::protobuf::Struct;
using google::protobuf::Value;

// handlers are bound to the table they were registered on
static_assert(!std::is_copy_constructible_v<CommandTable>);
static_assert(!std::is_copy_assignable_v<CommandTable>);
static_assert(!std::is_move_constructible_v<CommandTable>);

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name), pictures(dir.Path() / "pictures"), extractor(std::make_shared<FakeExtractor>()) {
    fs::create_directories(pictures);

    framecache::extract::ExtractedMetadata gps;
    gps.width     = 3000;
    gps.height    = 4000;
    gps.latitude  = 48.85837;
    gps.longitude = 2.294481;
    gps.make      = "Canon";
    extractor->Set("tower.jpg", gps);
    extractor->Landscape("street.jpg", "2020:05:05 12:00:00");

    WriteFile(pictures / "tower.jpg");
    WriteFile(pictures / "street.jpg");

    auto config = framecache::testing::MakeConfig(pictures, dir.Path() / "index.db3");
    cache       = framecache::factory::Build(config, {extractor, std::make_shared<FakeGeocoder>("Tour Eiffel, Paris")});
    table       = std::make_unique<CommandTable>(cache);
  }

  Struct Call(const std::string& name, const Struct& args = Struct()) {
    return table->Dispatch(name, args);
  }

  TempDir                                       dir;
  fs::path                                      pictures;
  std::shared_ptr<FakeExtractor>                extractor;
  std::shared_ptr<framecache::core::ImageCache> cache;
  std::unique_ptr<CommandTable>                 table;
};

Struct Args(std::initializer_list<std::pair<std::string, Value>> fields) {
  Struct args;
  for (const auto& [key, value] : fields) (*args.mutable_fields())[key] = value;
  return args;
}

Value Text(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value Number(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value Flag(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

bool Ok(const Struct& reply) {
  return reply.fields().at("ok").bool_value();
}

std::string ErrorCode(const Struct& reply) {
  return reply.fields().at("error").struct_value().fields().at("code").string_value();
}

const Value& Result(const Struct& reply) {
  return reply.fields().at("result");
}

void TestRegisteredNames() {
  Fixture f("table_names");
  const auto names = f.table->Names();
  for (const auto* expected : {"get_file_info", "pause_looping", "portrait_pairs", "query", "status", "stop", "update_cache"}) {
    assert(f.table->Has(expected));
  }
  assert(names.size() == 7);
  assert(!f.table->Has("__init__"));
}

void TestUpdateQueryAndFileInfo() {
  Fixture f("table_flow");

  auto reply = f.Call("update_cache");
  assert(Ok(reply));
  assert(Result(reply).struct_value().fields().at("modified_files").number_value() == 2);

  reply = f.Call("query", Args({{"where", Text("make = 'Canon'")}, {"sort", Text("capture_time DESC")}}));
  assert(Ok(reply));
  const auto& slots = Result(reply).list_value();
  assert(slots.values_size() == 1);
  assert(slots.values(0).list_value().values_size() == 1);
  const double id = slots.values(0).list_value().values(0).number_value();

  reply = f.Call("get_file_info", Args({{"file_id", Number(id)}}));
  assert(Ok(reply));
  const auto& info = Result(reply).struct_value().fields();
  assert(info.at("fname").string_value() == (f.pictures / "tower.jpg").string());
  assert(info.at("is_portrait").bool_value());
  assert(info.at("location").string_value() == "Tour Eiffel, Paris");
  const auto& meta = info.at("meta").struct_value().fields();
  assert(meta.at("latitude").number_value() == 48.8584);
  assert(meta.at("longitude").number_value() == 2.2945);
  assert(meta.at("make").string_value() == "Canon");
  assert(meta.at("lens").kind_case() == Value::kNullValue);
}

void TestPortraitPairsGetterAndSetter() {
  Fixture f("table_pairs");

  auto reply = f.Call("portrait_pairs");
  assert(Ok(reply) && !Result(reply).bool_value());

  reply = f.Call("portrait_pairs", Args({{"value", Flag(true)}}));
  assert(Ok(reply) && Result(reply).bool_value());
  assert(f.cache->PortraitPairs());

  reply = f.Call("portrait_pairs", Args({{"value", Text("yes")}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");
  assert(f.cache->PortraitPairs());
}

void TestPauseAndStop() {
  Fixture f("table_pause");

  auto reply = f.Call("pause_looping", Args({{"value", Flag(true)}}));
  assert(Ok(reply));

  reply = f.Call("status");
  assert(Ok(reply));
  assert(Result(reply).struct_value().fields().at("state").string_value() == "paused");

  reply = f.Call("pause_looping");
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");

  assert(Ok(f.Call("stop")));
  reply = f.Call("status");
  assert(Result(reply).struct_value().fields().at("state").string_value() == "stopped");

  reply = f.Call("update_cache");
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_state");
}

void TestRejections() {
  Fixture f("table_rejections");
  assert(Ok(f.Call("update_cache")));

  auto reply = f.Call("drop_everything");
  assert(!Ok(reply) && ErrorCode(reply) == "not_found");

  reply = f.Call("status", Args({{"verbose", Flag(true)}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");

  reply = f.Call("get_file_info", Args({{"file_id", Text("1")}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");

  reply = f.Call("get_file_info", Args({{"file_id", Number(1.5)}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");

  reply = f.Call("get_file_info", Args({{"file_id", Number(999999)}}));
  assert(!Ok(reply) && ErrorCode(reply) == "not_found");

  reply = f.Call("query", Args({{"where", Text("1; DROP TABLE file")}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");

  reply = f.Call("query", Args({{"where", Number(3)}}));
  assert(!Ok(reply) && ErrorCode(reply) == "invalid_argument");
}

} // namespace

int main() {
  TestRegisteredNames();
  TestUpdateQueryAndFileInfo();
  TestPortraitPairsGetterAndSetter();
  TestPauseAndStop();
  TestRejections();

  std::cout << "framecache_integration_command_table: pass\n";
  return 0;
}

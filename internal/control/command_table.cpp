#include "internal/control/command_table.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#include "internal/control/command_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecache::control {

using google::protobuf::Struct;
using google::protobuf::Value;
using observability::StringField;

namespace {

// ------------------------------------------------------------------
// Value builders
// ------------------------------------------------------------------

Value Null() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value Number(double number) {
  Value v;
  v.set_number_value(number);
  return v;
}

Value Bool(bool flag) {
  Value v;
  v.set_bool_value(flag);
  return v;
}

Value Text(const std::string& text) {
  Value v;
  v.set_string_value(text);
  return v;
}

template <typename T>
Value Optional(const std::optional<T>& value) {
  if (!value) return Null();
  if constexpr (std::is_same_v<T, std::string>) {
    return Text(*value);
  } else {
    return Number(static_cast<double>(*value));
  }
}

Value FromStruct(Struct s) {
  Value v;
  *v.mutable_struct_value() = std::move(s);
  return v;
}

Value FromReport(const index::CycleReport& report) {
  Struct s;
  auto&  f                  = *s.mutable_fields();
  f["modified_folders"]     = Number(static_cast<double>(report.modified_folders));
  f["modified_files"]       = Number(static_cast<double>(report.modified_files));
  f["meta_written"]         = Number(static_cast<double>(report.meta_written));
  f["meta_failed"]          = Number(static_cast<double>(report.meta_failed));
  f["purged_folders"]       = Number(static_cast<double>(report.purged_folders));
  f["purged_files"]         = Number(static_cast<double>(report.purged_files));
  f["elapsed_ms"]           = Number(static_cast<double>(report.elapsed.count()));
  return FromStruct(std::move(s));
}

Value FromImage(const db::model::ImageRecord& image) {
  Struct s;
  auto&  f         = *s.mutable_fields();
  f["file_id"]       = Number(static_cast<double>(image.file_id));
  f["folder_id"]     = Number(static_cast<double>(image.folder_id));
  f["fname"]         = Text(image.fname);
  f["last_modified"] = Number(image.last_modified);
  f["is_portrait"]   = Bool(image.is_portrait);
  f["location"]      = Optional(image.location);

  if (!image.meta) {
    f["meta"] = Null();
    return FromStruct(std::move(s));
  }

  const auto& meta = *image.meta;
  Struct      m;
  auto&       mf     = *m.mutable_fields();
  mf["orientation"]   = Number(meta.orientation);
  mf["capture_time"]  = Number(meta.capture_time);
  mf["f_number"]      = Number(meta.f_number);
  mf["iso"]           = Number(meta.iso);
  mf["width"]         = Number(meta.width);
  mf["height"]        = Number(meta.height);
  mf["exposure_time"] = Optional(meta.exposure_time);
  mf["focal_length"]  = Optional(meta.focal_length);
  mf["make"]          = Optional(meta.make);
  mf["model"]         = Optional(meta.model);
  mf["lens"]          = Optional(meta.lens);
  mf["rating"]        = Optional(meta.rating);
  mf["latitude"]      = Optional(meta.latitude);
  mf["longitude"]     = Optional(meta.longitude);
  f["meta"]           = FromStruct(std::move(m));

  return FromStruct(std::move(s));
}

Value FromSlots(const std::vector<query::Slot>& slots) {
  Value out;
  auto* list = out.mutable_list_value();
  for (const auto& slot : slots) {
    auto* entry = list->add_values()->mutable_list_value();
    for (const auto id : slot) {
      entry->add_values()->set_number_value(static_cast<double>(id));
    }
  }
  return out;
}

Value FromStatus(const core::CacheStatus& status) {
  Struct s;
  auto&  f            = *s.mutable_fields();
  f["state"]          = Text(scheduler::ToString(status.state));
  f["looping"]        = Bool(status.looping);
  f["cycles"]         = Number(static_cast<double>(status.cycles));
  f["last_cycle"]     = status.last_cycle ? FromReport(*status.last_cycle) : Null();
  f["portrait_pairs"] = Bool(status.portrait_pairs);
  f["images"]         = Number(static_cast<double>(status.images));
  return FromStruct(std::move(s));
}

// ------------------------------------------------------------------
// Argument readers
// ------------------------------------------------------------------

const Value* Find(const Struct& args, const std::string& key) {
  auto it = args.fields().find(key);
  return it == args.fields().end() ? nullptr : &it->second;
}

bool RequireBool(const Struct& args, const std::string& key) {
  const auto* v = Find(args, key);
  if (!v) throw util::InvalidArgument("missing argument '" + key + "'");
  if (v->kind_case() != Value::kBoolValue) throw util::InvalidArgument("argument '" + key + "' must be a boolean");
  return v->bool_value();
}

int64_t RequireId(const Struct& args, const std::string& key) {
  const auto* v = Find(args, key);
  if (!v) throw util::InvalidArgument("missing argument '" + key + "'");
  if (v->kind_case() != Value::kNumberValue) throw util::InvalidArgument("argument '" + key + "' must be a number");

  const double number = v->number_value();
  if (!std::isfinite(number) || std::trunc(number) != number || number < 0 ||
      number > static_cast<double>(std::numeric_limits<int64_t>::max())) {
    throw util::InvalidArgument("argument '" + key + "' must be a non-negative integer");
  }
  return static_cast<int64_t>(number);
}

std::string OptionalText(const Struct& args, const std::string& key) {
  const auto* v = Find(args, key);
  if (!v || v->kind_case() == Value::kNullValue) return {};
  if (v->kind_case() != Value::kStringValue) throw util::InvalidArgument("argument '" + key + "' must be a string");
  return v->string_value();
}

Struct ErrorReply(const char* code, const std::string& message) {
  Struct error;
  (*error.mutable_fields())["code"]    = Text(code);
  (*error.mutable_fields())["message"] = Text(message);

  Struct reply;
  (*reply.mutable_fields())["ok"]    = Bool(false);
  (*reply.mutable_fields())["error"] = FromStruct(std::move(error));
  return reply;
}

} // namespace

CommandTable::CommandTable(std::shared_ptr<core::ImageCache> cache) : cache_(std::move(cache)) {
  Register("update_cache", {}, [this](const Struct&) { return FromReport(cache_->UpdateCache()); });

  Register("query", {"where", "sort"}, [this](const Struct& args) {
    return FromSlots(cache_->Query(OptionalText(args, "where"), OptionalText(args, "sort")));
  });

  Register("get_file_info", {"file_id"}, [this](const Struct& args) { return FromImage(cache_->GetFileInfo(RequireId(args, "file_id"))); });

  Register("pause_looping", {"value"}, [this](const Struct& args) {
    cache_->PauseLooping(RequireBool(args, "value"));
    return Null();
  });

  // getter without arguments, setter with "value"
  Register("portrait_pairs", {"value"}, [this](const Struct& args) {
    if (Find(args, "value")) cache_->SetPortraitPairs(RequireBool(args, "value"));
    return Bool(cache_->PortraitPairs());
  });

  Register("stop", {}, [this](const Struct&) {
    cache_->Stop();
    return Null();
  });

  Register("status", {}, [this](const Struct&) { return FromStatus(cache_->Status()); });
}

void CommandTable::Register(std::string name, std::set<std::string> accepted_args, Handler handler) {
  entries_.emplace(std::move(name), Entry{std::move(accepted_args), std::move(handler)});
}

bool CommandTable::Has(const std::string& name) const {
  return entries_.count(name) != 0;
}

std::vector<std::string> CommandTable::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) names.push_back(name);
  return names;
}

Struct CommandTable::Dispatch(const std::string& name, const Struct& args) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    FRAMECACHE_LOG_WARN("unknown command", {StringField("command", name)});
    return ErrorReply("not_found", "unknown command '" + name + "'");
  }

  for (const auto& [key, value] : args.fields()) {
    if (!it->second.accepted_args.count(key)) {
      return ErrorReply("invalid_argument", "command '" + name + "' takes no argument '" + key + "'");
    }
  }

  try {
    Struct reply;
    (*reply.mutable_fields())["ok"]     = Bool(true);
    (*reply.mutable_fields())["result"] = it->second.handler(args);
    return reply;
  } catch (const std::exception& e) {
    const char* code = ToErrorCode(e);
    FRAMECACHE_LOG_WARN("command failed", {StringField("command", name), StringField("code", code), StringField("error", e.what())});
    return ErrorReply(code, e.what());
  }
}

} // namespace framecache::control

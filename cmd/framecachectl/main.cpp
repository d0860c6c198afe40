#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/control/command_table.hpp"
#include "internal/extract/exiv2_extractor.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using google::protobuf::Struct;
using google::protobuf::Value;

static void Usage() {
  std::cout << "Usage:\n"
            << "  framecachectl <config.yaml> update_cache\n"
            << "  framecachectl <config.yaml> query [where=<expr>] [sort=<expr>]\n"
            << "  framecachectl <config.yaml> get_file_info file_id=<id>\n"
            << "  framecachectl <config.yaml> portrait_pairs [value=true|false]\n"
            << "  framecachectl <config.yaml> status\n";
}

// "true"/"false" become booleans, plain integers numbers, anything else a string.
static Value ParseArgValue(const std::string& text) {
  Value v;
  if (text == "true" || text == "false") {
    v.set_bool_value(text == "true");
    return v;
  }

  char*     end    = nullptr;
  long long number = std::strtoll(text.c_str(), &end, 10);
  if (!text.empty() && end != nullptr && *end == '\0') {
    v.set_number_value(static_cast<double>(number));
    return v;
  }

  v.set_string_value(text);
  return v;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  Struct args;
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid argument '" << arg << "', expected key=value\n";
      return 1;
    }
    (*args.mutable_fields())[arg.substr(0, eq)] = ParseArgValue(arg.substr(eq + 1));
  }

  try {
    auto config = framecache::config::ConfigLoader::LoadFromYaml(config_path);
    framecache::observability::InitializeLogging(config);

    // the scheduler is never started: update_cache runs on this thread
    auto cache = framecache::factory::Build(config, {std::make_shared<framecache::extract::Exiv2Extractor>(), nullptr});
    framecache::control::CommandTable table(cache);

    if (!table.Has(command)) {
      std::cerr << "unknown command '" << command << "'\n";
      Usage();
      return 1;
    }

    const auto reply = table.Dispatch(command, args);

    std::string                               json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    if (auto status = google::protobuf::util::MessageToJsonString(reply, &json, options); !status.ok()) {
      std::cerr << "failed to render reply: " << status.ToString() << "\n";
      return 2;
    }
    std::cout << json;

    cache->Stop();
    framecache::observability::ShutdownLogging();

    return reply.fields().at("ok").bool_value() ? 0 : 3;
  } catch (const std::exception& e) {
    std::cerr << "framecachectl: " << e.what() << "\n";
    framecache::observability::ShutdownLogging();
    return 2;
  }
}

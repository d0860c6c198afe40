#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/core/image_cache.hpp"

namespace framecache::control {

/*
  Fixed mapping from command name to a typed handler on ImageCache.

  Arguments and replies are google::protobuf::Struct so a protocol
  shim can move them to and from JSON unchanged. Replies are

      {"ok": true,  "result": <value>}
      {"ok": false, "error": {"code": "...", "message": "..."}}

  Unknown commands, unknown argument keys and mistyped arguments are
  rejected with code "invalid_argument" / "not_found"; nothing is
  looked up by reflection.
*/
class CommandTable {
 public:
  using Handler = std::function<google::protobuf::Value(const google::protobuf::Struct& args)>;

  explicit CommandTable(std::shared_ptr<core::ImageCache> cache);

  // handlers capture this
  CommandTable(const CommandTable&)            = delete;
  CommandTable& operator=(const CommandTable&) = delete;

  google::protobuf::Struct Dispatch(const std::string& name, const google::protobuf::Struct& args) const;

  bool Has(const std::string& name) const;

  std::vector<std::string> Names() const;

 private:
  struct Entry {
    std::set<std::string> accepted_args;
    Handler               handler;
  };

  void Register(std::string name, std::set<std::string> accepted_args, Handler handler);

  std::shared_ptr<core::ImageCache> cache_;
  std::map<std::string, Entry>      entries_;
};

} // namespace framecache::control

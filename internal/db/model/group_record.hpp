#pragma once

#include <cstdint>
#include <string>

namespace batch::db::model {

struct GroupRecord {
  std::string id;
  std::string name;
  std::string description;
  std::string metadata_json = "{}";

  bool sequential        = false;
  bool cancel_on_failure = false;
  bool skip_on_failure   = false;
  bool canceled          = false;

  std::string member_ids_json = "[]";

  int  state    = 1;
  bool finished = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace batch::db::model

#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/task/task_context.hpp"

namespace batch::task {

// Throws to signal failure; the returned value becomes the job result.
using TaskFunction = std::function<google::protobuf::Value(const google::protobuf::Struct& args, TaskContext& ctx)>;

/*
  Name -> callable table.

  Constructed once at startup and handed to the engine. Lookups happen on
  every dispatch from worker threads, registration is rare.
*/
class TaskRegistry {
 public:
  void Register(const std::string& name, TaskFunction fn, bool overwrite = false);

  TaskFunction Resolve(const std::string& name) const;
  bool         Contains(const std::string& name) const;

  // sorted
  std::vector<std::string> Names() const;

 private:
  mutable std::shared_mutex                      mutex_;
  std::unordered_map<std::string, TaskFunction> tasks_;
};

// noop, echo, sleep, fail
void RegisterBuiltinTasks(TaskRegistry& registry);

} // namespace batch::task

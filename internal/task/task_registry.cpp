#include "internal/task/task_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"

namespace batch::task {

void TaskRegistry::Register(const std::string& name, TaskFunction fn, bool overwrite) {
  if (name.empty()) {
    throw std::invalid_argument("task name must not be empty");
  }
  if (!fn) {
    throw std::invalid_argument("task function must not be empty: " + name);
  }

  std::unique_lock lock(mutex_);
  if (!overwrite && tasks_.contains(name)) {
    throw util::DuplicateTaskError(name);
  }
  tasks_[name] = std::move(fn);
}

TaskFunction TaskRegistry::Resolve(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = tasks_.find(name);
  if (it == tasks_.end()) {
    throw util::UnknownTaskError(name);
  }
  return it->second;
}

bool TaskRegistry::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return tasks_.contains(name);
}

std::vector<std::string> TaskRegistry::Names() const {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names.reserve(tasks_.size());
    for (const auto& [name, _] : tasks_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace batch::task

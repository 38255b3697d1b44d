#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/task/task_context.hpp"
#include "internal/task/task_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using batch::task::TaskContext;
using batch::task::TaskRegistry;

google::protobuf::Value Constant(double value) {
  google::protobuf::Value out;
  out.set_number_value(value);
  return out;
}

TaskContext MakeContext(batch::task::AttemptHandlePtr handle = nullptr) {
  if (!handle) {
    handle         = std::make_shared<batch::task::AttemptHandle>();
    handle->job_id = "job-1";
    handle->attempt = 1;
  }
  return TaskContext(handle);
}

void TestRegisterAndResolve() {
  TaskRegistry registry;
  registry.Register("one", [](const google::protobuf::Struct&, TaskContext&) { return Constant(1); });

  assert(registry.Contains("one"));
  assert(!registry.Contains("two"));

  auto ctx = MakeContext();
  auto fn  = registry.Resolve("one");
  assert(fn({}, ctx).number_value() == 1);
}

void TestDuplicateRegistrationIsRejectedUnlessOverwriting() {
  TaskRegistry registry;
  registry.Register("task", [](const google::protobuf::Struct&, TaskContext&) { return Constant(1); });

  bool threw = false;
  try {
    registry.Register("task", [](const google::protobuf::Struct&, TaskContext&) { return Constant(2); });
  } catch (const batch::util::DuplicateTaskError&) {
    threw = true;
  }
  assert(threw);

  registry.Register("task", [](const google::protobuf::Struct&, TaskContext&) { return Constant(2); }, true);
  auto ctx = MakeContext();
  assert(registry.Resolve("task")({}, ctx).number_value() == 2);
}

void TestUnknownTaskAndInvalidRegistrations() {
  TaskRegistry registry;

  bool threw = false;
  try {
    registry.Resolve("missing");
  } catch (const batch::util::UnknownTaskError& e) {
    threw = std::string(e.what()).find("missing") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register("", [](const google::protobuf::Struct&, TaskContext&) { return Constant(0); });
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register("empty", batch::task::TaskFunction{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestBuiltinTasks() {
  TaskRegistry registry;
  batch::task::RegisterBuiltinTasks(registry);

  const auto names = registry.Names();
  assert((names == std::vector<std::string>{"echo", "fail", "noop", "sleep"}));

  auto ctx = MakeContext();

  google::protobuf::Struct args;
  (*args.mutable_fields())["greeting"].set_string_value("hello");
  const auto echoed = registry.Resolve("echo")(args, ctx);
  assert(echoed.struct_value().fields().at("greeting").string_value() == "hello");

  assert(registry.Resolve("noop")({}, ctx).kind_case() == google::protobuf::Value::kNullValue);

  (*args.mutable_fields())["message"].set_string_value("custom failure");
  bool threw = false;
  try {
    registry.Resolve("fail")(args, ctx);
  } catch (const batch::util::TaskExecutionError& e) {
    threw = std::string(e.what()) == "custom failure";
  }
  assert(threw);
}

void TestSleepHonoursCancellation() {
  TaskRegistry registry;
  batch::task::RegisterBuiltinTasks(registry);

  auto handle     = std::make_shared<batch::task::AttemptHandle>();
  handle->job_id  = "job-2";
  handle->attempt = 1;
  handle->token.Cancel();
  auto ctx = MakeContext(handle);

  google::protobuf::Struct args;
  (*args.mutable_fields())["millis"].set_number_value(10'000);

  bool threw = false;
  try {
    registry.Resolve("sleep")(args, ctx);
  } catch (const batch::util::TaskCanceledError&) {
    threw = true;
  }
  assert(threw);
}

void TestProgressIsClamped() {
  auto handle = std::make_shared<batch::task::AttemptHandle>();
  auto ctx    = MakeContext(handle);

  ctx.ReportProgress(150.0, "over");
  assert(handle->progress == 100.0);
  assert(handle->progress_message == "over");

  ctx.ReportProgress(-3.0);
  assert(handle->progress == 0.0);
}

} // namespace

int main() {
  TestRegisterAndResolve();
  TestDuplicateRegistrationIsRejectedUnlessOverwriting();
  TestUnknownTaskAndInvalidRegistrations();
  TestBuiltinTasks();
  TestSleepHonoursCancellation();
  TestProgressIsClamped();

  std::cout << "batch_unit_task_registry: pass\n";
  return 0;
}

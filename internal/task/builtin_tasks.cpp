#include <chrono>
#include <thread>

#include "internal/task/task_registry.hpp"
#include "internal/util/errors.hpp"

namespace batch::task {
namespace {

const google::protobuf::Value* Field(const google::protobuf::Struct& args, const std::string& key) {
  auto it = args.fields().find(key);
  return it == args.fields().end() ? nullptr : &it->second;
}

google::protobuf::Value Noop(const google::protobuf::Struct&, TaskContext&) {
  google::protobuf::Value out;
  out.set_null_value(google::protobuf::NULL_VALUE);
  return out;
}

google::protobuf::Value Echo(const google::protobuf::Struct& args, TaskContext&) {
  google::protobuf::Value out;
  *out.mutable_struct_value() = args;
  return out;
}

google::protobuf::Value Sleep(const google::protobuf::Struct& args, TaskContext& ctx) {
  constexpr auto kSlice = std::chrono::milliseconds(10);

  std::chrono::milliseconds total{0};
  if (const auto* millis = Field(args, "millis"); millis && millis->kind_case() == google::protobuf::Value::kNumberValue) {
    total = std::chrono::milliseconds(static_cast<int64_t>(millis->number_value()));
  }

  const auto deadline = std::chrono::steady_clock::now() + total;
  while (std::chrono::steady_clock::now() < deadline) {
    ctx.ThrowIfCancelled();
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - std::chrono::steady_clock::now()));
  }
  ctx.ReportProgress(100.0, "slept");

  google::protobuf::Value out;
  out.set_number_value(static_cast<double>(total.count()));
  return out;
}

google::protobuf::Value Fail(const google::protobuf::Struct& args, TaskContext&) {
  std::string message = "task failed";
  if (const auto* msg = Field(args, "message"); msg && msg->kind_case() == google::protobuf::Value::kStringValue) {
    message = msg->string_value();
  }
  throw util::TaskExecutionError(message);
}

} // namespace

void RegisterBuiltinTasks(TaskRegistry& registry) {
  registry.Register("noop", Noop, true);
  registry.Register("echo", Echo, true);
  registry.Register("sleep", Sleep, true);
  registry.Register("fail", Fail, true);
}

} // namespace batch::task

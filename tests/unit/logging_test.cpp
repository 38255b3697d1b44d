#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

namespace obs = batch::observability;

// Routes the default logger into a stream with a bare "%v" pattern.
struct Capture {
  std::ostringstream out;

  Capture() {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  std::string Take() {
    auto text = out.str();
    out.str("");
    return text;
  }
};

void TestFieldsAreAppended() {
  Capture capture;
  BATCH_LOG_INFO("Job queued", {obs::StringField("job_id", "abc"), obs::IntField("depth", 3), obs::BoolField("retry", false)});
  assert(capture.Take() == "Job queued job_id=abc depth=3 retry=false\n");
}

void TestValuesWithSpacesAreQuoted() {
  Capture capture;
  BATCH_LOG_WARN("Attempt failed", {obs::StringField("error", "disk \"sdb\" full"), obs::StringField("empty", "")});
  assert(capture.Take() == "Attempt failed error=\"disk \\\"sdb\\\" full\" empty=\"\"\n");
}

void TestJobContextTagsLines() {
  Capture capture;
  {
    obs::ScopedJobContext outer("job-1", 2);
    BATCH_LOG_INFO("step");
    assert(capture.Take() == "step job_id=job-1 attempt=2\n");

    {
      obs::ScopedJobContext inner("job-2", 1);
      BATCH_LOG_INFO("nested");
      assert(capture.Take() == "nested job_id=job-2 attempt=1\n");
    }

    // an explicit job_id wins over the thread's context
    BATCH_LOG_INFO("explicit", {obs::StringField("job_id", "other")});
    assert(capture.Take() == "explicit job_id=other\n");

    BATCH_LOG_INFO("restored");
    assert(capture.Take() == "restored job_id=job-1 attempt=2\n");
  }

  BATCH_LOG_INFO("outside");
  assert(capture.Take() == "outside\n");
}

void TestLevelFiltering() {
  Capture capture;
  spdlog::default_logger()->set_level(spdlog::level::warn);
  BATCH_LOG_DEBUG("hidden");
  BATCH_LOG_INFO("hidden");
  BATCH_LOG_ERROR("shown");
  assert(capture.Take() == "shown\n");
}

} // namespace

int main() {
  TestFieldsAreAppended();
  TestValuesWithSpacesAreQuoted();
  TestJobContextTagsLines();
  TestLevelFiltering();

  std::cout << "batch_unit_logging: pass\n";
  return 0;
}

#include "monitor/monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace runbox {
using namespace std;

monitor::~monitor() = default;

void log_monitor::end_execution(const execution_record &record) {
    LOG(INFO) << fmt::format("Code execution by {}: {}, fingerprint: {}, time: {:.3f}s, success: {}, status: {}",
                             record.actor.empty() ? "<anonymous>" : record.actor,
                             record.language,
                             record.fingerprint,
                             record.execution_time_seconds,
                             record.success,
                             get_display_message(record.result));
}

}  // namespace runbox

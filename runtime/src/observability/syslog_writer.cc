#include "otelpipe/observability/syslog_writer.h"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <unistd.h>

#include <chrono>
#include <climits>
#include <ctime>

namespace otelpipe::observability {

std::string FormatSyslogLine(const LogRecord& record, std::string_view service_name,
                             std::string_view host_name) {
  using namespace std::chrono;

  const auto since_epoch = record.timestamp.time_since_epoch();
  const auto secs = duration_cast<seconds>(since_epoch);
  const auto millis = duration_cast<milliseconds>(since_epoch - secs).count();
  const std::tm utc = fmt::gmtime(static_cast<std::time_t>(secs.count()));

  return fmt::format("<{}>{:%Y-%m-%dT%H:%M:%S}.{:03}Z {} [{} tid=\"{}\" module=\"{}\"] - {}",
                     ToSyslogPriority(record.severity), utc, millis, service_name, host_name,
                     record.thread_id, record.module, record.body);
}

std::string LocalHostName() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "localhost";
  }
  return buf;
}

}  // namespace otelpipe::observability

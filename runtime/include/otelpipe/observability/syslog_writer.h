#pragma once

#include <string>
#include <string_view>

#include "otelpipe/observability/log_record.h"

namespace otelpipe::observability {

// One stderr mirror line, without the trailing newline:
//   <PRI>2024-05-01T10:00:00.123Z service [host tid="42" module="app"] - message
std::string FormatSyslogLine(const LogRecord& record, std::string_view service_name,
                             std::string_view host_name);

// Local host name, or "localhost" if it cannot be read.
std::string LocalHostName();

}  // namespace otelpipe::observability

#include "archivist/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>

namespace archivist::core {

std::string NowIso8601() {
    return FormatIso8601(Poco::Timestamp());
}

std::string FormatIso8601(const Poco::Timestamp& timestamp) {
    return Poco::DateTimeFormatter::format(timestamp, Poco::DateTimeFormat::ISO8601_FORMAT);
}

long long NowUnixMillis() {
    return static_cast<long long>(Poco::Timestamp().epochMicroseconds() / 1000);
}

}  // namespace archivist::core

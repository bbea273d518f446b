#include "engram/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace engram::common {

std::string format_rfc3339(const std::chrono::system_clock::time_point point) {
  const auto t = std::chrono::system_clock::to_time_t(point);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          point.time_since_epoch()) %
                      std::chrono::seconds(1);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
      << (micros.count() < 0 ? micros.count() + 1000000 : micros.count()) << 'Z';
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

} // namespace engram::common

#include "Transport.hpp"

namespace parfetch {

std::string formatRange(const FetchRequest& request) {
  if (!request.rangeStart) return "";
  std::string range = std::to_string(*request.rangeStart) + "-";
  if (request.rangeEnd) range += std::to_string(*request.rangeEnd);
  return range;
}

}  // namespace parfetch

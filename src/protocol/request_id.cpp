#include "xdmcp/protocol/request_id.h"

#include <limits>

namespace xdmcp::protocol {

std::optional<RequestId> request_id_from_json(const nlohmann::json& j) {
  if (j.is_null()) {
    return RequestId::null();
  }
  if (j.is_string()) {
    return RequestId::from_string(j.get<std::string>());
  }
  if (j.is_number_unsigned()) {
    const auto value = j.get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return RequestId::from_integer(static_cast<std::int64_t>(value));
  }
  if (j.is_number_integer()) {
    return RequestId::from_integer(j.get<std::int64_t>());
  }
  return std::nullopt;
}

nlohmann::json request_id_to_json(const RequestId& id) {
  if (const auto* text = id.as_string()) {
    return *text;
  }
  if (const auto* number = id.as_integer()) {
    return *number;
  }
  return nullptr;
}

}  // namespace xdmcp::protocol

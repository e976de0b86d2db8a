#include "xdmcp/protocol/dynamic_value.h"

#include <limits>
#include <type_traits>
#include <utility>

namespace xdmcp::protocol {

const DynamicValue* DynamicValue::find(const std::string& key) const {
  const auto* object = as_object();
  if (object == nullptr) {
    return nullptr;
  }
  auto it = object->find(key);
  if (it == object->end()) {
    return nullptr;
  }
  return &it->second;
}

DynamicValue dynamic_value_from_json(const nlohmann::json& j) {
  if (j.is_null()) {
    return DynamicValue{};
  }
  if (j.is_boolean()) {
    return DynamicValue{j.get<bool>()};
  }
  if (j.is_number_unsigned()) {
    const auto value = j.get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return DynamicValue{static_cast<double>(value)};
    }
    return DynamicValue{static_cast<std::int64_t>(value)};
  }
  if (j.is_number_integer()) {
    return DynamicValue{j.get<std::int64_t>()};
  }
  if (j.is_number_float()) {
    return DynamicValue{j.get<double>()};
  }
  if (j.is_string()) {
    return DynamicValue{j.get<std::string>()};
  }
  if (j.is_array()) {
    DynamicValue::Array array;
    array.reserve(j.size());
    for (const auto& element : j) {
      array.push_back(dynamic_value_from_json(element));
    }
    return DynamicValue{std::move(array)};
  }
  if (j.is_object()) {
    DynamicValue::Object object;
    for (const auto& item : j.items()) {
      object.emplace(item.key(), dynamic_value_from_json(item.value()));
    }
    return DynamicValue{std::move(object)};
  }
  // Binary and discarded values never come out of the text parser.
  return DynamicValue{};
}

nlohmann::json dynamic_value_to_json(const DynamicValue& value) {
  return std::visit(
      [](const auto& held) -> nlohmann::json {
        using T = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return nlohmann::json(nullptr);
        } else if constexpr (std::is_same_v<T, DynamicValue::Array>) {
          nlohmann::json array = nlohmann::json::array();
          for (const auto& element : held) {
            array.push_back(dynamic_value_to_json(element));
          }
          return array;
        } else if constexpr (std::is_same_v<T, DynamicValue::Object>) {
          nlohmann::json object = nlohmann::json::object();
          for (const auto& [key, member] : held) {
            object[key] = dynamic_value_to_json(member);
          }
          return object;
        } else {
          return nlohmann::json(held);
        }
      },
      value.storage());
}

}  // namespace xdmcp::protocol

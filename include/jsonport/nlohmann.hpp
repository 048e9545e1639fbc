/**
 * @file nlohmann.hpp
 * @brief Adapts an already-decoded nlohmann::json tree into a jsonport Value
 *
 * Optional: include only when nlohmann/json is available.
 *
 * License: MIT
 */

#ifndef JSONPORT_NLOHMANN_HPP
#define JSONPORT_NLOHMANN_HPP

#include <cmath>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jsonport.hpp"

namespace jsonport {

// Numbers keep their textual form: integers print exactly, floats through
// dump(). NaN and infinity have no JSON form and map to NULL, as dump() does.
// Binary and discarded nodes become Invalid.
inline Value wrap(const nlohmann::json &j) {
  using value_t = nlohmann::json::value_t;

  switch (j.type()) {
  case value_t::null:
    return Value();
  case value_t::boolean:
    return Value(j.get<bool>());
  case value_t::string:
    return Value(j.get_ref<const std::string &>());
  case value_t::number_integer:
    return Value::number(std::to_string(j.get<int64_t>()));
  case value_t::number_unsigned:
    return Value::number(std::to_string(j.get<uint64_t>()));
  case value_t::number_float: {
    if (!std::isfinite(j.get<double>()))
      return Value();
    return Value::number(j.dump());
  }
  case value_t::array: {
    Array arr;
    arr.reserve(j.size());
    for (const auto &element : j)
      arr.push_back(wrap(element));
    return Value(std::move(arr));
  }
  case value_t::object: {
    std::vector<Member> members;
    members.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it)
      members.push_back(Member{it.key(), wrap(it.value())});
    return Value(Object(std::move(members)));
  }
  case value_t::binary:
    return Value::invalid(
        UnsupportedOperationError("binary values are not supported"));
  case value_t::discarded:
    break;
  }
  return Value::invalid(
      UnsupportedOperationError("discarded values are not supported"));
}

} // namespace jsonport

#endif // JSONPORT_NLOHMANN_HPP

#pragma once

#include "taskforge/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace taskforge {

using JsonValue = glz::generic_json<glz::num_mode::i64>;
using JsonObject = JsonValue::object_t;
using JsonArray = JsonValue::array_t;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

namespace json {

/// Member lookup that tolerates non-object receivers.
[[nodiscard]] inline auto find(const JsonValue &obj, std::string_view key)
    -> const JsonValue * {
  if (!obj.is_object()) {
    return nullptr;
  }
  const auto &members = obj.get_object();
  auto it = members.find(key);
  return it == members.end() ? nullptr : &it->second;
}

/// Walks a dotted key path such as "spec.modelConfig.env".
[[nodiscard]] inline auto find_path(const JsonValue &obj,
                                    std::string_view dotted)
    -> const JsonValue * {
  const JsonValue *cur = &obj;
  while (cur != nullptr && !dotted.empty()) {
    auto dot = dotted.find('.');
    cur = find(*cur, dotted.substr(0, dot));
    dotted = dot == std::string_view::npos ? std::string_view{}
                                           : dotted.substr(dot + 1);
  }
  return cur;
}

[[nodiscard]] inline auto string_at(const JsonValue &obj,
                                    std::string_view dotted)
    -> std::optional<std::string> {
  const auto *v = find_path(obj, dotted);
  if (v == nullptr || !v->is_string()) {
    return std::nullopt;
  }
  return v->get_string();
}

[[nodiscard]] inline auto int_at(const JsonValue &obj, std::string_view dotted)
    -> std::optional<std::int64_t> {
  const auto *v = find_path(obj, dotted);
  if (v == nullptr) {
    return std::nullopt;
  }
  if (const auto *i = std::get_if<std::int64_t>(&v->data)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(&v->data)) {
    return static_cast<std::int64_t>(*d);
  }
  return std::nullopt;
}

[[nodiscard]] inline auto bool_at(const JsonValue &obj, std::string_view dotted)
    -> std::optional<bool> {
  const auto *v = find_path(obj, dotted);
  if (v == nullptr || !v->is_boolean()) {
    return std::nullopt;
  }
  return v->get_boolean();
}

[[nodiscard]] inline auto object() -> JsonValue { return JsonObject{}; }

} // namespace json

} // namespace taskforge

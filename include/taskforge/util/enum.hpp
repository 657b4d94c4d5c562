#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/mysql/format_sql.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace taskforge {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

template <typename E>
[[nodiscard]] inline auto enum_to_string(E value) -> std::string {
  return std::string{to_string_view(value)};
}

namespace util {

enum class EnumCase : std::uint8_t { Snake, ScreamingSnake };

[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  auto alnum_lower =
      token | std::views::filter([](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
      }) |
      std::views::transform([](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
  return std::string(alnum_lower.begin(), alnum_lower.end());
}

/// "InProgress" -> "in_progress", "HTTPServer" -> "http_server".
[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() * 2);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    if (std::isupper(uch) != 0 && i > 0) {
      const bool prev_lower =
          std::islower(static_cast<unsigned char>(name[i - 1])) != 0;
      const bool next_lower =
          i + 1 < name.size() &&
          std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
      if (prev_lower || next_lower) {
        out.push_back('_');
      }
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

[[nodiscard]] inline auto to_upper_ascii(std::string s) -> std::string {
  for (auto &c : s) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return s;
}

/// Wire name of an enumerator. The table is built once per enum type and
/// case, so the returned view stays valid for the program's lifetime.
template <typename E, EnumCase Case = EnumCase::Snake>
[[nodiscard]] inline auto
enum_wire_name(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto descriptor) {
      auto snake = enum_name_to_snake_case(descriptor.name);
      if constexpr (Case == EnumCase::ScreamingSnake) {
        snake = to_upper_ascii(std::move(snake));
      }
      out[i++] = {descriptor.value, std::move(snake)};
    });
    return out;
  }();

  for (const auto &[enum_value, text] : table) {
    if (enum_value == value) {
      return text;
    }
  }
  return fallback;
}

/// Case- and separator-insensitive: "in_progress", "IN-PROGRESS" and
/// "InProgress" all match InProgress.
template <typename E>
[[nodiscard]] inline auto parse_enum(std::string_view input,
                                     E default_value) noexcept -> E {
  const auto normalized_input = normalize_enum_token(input);
  E out = default_value;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
        }
      });
  return out;
}

template <typename E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  const auto normalized_input = normalize_enum_token(input);
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
        }
      });
  return out;
}

} // namespace util

#define TASKFORGE_DEFINE_ENUM_SERDE_CASE(EnumType, DefaultValue, Case)         \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::taskforge::util::enum_wire_name<EnumType, Case>(value);           \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::taskforge::util::parse_enum(s, DefaultValue);                     \
  }

#define TASKFORGE_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                    \
  TASKFORGE_DEFINE_ENUM_SERDE_CASE(EnumType, DefaultValue,                     \
                                   ::taskforge::util::EnumCase::Snake)

#define TASKFORGE_DEFINE_ENUM_SERDE_UPPER(EnumType, DefaultValue)              \
  TASKFORGE_DEFINE_ENUM_SERDE_CASE(EnumType, DefaultValue,                     \
                                   ::taskforge::util::EnumCase::ScreamingSnake)

} // namespace taskforge

namespace boost::mysql {

// Described enums bind into SQL as their wire name.
template <typename T>
  requires(std::is_enum_v<T> &&
           boost::describe::has_describe_enumerators<T>::value)
struct formatter<T> {
  auto parse(const char *begin, const char *) -> const char * { return begin; }

  auto format(T value, format_context_base &ctx) const -> void {
    boost::mysql::format_sql_to(ctx, "{}", to_string_view(value));
  }
};

} // namespace boost::mysql

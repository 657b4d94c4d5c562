#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>

namespace taskforge {

// Phantom tags; each row kind gets its own id type so a SubtaskId can never
// be passed where a TaskId is expected.
struct TaskTag {};
struct SubtaskTag {};
struct UserTag {};
struct ResourceTag {};

/// Database row id wrapper. Zero is the "unset" value; real rows start at 1.
template <typename Tag> class TypedId {
public:
  constexpr TypedId() = default;
  constexpr explicit TypedId(std::int64_t value) : value_(value) {}

  [[nodiscard]] constexpr auto value() const noexcept -> std::int64_t {
    return value_;
  }
  [[nodiscard]] constexpr auto empty() const noexcept -> bool {
    return value_ == 0;
  }
  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return value_ != 0;
  }

  [[nodiscard]] friend constexpr auto operator<=>(TypedId, TypedId) = default;

private:
  std::int64_t value_{0};
};

using TaskId = TypedId<TaskTag>;
using SubtaskId = TypedId<SubtaskTag>;
using UserId = TypedId<UserTag>;
using ResourceId = TypedId<ResourceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, TypedId<Tag> id) -> std::ostream & {
  return os << id.value();
}

} // namespace taskforge

// `is_avalanching` lets ankerl::unordered_dense use this hash as-is.
template <typename Tag> struct std::hash<taskforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(taskforge::TypedId<Tag> id) const noexcept -> std::size_t {
    auto x = static_cast<std::uint64_t>(id.value());
    x ^= x >> 33U;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33U;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33U;
    return static_cast<std::size_t>(x);
  }
};

template <typename Tag>
struct std::formatter<taskforge::TypedId<Tag>>
    : std::formatter<std::int64_t> {
  auto format(taskforge::TypedId<Tag> id, auto &ctx) const {
    return std::formatter<std::int64_t>::format(id.value(), ctx);
  }
};

#pragma once

#include "taskforge/util/enum.hpp"
#include "taskforge/util/string_hash.hpp"
#include "taskforge/util/time.hpp"

namespace taskforge {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace taskforge

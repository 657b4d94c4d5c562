#pragma once

#include "taskforge/core/error.hpp"
#include "taskforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace taskforge::toml_util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Unknown keys are tolerated so older binaries accept newer config files.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text, T &out) -> Result<void> {
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(out, text); ec) {
    log::error("TOML parse error: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok();
}

} // namespace taskforge::toml_util

#include "taskforge/client/http/http_types.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/url/params_view.hpp>
#include <boost/system/system_error.hpp>

#include <utility>

namespace taskforge::http {

auto HttpRequest::header(std::string_view key) const -> Result<std::string> {
  if (auto it = headers.find(key); it != headers.end()) {
    return ok(it->second);
  }
  // field names are case-insensitive on the wire
  for (const auto &[name, value] : headers) {
    if (boost::algorithm::iequals(name, key)) {
      return ok(value);
    }
  }
  return fail(Error::NotFound);
}

auto HttpRequest::is_websocket_upgrade() const -> bool {
  auto upgrade = header("Upgrade");
  auto connection = header("Connection");
  if (!upgrade || !connection) {
    return false;
  }
  return boost::algorithm::iequals(*upgrade, "websocket") &&
         boost::algorithm::icontains(*connection, "upgrade");
}

auto HttpRequest::path_param(std::string_view key) const
    -> Result<std::string> {
  if (auto it = path_params.find(key); it != path_params.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

QueryParams::QueryParams(std::string_view query_string) {
  if (query_string.empty()) {
    return;
  }
  try {
    boost::urls::params_view parsed(query_string);
    for (const auto &param : parsed) {
      params_[std::string(param.key)] = std::string(param.value);
    }
  } catch (const boost::system::system_error &) {
    params_.clear();
  }
}

auto QueryParams::get(std::string_view key) const -> Result<std::string> {
  if (auto it = params_.find(key); it != params_.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpResponse::json(std::string text, HttpStatus status) -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers.emplace("Content-Type", "application/json");
  resp.body.assign(text.begin(), text.end());
  return resp;
}

auto HttpResponse::empty(HttpStatus status) -> HttpResponse {
  return {.status = status, .headers = {}, .body = {}};
}

} // namespace taskforge::http

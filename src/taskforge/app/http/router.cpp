#include "taskforge/app/http/router.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <array>
#include <ranges>
#include <string_view>
#include <utility>
#include <vector>

namespace taskforge::http {

namespace {

struct Segment {
  std::string text; // literal text, or the parameter name
  bool is_param{false};
};

[[nodiscard]] auto split_path(std::string_view path)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  for (auto part : path | std::views::split('/')) {
    out.emplace_back(part.begin(), part.end());
  }
  return out;
}

[[nodiscard]] auto parse_pattern(std::string_view pattern)
    -> std::vector<Segment> {
  std::vector<Segment> out;
  for (auto seg : split_path(pattern)) {
    if (seg.size() >= 2 && seg.starts_with('{') && seg.ends_with('}')) {
      out.push_back(
          Segment{std::string(seg.substr(1, seg.size() - 2)), true});
    } else {
      out.push_back(Segment{std::string(seg), false});
    }
  }
  return out;
}

} // namespace

struct Router::Impl {
  struct PatternRoute {
    std::vector<Segment> segments;
    RouteHandler handler;
  };

  struct MethodRoutes {
    ankerl::unordered_dense::map<std::string, RouteHandler, StringHash,
                                 StringEqual>
        exact;
    std::vector<PatternRoute> patterns;
  };

  std::array<MethodRoutes, 3> methods;

  auto routes_for(HttpMethod method) -> MethodRoutes & {
    return methods[static_cast<std::size_t>(std::to_underlying(method)) %
                   methods.size()];
  }

  static auto match(const std::vector<Segment> &pattern,
                    const std::vector<std::string_view> &path,
                    const HttpRequest &req) -> bool {
    if (pattern.size() != path.size()) {
      return false;
    }
    for (auto &&[seg, part] : std::views::zip(pattern, path)) {
      if (!seg.is_param && seg.text != part) {
        return false;
      }
      if (seg.is_param && part.empty()) {
        return false;
      }
    }
    req.path_params.clear();
    for (auto &&[seg, part] : std::views::zip(pattern, path)) {
      if (seg.is_param) {
        req.path_params.emplace(seg.text, std::string(part));
      }
    }
    return true;
  }
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string path,
                       RouteHandler handler) -> void {
  auto segments = parse_pattern(path);
  auto &routes = impl_->routes_for(method);
  if (std::ranges::none_of(segments, &Segment::is_param)) {
    routes.exact.insert_or_assign(std::move(path), std::move(handler));
    return;
  }
  routes.patterns.push_back(Impl::PatternRoute{.segments = std::move(segments),
                                               .handler = std::move(handler)});
}

auto Router::get(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::GET, std::move(path), std::move(handler));
}

auto Router::post(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::POST, std::move(path), std::move(handler));
}

auto Router::route(HttpRequest req) -> taskforge::task<HttpResponse> {
  auto &routes = impl_->routes_for(req.method);

  if (auto it = routes.exact.find(req.path); it != routes.exact.end()) {
    co_return co_await it->second(std::move(req));
  }

  const auto path = split_path(req.path);
  for (auto &route : routes.patterns) {
    if (Impl::match(route.segments, path, req)) {
      co_return co_await route.handler(std::move(req));
    }
  }
  co_return HttpResponse::empty(HttpStatus::NotFound);
}

} // namespace taskforge::http

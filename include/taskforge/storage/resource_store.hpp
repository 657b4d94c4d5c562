#pragma once

#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/domain/resources.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskforge {

struct ResourceFilter {
  std::optional<UserId> user_id;
  std::optional<std::string> name;
  std::optional<std::string> name_space;
  bool active_only{true};
};

// Generic store of named, namespaced JSON documents (bots, teams, ghosts,
// shells, models) plus the user directory the dispatcher reads git
// identities from.
class ResourceStore {
public:
  virtual ~ResourceStore() = default;

  virtual auto get_by_id(ResourceKind kind, ResourceId id)
      -> task<Result<Resource>> = 0;
  virtual auto query(ResourceKind kind, ResourceFilter filter)
      -> task<Result<std::vector<Resource>>> = 0;
  /// Insert or replace by (kind, user, name, namespace).
  virtual auto upsert(ResourceKind kind, UserId owner, std::string name,
                      std::string name_space, JsonValue json)
      -> task<Result<Resource>> = 0;
  virtual auto soft_delete(ResourceId id) -> task<Result<void>> = 0;

  virtual auto get_user(UserId id) -> task<Result<User>> = 0;
  virtual auto upsert_user(User user) -> task<Result<UserId>> = 0;
};

/// Lookup by (name, namespace): the owner's copy first, then the public one.
/// Outside the default namespace any owner's copy matches.
[[nodiscard]] auto find_named(ResourceStore &store, ResourceKind kind,
                              const ResourceRef &ref, UserId owner)
    -> task<Result<Resource>>;

} // namespace taskforge

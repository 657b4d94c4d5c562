#include "taskforge/storage/resource_store.hpp"

namespace taskforge {

auto find_named(ResourceStore &store, ResourceKind kind, const ResourceRef &ref,
                UserId owner) -> task<Result<Resource>> {
  // Non-default namespaces are shared by a group; ownership does not apply.
  if (ref.name_space != kDefaultNamespace) {
    auto rows = co_await store.query(
        kind, ResourceFilter{.name = ref.name, .name_space = ref.name_space});
    if (!rows) {
      co_return fail(rows.error());
    }
    if (rows->empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(std::move(rows->front()));
  }

  auto owners = std::vector<UserId>{owner};
  if (owner != kPublicOwner) {
    owners.push_back(kPublicOwner);
  }
  for (auto candidate : owners) {
    auto rows = co_await store.query(
        kind, ResourceFilter{.user_id = candidate,
                             .name = ref.name,
                             .name_space = ref.name_space});
    if (!rows) {
      co_return fail(rows.error());
    }
    if (!rows->empty()) {
      co_return ok(std::move(rows->front()));
    }
  }
  co_return fail(Error::NotFound);
}

} // namespace taskforge

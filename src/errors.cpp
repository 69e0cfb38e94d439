#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"

namespace locamat {

namespace {
std::string describe(const std::string& head, const IdList& ids) {
    if (ids.empty()) return head;
    return head + ": " + helpers::join_ids(ids);
}
} // anonymous namespace

NotFoundError::NotFoundError(const std::string& resource, IdList missing_ids)
    : RentalError(describe(resource + " not found", missing_ids)),
      resource_(resource),
      missing_ids_(std::move(missing_ids)) {}

ConflictError::ConflictError(const std::string& reason, IdList conflicting_ids)
    : RentalError(describe(reason, conflicting_ids)),
      reason_(reason),
      conflicting_ids_(std::move(conflicting_ids)) {}

} // namespace locamat

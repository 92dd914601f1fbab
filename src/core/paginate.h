#pragma once

#include "errors.h"
#include "layout.h"

#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace gang::core {

// Called once per produced sheet, with the sheet's 0-based index and the
// number of copies still queued after it.
using SheetObserver = std::function<void(size_t index, const PackResult& result, size_t remaining_after)>;

// Same contract as pack_one_sheet, which is used when none is given.
using SheetPacker = std::function<bool(const std::vector<Design>& designs,
                                       std::span<const size_t> queue,
                                       const SheetConstraints& constraints,
                                       PackResult& out,
                                       Error& error)>;

// Fails with PackingStalled if the packer returns no sheet or consumes
// nothing while copies remain.
bool paginate(const std::vector<Design>& designs,
              CopyQueue& queue,
              const SheetConstraints& constraints,
              std::vector<Sheet>& out,
              Error& error,
              const SheetObserver& observer = {},
              const SheetPacker& packer = {});

// Applies the rotation flag to every design, validates counts and
// constraints, then paginates the full copy queue.
bool generate_layout(std::vector<Design>& designs,
                     const SheetConstraints& constraints,
                     bool rotate,
                     std::vector<Sheet>& out,
                     Error& error,
                     const SheetObserver& observer = {});

size_t count_placements(const std::vector<Sheet>& sheets);

} // namespace gang::core

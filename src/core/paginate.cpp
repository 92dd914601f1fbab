#include "paginate.h"

#include <string>
#include <utility>

namespace gang::core {

bool paginate(const std::vector<Design>& designs,
              CopyQueue& queue,
              const SheetConstraints& constraints,
              std::vector<Sheet>& out,
              Error& error,
              const SheetObserver& observer,
              const SheetPacker& packer) {
    const SheetPacker pack = packer ? packer : SheetPacker(pack_one_sheet);
    std::vector<Sheet> sheets;
    const size_t initial = queue.remaining_count();
    size_t placed = 0;

    while (!queue.empty()) {
        PackResult result;
        if (!pack(designs, queue.remaining(), constraints, result, error)) {
            return false;
        }
        if (result.consumed == 0 || !result.has_sheet) {
            return fail(error, ErrorCode::PackingStalled,
                        "packer made no progress with " + std::to_string(queue.remaining_count())
                            + " copies left on sheet " + std::to_string(sheets.size() + 1));
        }
        queue.advance(result.consumed);
        placed += result.consumed;
        if (observer) {
            observer(sheets.size(), result, queue.remaining_count());
        }
        sheets.push_back(std::move(result.sheet));
    }

    if (placed != initial) {
        return fail(error, ErrorCode::PackingStalled,
                    "placed " + std::to_string(placed) + " of " + std::to_string(initial) + " copies");
    }

    out = std::move(sheets);
    return true;
}

bool generate_layout(std::vector<Design>& designs,
                     const SheetConstraints& constraints,
                     bool rotate,
                     std::vector<Sheet>& out,
                     Error& error,
                     const SheetObserver& observer) {
    if (designs.empty()) {
        return fail(error, ErrorCode::InvalidQuantity, "no designs to lay out");
    }
    for (const Design& design : designs) {
        if (design.requested_copies <= 0) {
            return fail(error, ErrorCode::InvalidQuantity,
                        "design '" + design.name + "' requests " + std::to_string(design.requested_copies)
                            + " copies");
        }
    }
    if (!validate_constraints(constraints, error)) {
        return false;
    }

    for (Design& design : designs) {
        design.footprint.rotated = rotate;
    }

    CopyQueue queue = build_copy_queue(designs);
    return paginate(designs, queue, constraints, out, error, observer);
}

size_t count_placements(const std::vector<Sheet>& sheets) {
    size_t total = 0;
    for (const Sheet& sheet : sheets) {
        total += sheet.placements.size();
    }
    return total;
}

} // namespace gang::core

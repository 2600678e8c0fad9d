#include "sable/common/line_range_set.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace sable::common {

void LineRangeSet::Insert(uint32_t start, uint32_t end) {
  uint64_t new_start = start;
  uint64_t new_end = end;

  // Find first range whose end + 1 >= new_start (could overlap or be
  // adjacent).
  auto it = ranges_.begin();
  while (it != ranges_.end()) {
    if (static_cast<uint64_t>(it->end) + 1 >= new_start) break;
    ++it;
  }

  // If no existing range overlaps/adjoins, insert before it.
  if (it == ranges_.end() || static_cast<uint64_t>(it->start) > new_end + 1) {
    ranges_.insert(it, LineRange{.start = start, .end = end});
    return;
  }

  // Merge: extend the found range to cover the union.
  new_start = std::min(new_start, static_cast<uint64_t>(it->start));
  new_end = std::max(new_end, static_cast<uint64_t>(it->end));

  // Absorb subsequent overlapping/adjacent ranges.
  auto merge_end = it + 1;
  while (merge_end != ranges_.end() &&
         static_cast<uint64_t>(merge_end->start) <= new_end + 1) {
    new_end = std::max(new_end, static_cast<uint64_t>(merge_end->end));
    ++merge_end;
  }

  // Write merged range and erase absorbed entries.
  it->start = static_cast<uint32_t>(new_start);
  it->end = static_cast<uint32_t>(new_end);
  ranges_.erase(it + 1, merge_end);
}

auto LineRangeSet::Clip(LineRange range) const -> std::vector<LineRange> {
  if (is_full_extent_) {
    return {range};
  }

  std::vector<LineRange> pieces;
  for (const auto& r : ranges_) {
    if (r.start > range.end) break;
    if (r.end < range.start) continue;
    pieces.push_back(
        LineRange{
            .start = std::max(r.start, range.start),
            .end = std::min(r.end, range.end),
        });
  }
  return pieces;
}

}  // namespace sable::common

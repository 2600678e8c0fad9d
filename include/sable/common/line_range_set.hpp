#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace sable::common {

// Inclusive, 1-indexed line range.
struct LineRange {
  uint32_t start = 0;
  uint32_t end = 0;

  [[nodiscard]] auto Size() const -> uint32_t {
    return end - start + 1;
  }

  auto operator==(const LineRange&) const -> bool = default;
};

// Sorted, non-overlapping, merged set of line ranges.
//
// A default-constructed LineRangeSet is empty.
// Call MarkFullExtent() to mean "every line".
// Invariant: all entries have start <= end; sorted by start; no
// overlap/adjacency.
class LineRangeSet {
 public:
  LineRangeSet() = default;

  // Insert a range and merge with overlapping/adjacent ranges.
  // Precondition: start <= end.
  void Insert(uint32_t start, uint32_t end);
  void Insert(LineRange range) {
    Insert(range.start, range.end);
  }

  // Mark full-extent (clear all ranges, semantics = "every line").
  void MarkFullExtent() {
    ranges_.clear();
    is_full_extent_ = true;
  }

  [[nodiscard]] auto IsFullExtent() const -> bool {
    return is_full_extent_;
  }
  [[nodiscard]] auto Ranges() const -> std::span<const LineRange> {
    return ranges_;
  }
  [[nodiscard]] auto IsEmpty() const -> bool {
    return !is_full_extent_ && ranges_.empty();
  }

  // Pieces of [range.start, range.end] covered by this set, in order.
  [[nodiscard]] auto Clip(LineRange range) const -> std::vector<LineRange>;

 private:
  std::vector<LineRange> ranges_;
  bool is_full_extent_ = false;
};

}  // namespace sable::common

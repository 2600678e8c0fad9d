#pragma once

#include <utility>
#include <vector>

#include "sable/common/line_range_set.hpp"
#include "sable/config/config_cache.hpp"
#include "sable/directive/directive_scanner.hpp"
#include "sable/directive/range_intersector.hpp"

namespace sable::pipeline {

// State shared by all workers of one run. Owns the configuration cache; the
// requested line ranges and scan policy are fixed at construction.
class RunContext {
 public:
  RunContext(
      config::ConfigResolver resolver,
      const std::vector<common::LineRange>& line_ranges,
      directive::UnmatchedPausePolicy unmatched_pause =
          directive::UnmatchedPausePolicy::kExtendToEof)
      : resolver_(std::move(resolver)),
        cache_(resolver_),
        requested_(directive::RequestedLines(line_ranges)),
        unmatched_pause_(unmatched_pause) {
  }

  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;
  RunContext(RunContext&&) = delete;
  RunContext& operator=(RunContext&&) = delete;

  auto Cache() -> config::ConfigCache& {
    return cache_;
  }

  [[nodiscard]] auto Requested() const -> const common::LineRangeSet& {
    return requested_;
  }

  [[nodiscard]] auto UnmatchedPause() const -> directive::UnmatchedPausePolicy {
    return unmatched_pause_;
  }

 private:
  config::ConfigResolver resolver_;
  config::ConfigCache cache_;
  common::LineRangeSet requested_;
  directive::UnmatchedPausePolicy unmatched_pause_;
};

}  // namespace sable::pipeline

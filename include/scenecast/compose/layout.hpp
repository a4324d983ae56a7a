#pragma once

#include "scenecast/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::compose {

enum class LayoutKind { Auto, Row, Column, Grid, Template };

/// Rows of pane indices. A pane repeated across neighbouring cells spans them.
using GridTemplate = std::vector<std::vector<int>>;

struct LayoutSpec {
  LayoutKind kind = LayoutKind::Auto;
  // Explicit grid column count; forces a grid for any input count.
  std::optional<int> cols;
  // Set for LayoutKind::Template only.
  GridTemplate grid_template;
};

struct ResolvedLayout {
  LayoutKind kind = LayoutKind::Row;
  int cols = 1;
  int rows = 1;
};

/// Accepts auto, row, column, grid, cols:N (or grid:N) and template:ROWS, where rows are
/// separated by '/' and cells by ',' (template:0,1/2,1 puts pane 1 across both rows).
[[nodiscard]] common::Result<LayoutSpec> parse_layout(const std::string &value);
[[nodiscard]] std::string layout_name(const LayoutSpec &spec);

/// Stack geometry for `count` streams; nullopt for a single stream, which is only re-encoded.
/// Templates are placed by the compositor and resolve like an automatic grid here.
[[nodiscard]] std::optional<ResolvedLayout> resolve_layout(const LayoutSpec &spec,
                                                           std::size_t count);

} // namespace scenecast::compose

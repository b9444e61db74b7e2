#pragma once

#include "cell.h"
#include <string>
#include <vector>
#include <optional>

namespace nbfacade {

// Human-view text form of a cell list:
//
//   # <<nbfacade:code>>
//   x = 1
//   # <</nbfacade>>
//
// Cells are adjacent, so each cell spans LineCount() + 2 lines.

// Start marker line for a cell kind
NBFACADE_API std::string StartMarker(CellKind kind);

// Kind named by a start marker line, if it is one
NBFACADE_API std::optional<CellKind> ParseStartMarker(const std::string& line);

NBFACADE_API bool IsEndMarker(const std::string& line);

// Total human-view lines of a cell (markers included)
inline int CellSpan(const Cell& cell) { return cell.LineCount() + 2; }

// Render cells to human-view lines
NBFACADE_API std::vector<std::string> CellsToLines(const std::vector<Cell>& cells);

// Parse human-view lines back into cells (identities are freshly minted)
NBFACADE_API std::vector<Cell> LinesToCells(const std::vector<std::string>& lines);

} // namespace nbfacade

#include "SecmonGrid.h"

#include <SecmonLog.h>

namespace secmon {

static void place(int div, int pos, Anchor &anchor, int &offset_pct, double &start) {
  if (pos == 0) {
    anchor = Anchor::Start;
    offset_pct = 0;
    start = 0.0;
  } else if (pos < div - 1) {
    anchor = Anchor::Offset;
    offset_pct = 100 * pos / div;
    start = double(pos) / double(div);
  } else {
    anchor = Anchor::End;
    offset_pct = 0;
    start = 1.0 - 1.0 / double(div);
  }
}

static std::string pos_str(Anchor anchor, int offset_pct) {
  switch (anchor) {
  case Anchor::Start:
    return "+0";
  case Anchor::End:
    return "-0";
  case Anchor::Offset:
    break;
  }
  return "+" + std::to_string(offset_pct) + "%";
}

std::string Geometry::str() const {
  std::string s = std::to_string(widthPct) + "%x" + std::to_string(heightPct) + "%";
  s += pos_str(hAnchor, hOffsetPct);
  s += pos_str(vAnchor, vOffsetPct);
  return s;
}

bool computeDivision(int index, Division &out) {
  if (index < 0) {
    LOGE("GRID", "INVALID_ARGUMENT: division index %d", index);
    return false;
  }
  int col = 1;
  int row = 1;
  while (index != 0) {
    index--;
    if (col <= row) {
      col++;
    } else {
      row++;
    }
  }
  out.columns = col;
  out.rows = row;
  out.tileCount = col * row;
  return true;
}

bool tilePosition(const Division &div, int tile, int &col, int &row) {
  if (div.columns <= 0 || tile < 0 || tile >= div.tileCount) {
    LOGE("GRID", "INVALID_ARGUMENT: tile %d of %d", tile, div.tileCount);
    return false;
  }
  col = tile % div.columns;
  row = tile / div.columns;
  return true;
}

bool geometryOf(int columns, int rows, int col, int row, Geometry &out) {
  if (columns <= 0 || rows <= 0 || col < 0 || row < 0 || col >= columns || row >= rows) {
    LOGE("GRID", "INVALID_ARGUMENT: cell (%d,%d) in %dx%d", col, row, columns, rows);
    return false;
  }

  Geometry g;
  g.widthPct = 100 / columns;
  g.heightPct = 100 / rows;
  g.w = 1.0 / double(columns);
  g.h = 1.0 / double(rows);
  place(columns, col, g.hAnchor, g.hOffsetPct, g.x);
  place(rows, row, g.vAnchor, g.vOffsetPct, g.y);
  out = g;
  return true;
}

bool tileGeometry(const Division &div, int tile, Geometry &out) {
  int col = 0;
  int row = 0;
  if (!tilePosition(div, tile, col, row)) return false;
  return geometryOf(div.columns, div.rows, col, row, out);
}

} // namespace secmon

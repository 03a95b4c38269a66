#ifndef SECMON_GRID_H
#define SECMON_GRID_H

#include <string>

namespace secmon {

// Sample division indices:
//   0 -> 1x1, 1 -> 2x1, 2 -> 2x2, 3 -> 3x2, 4 -> 3x3
// The grid grows columns first, so it suits a screen that is wide rather than tall.
struct Division {
  int columns = 1;
  int rows = 1;
  int tileCount = 1;
};

enum class Anchor { Start, Offset, End };

struct Geometry {
  int widthPct = 0;
  int heightPct = 0;
  Anchor hAnchor = Anchor::Start;
  int hOffsetPct = 0;
  Anchor vAnchor = Anchor::Start;
  int vOffsetPct = 0;

  // Exact placement as fractions of the screen.
  double x = 0, y = 0, w = 0, h = 0;

  // mpv style geometry, e.g. "50%x100%+0+0" or "33%x50%+33%-0".
  std::string str() const;
};

bool computeDivision(int index, Division &out);
bool tilePosition(const Division &div, int tile, int &col, int &row);
bool geometryOf(int columns, int rows, int col, int row, Geometry &out);
bool tileGeometry(const Division &div, int tile, Geometry &out);

} // namespace secmon

#endif

#include "WorldGrid.h"
#include <algorithm>
#include <stdexcept>

WorldGrid::WorldGrid(int width, int height, CellType fill)
    : m_Width(width), m_Height(height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("WorldGrid dimensions must be positive, got " +
                                std::to_string(width) + "x" +
                                std::to_string(height));
  }
  m_Cells.assign(width * height, fill);
  m_AshAge.assign(width * height, 0.0f);
  m_AshShade.assign(width * height, 0);
}

void WorldGrid::Set(int x, int y, CellType type) {
  int i = Index(x, y);
  if (type == FIRE && m_Cells[i] != FIRE)
    m_AshAge[i] = 0.0f;
  m_Cells[i] = type;
}

void WorldGrid::Ignite(int x, int y) {
  int i = Index(x, y);
  m_Cells[i] = FIRE;
  m_AshAge[i] = 0.0f;
}

void WorldGrid::BurnOut(int x, int y, uint8_t ashShade) {
  int i = Index(x, y);
  m_Cells[i] = BURNT;
  m_AshAge[i] = 0.0f;
  m_AshShade[i] = ashShade;
}

int WorldGrid::Count(CellType type) const {
  return (int)std::count(m_Cells.begin(), m_Cells.end(), type);
}

int WorldGrid::CountIgnitable() const {
  return (int)std::count_if(m_Cells.begin(), m_Cells.end(),
                            [](CellType t) { return IsIgnitable(t); });
}

std::string WorldGrid::ToAscii() const {
  std::string out;
  out.reserve((m_Width + 1) * m_Height);
  for (int y = 0; y < m_Height; ++y) {
    for (int x = 0; x < m_Width; ++x)
      out.push_back(GetCellGlyph(Get(x, y)));
    out.push_back('\n');
  }
  return out;
}

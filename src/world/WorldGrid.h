#ifndef WORLD_GRID_H
#define WORLD_GRID_H

#include "Cell.h"
#include <cstdint>
#include <glm/glm.hpp>
#include <string>
#include <vector>

// Offsets of the 8-neighborhood, row-major around the center
constexpr int NEIGHBOR_OFFSETS[8][2] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                                        {1, 0},   {-1, 1}, {0, 1},  {1, 1}};

// Canonical simulation state: one classification, one ash-age counter and
// one ash shade per cell. Dimensions are fixed at construction.
class WorldGrid {
public:
  WorldGrid(int width, int height, CellType fill = FOREST_DENSE);

  int Width() const { return m_Width; }
  int Height() const { return m_Height; }
  glm::ivec2 Dimensions() const { return {m_Width, m_Height}; }
  int CellCount() const { return m_Width * m_Height; }

  bool InBounds(int x, int y) const {
    return x >= 0 && x < m_Width && y >= 0 && y < m_Height;
  }
  int Index(int x, int y) const { return y * m_Width + x; }
  glm::ivec2 Coord(int index) const {
    return {index % m_Width, index / m_Width};
  }

  CellType Get(int x, int y) const { return m_Cells[Index(x, y)]; }
  float GetAshAge(int x, int y) const { return m_AshAge[Index(x, y)]; }
  // 0 until the cell has burnt out
  uint8_t GetAshShade(int x, int y) const { return m_AshShade[Index(x, y)]; }

  // Plain classification write used by terrain generation. Writing FIRE
  // starts a fresh ash-age counter.
  void Set(int x, int y, CellType type);

  // Fire lifecycle
  void Ignite(int x, int y);
  void AgeFire(int x, int y, float frames) { m_AshAge[Index(x, y)] += frames; }
  void BurnOut(int x, int y, uint8_t ashShade);

  template <typename Fn> void ForEachCell(Fn &&fn) const {
    for (int y = 0; y < m_Height; ++y)
      for (int x = 0; x < m_Width; ++x)
        fn(x, y, m_Cells[Index(x, y)]);
  }

  // Visits the in-grid 8-neighbors of (x, y)
  template <typename Fn> void ForEachNeighbor(int x, int y, Fn &&fn) const {
    for (const auto &offset : NEIGHBOR_OFFSETS) {
      int nx = x + offset[0];
      int ny = y + offset[1];
      if (InBounds(nx, ny))
        fn(nx, ny, m_Cells[Index(nx, ny)]);
    }
  }

  int Count(CellType type) const;
  int CountIgnitable() const;

  const std::vector<CellType> &GetCells() const { return m_Cells; }

  // One text row per grid row, see GetCellGlyph
  std::string ToAscii() const;

private:
  int m_Width;
  int m_Height;
  std::vector<CellType> m_Cells;
  std::vector<float> m_AshAge;
  std::vector<uint8_t> m_AshShade;
};

#endif

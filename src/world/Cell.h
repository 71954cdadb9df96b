#ifndef CELL_H
#define CELL_H

#include <cstdint>

// Cell classification. Values double as the grid's storage format.
enum CellType : uint8_t {
  FOREST_DENSE = 0,
  FOREST_LIGHT = 1,
  GRASSLAND = 2,
  FIELD = 3,
  HOUSE = 4,
  WATER = 5,
  BURNT = 6,
  FIRE = 7,
  CONTROLLED_BURN = 8
};

constexpr int CELL_TYPE_COUNT = 9;

inline float GetFlammability(CellType type) {
  switch (type) {
  case FOREST_DENSE:
    return 0.8f;
  case FOREST_LIGHT:
    return 0.6f;
  case GRASSLAND:
    return 0.4f;
  case FIELD:
    return 0.3f;
  case HOUSE:
    return 0.9f;
  case FIRE:
  case CONTROLLED_BURN:
    return 1.0f;
  case WATER:
  case BURNT:
  default:
    return 0.0f;
  }
}

// Fire, ash, active counter-burns and water can never be (re)ignited
inline bool IsIgnitable(CellType type) {
  return type != FIRE && type != BURNT && type != CONTROLLED_BURN &&
         type != WATER;
}

inline const char *GetCellName(CellType type) {
  switch (type) {
  case FOREST_DENSE:
    return "Dense Forest";
  case FOREST_LIGHT:
    return "Light Forest";
  case GRASSLAND:
    return "Grassland";
  case FIELD:
    return "Field";
  case HOUSE:
    return "House";
  case WATER:
    return "Water";
  case BURNT:
    return "Burnt";
  case FIRE:
    return "Fire";
  case CONTROLLED_BURN:
    return "Controlled Burn";
  }
  return "Unknown";
}

// Single character used by the ASCII map dump
inline char GetCellGlyph(CellType type) {
  switch (type) {
  case FOREST_DENSE:
    return 'T';
  case FOREST_LIGHT:
    return 't';
  case GRASSLAND:
    return ',';
  case FIELD:
    return '.';
  case HOUSE:
    return 'H';
  case WATER:
    return '~';
  case BURNT:
    return '#';
  case FIRE:
    return '*';
  case CONTROLLED_BURN:
    return '+';
  }
  return '?';
}

#endif

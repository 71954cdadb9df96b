#ifndef COMPONENTS_H
#define COMPONENTS_H

#include <glm/glm.hpp>

enum class PropKind { Tree, FieldGrass, House };

enum class PropState { Normal, Burning, Burnt };

// Billboarded decoration standing on one grid cell
struct PropComponent {
  PropKind kind;
  glm::ivec2 cell;
  glm::vec3 position; // World space, grid centered on the origin
  glm::vec2 size;     // Width, height
};

struct PropStateComponent {
  PropState state = PropState::Normal;
  int frame = 0; // Trees: 0 normal, 1-3 burning, 4 burnt
  float animationTimer = 0.0f;
};

#endif

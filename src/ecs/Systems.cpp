#include "Systems.h"
#include "../debug/Logger.h"
#include "../utils/MathUtils.h"
#include "Components.h"
#include <vector>

static glm::vec3 CellToWorld(const WorldGrid &grid, int x, int y, float ox,
                             float oz) {
  return {x - grid.Width() / 2.0f + 0.5f + ox, 0.0f,
          y - grid.Height() / 2.0f + 0.5f + oz};
}

static void SpawnProp(entt::registry &registry, PropKind kind, int x, int y,
                      glm::vec3 position, glm::vec2 size) {
  auto entity = registry.create();
  registry.emplace<PropComponent>(entity, kind, glm::ivec2(x, y), position,
                                  size);
  registry.emplace<PropStateComponent>(entity);
}

void PropPlacementSystem::Place(entt::registry &registry,
                                const WorldGrid &grid, float treeDensity,
                                std::mt19937 &rng) {
  registry.clear();

  int trees = 0, grass = 0, houses = 0;
  grid.ForEachCell([&](int x, int y, CellType type) {
    switch (type) {
    case FOREST_LIGHT:
      // Not every light forest cell gets a tree
      if (MathUtils::Chance(rng, treeDensity)) {
        float ox = MathUtils::SampleUniform(rng, -0.3f, 0.3f);
        float oz = MathUtils::SampleUniform(rng, -0.3f, 0.3f);
        SpawnProp(registry, PropKind::Tree, x, y,
                  CellToWorld(grid, x, y, ox, oz), {2.5f, 3.5f});
        ++trees;
      }
      break;
    case FIELD:
      // Every second field cell, checkerboard
      if ((x + y) % 2 == 0) {
        int count = MathUtils::RandomInt(rng, 1, 2);
        for (int i = 0; i < count; ++i) {
          float ox = MathUtils::SampleUniform(rng, -0.4f, 0.4f);
          float oz = MathUtils::SampleUniform(rng, -0.4f, 0.4f);
          SpawnProp(registry, PropKind::FieldGrass, x, y,
                    CellToWorld(grid, x, y, ox, oz), {0.8f, 0.8f});
          ++grass;
        }
      }
      break;
    case HOUSE:
      SpawnProp(registry, PropKind::House, x, y,
                CellToWorld(grid, x, y, 0.0f, 0.0f), {1.8f, 1.8f});
      ++houses;
      break;
    default:
      break;
    }
  });

  LOG_WORLD_TRACE("Placed {} trees, {} grass sprites, {} houses", trees, grass,
                  houses);
}

void PropAnimationSystem::Update(entt::registry &registry,
                                 const WorldGrid &grid, float frames) {
  std::vector<entt::entity> despawn;

  auto view = registry.view<PropComponent, PropStateComponent>();
  for (auto entity : view) {
    auto &prop = view.get<PropComponent>(entity);
    auto &state = view.get<PropStateComponent>(entity);
    CellType ground = grid.Get(prop.cell.x, prop.cell.y);
    bool onFire = ground == FIRE;
    bool burnt = ground == BURNT;

    switch (prop.kind) {
    case PropKind::Tree:
      if (state.state == PropState::Normal && onFire) {
        state.state = PropState::Burning;
        state.animationTimer = 0.0f;
        state.frame = TREE_FRAME_BURNING_FIRST;
      } else if (state.state == PropState::Burning) {
        state.animationTimer += frames;
        if (state.animationTimer >= TREE_FRAME_DURATION) {
          state.animationTimer = 0.0f;
          if (state.frame < TREE_FRAME_BURNING_LAST)
            ++state.frame;
        }
        if (burnt) {
          state.state = PropState::Burnt;
          state.frame = TREE_FRAME_BURNT;
        }
      } else if (state.state != PropState::Burnt && burnt) {
        state.state = PropState::Burnt;
        state.frame = TREE_FRAME_BURNT;
      }
      break;
    case PropKind::FieldGrass:
      if (onFire || burnt)
        despawn.push_back(entity);
      break;
    case PropKind::House:
      // Once burnt a house stays burnt
      if (onFire || burnt)
        state.state = PropState::Burnt;
      break;
    }
  }

  registry.destroy(despawn.begin(), despawn.end());
}

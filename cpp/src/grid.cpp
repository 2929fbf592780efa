#include "grid.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace resil {

namespace {

size_t checked_cell_count(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("grid dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<size_t>(width) * height;
}

}  // namespace

GridEnvironment::GridEnvironment(int width, int height)
    : width_(width),
      height_(height),
      static_energy_(checked_cell_count(width, height), 0.0),
      dynamic_energy_(static_energy_.size(), 0.0),
      waste_(static_energy_.size(), 0.0) {}

int GridEnvironment::index(int x, int y) const {
    return y * width_ + x;
}

std::vector<double>& GridEnvironment::layer_mut(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::STATIC: return static_energy_;
        case ResourceKind::DYNAMIC: return dynamic_energy_;
        case ResourceKind::WASTE: break;
    }
    return waste_;
}

const std::vector<double>& GridEnvironment::layer(ResourceKind kind) const {
    switch (kind) {
        case ResourceKind::STATIC: return static_energy_;
        case ResourceKind::DYNAMIC: return dynamic_energy_;
        case ResourceKind::WASTE: break;
    }
    return waste_;
}

double GridEnvironment::at(ResourceKind kind, int x, int y) const {
    return layer(kind)[index(x, y)];
}

void GridEnvironment::adjust(ResourceKind kind, int x, int y, double delta) {
    layer_mut(kind)[index(x, y)] += delta;
}

void GridEnvironment::set(ResourceKind kind, int x, int y, double value) {
    layer_mut(kind)[index(x, y)] = value;
}

Position GridEnvironment::wrap(int x, int y) const {
    return Position{
        ((x % width_) + width_) % width_,
        ((y % height_) + height_) % height_
    };
}

Position GridEnvironment::offset(Position pos, int dx, int dy) const {
    return wrap(pos.x + dx, pos.y + dy);
}

std::vector<Position> GridEnvironment::neighbors(int x, int y, int radius) const {
    std::vector<Position> result;
    Position center = wrap(x, y);
    for (int dy = -radius; dy <= radius; dy++) {
        for (int dx = -radius; dx <= radius; dx++) {
            if (dx == 0 && dy == 0) continue;
            Position p = offset(center, dx, dy);
            // Narrow grids fold several offsets onto the same cell
            if (p == center) continue;
            if (std::find(result.begin(), result.end(), p) != result.end()) continue;
            result.push_back(p);
        }
    }
    return result;
}

void GridEnvironment::fill_uniform(double total_energy, double static_share) {
    double per_cell = total_energy / static_cast<double>(static_energy_.size());
    std::fill(static_energy_.begin(), static_energy_.end(), per_cell * static_share);
    std::fill(dynamic_energy_.begin(), dynamic_energy_.end(), per_cell * (1.0 - static_share));
    std::fill(waste_.begin(), waste_.end(), 0.0);
}

double GridEnvironment::sum(ResourceKind kind) const {
    const auto& values = layer(kind);
    return std::accumulate(values.begin(), values.end(), 0.0);
}

}  // namespace resil

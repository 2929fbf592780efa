#pragma once

#include "types.hpp"
#include <vector>

namespace resil {

// Three same-shaped layers over a periodic width x height grid.
// adjust() is plain arithmetic: callers keep cells non-negative.
// Throws std::invalid_argument for non-positive dimensions.
class GridEnvironment {
public:
    GridEnvironment(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    double at(ResourceKind kind, int x, int y) const;
    void adjust(ResourceKind kind, int x, int y, double delta);
    void set(ResourceKind kind, int x, int y, double value);

    Position wrap(int x, int y) const;
    Position offset(Position pos, int dx, int dy) const;
    std::vector<Position> neighbors(int x, int y, int radius = 1) const;

    void fill_uniform(double total_energy, double static_share);

    double sum(ResourceKind kind) const;
    const std::vector<double>& layer(ResourceKind kind) const;

private:
    int width_;
    int height_;
    std::vector<double> static_energy_;   // Row-major: [y * width + x]
    std::vector<double> dynamic_energy_;
    std::vector<double> waste_;

    std::vector<double>& layer_mut(ResourceKind kind);
    int index(int x, int y) const;
};

}  // namespace resil

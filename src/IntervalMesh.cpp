#include "IntervalMesh.hpp"
#include <algorithm>
#include <stdexcept>

namespace GOAS {

IntervalMesh::IntervalMesh(PetscReal a, PetscReal b, PetscInt n) {
    if (n < 1) {
        throw std::invalid_argument("IntervalMesh: at least one cell is required");
    }
    if (!(b > a)) {
        throw std::invalid_argument("IntervalMesh: upper bound must exceed lower bound");
    }

    vertices_.resize(n + 1);
    const PetscReal h = (b - a) / n;
    for (PetscInt i = 0; i <= n; i++) {
        vertices_[i] = a + i * h;
    }
    vertices_[n] = b;
    levels_.assign(n, 0);
}

IntervalMesh::IntervalMesh(std::vector<PetscReal> vertices, std::vector<PetscInt> levels)
    : vertices_(std::move(vertices)), levels_(std::move(levels)) {
    if (vertices_.size() < 2) {
        throw std::invalid_argument("IntervalMesh: at least two vertices are required");
    }
    for (size_t i = 1; i < vertices_.size(); i++) {
        if (!(vertices_[i] > vertices_[i - 1])) {
            throw std::invalid_argument("IntervalMesh: vertices must be strictly increasing");
        }
    }
    if (levels_.empty()) {
        levels_.assign(vertices_.size() - 1, 0);
    } else if (levels_.size() != vertices_.size() - 1) {
        throw std::invalid_argument("IntervalMesh: one level per cell is required");
    }
}

CellGeometry IntervalMesh::cell(PetscInt c) const {
    CellGeometry geom;
    geom.index = c;
    geom.x0 = vertices_[c];
    geom.x1 = vertices_[c + 1];
    geom.h = geom.x1 - geom.x0;
    geom.level = levels_[c];
    return geom;
}

PetscReal IntervalMesh::minCellSize() const {
    PetscReal hmin = PETSC_MAX_REAL;
    for (PetscInt c = 0; c < numCells(); c++) {
        hmin = std::min(hmin, vertices_[c + 1] - vertices_[c]);
    }
    return hmin;
}

PetscReal IntervalMesh::maxCellSize() const {
    PetscReal hmax = 0.0;
    for (PetscInt c = 0; c < numCells(); c++) {
        hmax = std::max(hmax, vertices_[c + 1] - vertices_[c]);
    }
    return hmax;
}

PetscInt IntervalMesh::maxLevel() const {
    return *std::max_element(levels_.begin(), levels_.end());
}

PetscInt IntervalMesh::findCell(PetscReal x) const {
    if (x <= vertices_.front()) return 0;
    if (x >= vertices_.back()) return numCells() - 1;

    auto it = std::upper_bound(vertices_.begin(), vertices_.end(), x);
    return static_cast<PetscInt>(it - vertices_.begin()) - 1;
}

IntervalMesh IntervalMesh::bisect(const std::vector<bool>& split) const {
    if (static_cast<PetscInt>(split.size()) != numCells()) {
        throw std::invalid_argument("IntervalMesh::bisect: one flag per cell is required");
    }

    std::vector<PetscReal> vertices;
    std::vector<PetscInt> levels;
    vertices.reserve(vertices_.size() * 2);
    levels.reserve(levels_.size() * 2);

    vertices.push_back(vertices_.front());
    for (PetscInt c = 0; c < numCells(); c++) {
        if (split[c]) {
            vertices.push_back(0.5 * (vertices_[c] + vertices_[c + 1]));
            levels.push_back(levels_[c] + 1);
            levels.push_back(levels_[c] + 1);
        } else {
            levels.push_back(levels_[c]);
        }
        vertices.push_back(vertices_[c + 1]);
    }

    return IntervalMesh(std::move(vertices), std::move(levels));
}

} // namespace GOAS

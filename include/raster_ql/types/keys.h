#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace raster_ql {

// Grid position of a tile within a layer's layout. Row 0 is the top row.
struct SpatialKey {
    int32_t col = 0;
    int32_t row = 0;

    bool operator==(const SpatialKey& other) const = default;
    std::string ToString() const;
};

// Instant of a tile in epoch milliseconds
struct TemporalKey {
    int64_t instant = 0;

    bool operator==(const TemporalKey& other) const = default;
    std::string ToString() const;
};

// Composite key of space-time layers
struct SpaceTimeKey {
    int32_t col = 0;
    int32_t row = 0;
    int64_t instant = 0;

    static SpaceTimeKey Make(const SpatialKey& spatial, const TemporalKey& temporal) {
        return SpaceTimeKey{spatial.col, spatial.row, temporal.instant};
    }

    SpatialKey SpatialComponent() const { return SpatialKey{col, row}; }
    TemporalKey TemporalComponent() const { return TemporalKey{instant}; }

    bool operator==(const SpaceTimeKey& other) const = default;
    std::string ToString() const;
};

// Key of a stored tile, one alternative per key variant
using LayerKey = std::variant<SpatialKey, SpaceTimeKey>;

SpatialKey SpatialComponent(const LayerKey& key);

// nullopt for spatial-only keys
std::optional<TemporalKey> TemporalComponent(const LayerKey& key);

std::string KeyToString(const LayerKey& key);

/**
 * @brief Inclusive rectangle of grid cells
 *
 * A bounds object whose min exceeds its max on either axis is empty and
 * contains no key.
 */
struct GridBounds {
    int32_t col_min = 0;
    int32_t row_min = 0;
    int32_t col_max = -1;
    int32_t row_max = -1;

    bool IsEmpty() const { return col_min > col_max || row_min > row_max; }

    bool Contains(const SpatialKey& key) const {
        return key.col >= col_min && key.col <= col_max &&
               key.row >= row_min && key.row <= row_max;
    }

    // Cells shared by both bounds (possibly empty)
    GridBounds Intersect(const GridBounds& other) const;

    int64_t Size() const;

    bool operator==(const GridBounds& other) const = default;
    std::string ToString() const;
};

template <typename K>
struct KeyBounds {
    K min_key;
    K max_key;

    bool operator==(const KeyBounds& other) const = default;
};

} // namespace raster_ql

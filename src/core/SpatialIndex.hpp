/**
 * @file SpatialIndex.hpp
 * @brief Bounding-box index over dense ids, backed by GDAL's CPLQuadTree
 */

#pragma once

#include "hexmosaic.hpp"

#include <cpl_quad_tree.h>

#include <memory>
#include <vector>

namespace hexmosaic {

class SpatialIndex {
public:
    SpatialIndex() = default;

    /**
     * @brief Build the index; the id of each box is its position
     */
    explicit SpatialIndex(const std::vector<BoundingBox>& boxes);

    ~SpatialIndex();

    SpatialIndex(SpatialIndex&& other) noexcept;
    SpatialIndex& operator=(SpatialIndex&& other) noexcept;
    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /**
     * @brief Ids whose boxes intersect the query box, in ascending order
     */
    std::vector<size_t> query(const BoundingBox& area) const;

    size_t size() const { return count_; }

private:
    struct Entry {
        size_t id;
        CPLRectObj bounds;
    };

    static void get_bounds(const void* feature, CPLRectObj* bounds);
    void release();

    std::unique_ptr<Entry[]> entries_;
    size_t count_ = 0;
    CPLQuadTree* tree_ = nullptr;
};

} // namespace hexmosaic

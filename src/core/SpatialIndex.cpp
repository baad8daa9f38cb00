/**
 * @file SpatialIndex.cpp
 * @brief CPLQuadTree wrapper
 */

#include "SpatialIndex.hpp"

#include <cpl_conv.h>

#include <algorithm>
#include <limits>

namespace hexmosaic {

SpatialIndex::SpatialIndex(const std::vector<BoundingBox>& boxes)
    : entries_(new Entry[boxes.size()]), count_(boxes.size()) {
    if (boxes.empty()) {
        return;
    }

    CPLRectObj global;
    global.minx = std::numeric_limits<double>::max();
    global.miny = std::numeric_limits<double>::max();
    global.maxx = std::numeric_limits<double>::lowest();
    global.maxy = std::numeric_limits<double>::lowest();

    for (size_t i = 0; i < boxes.size(); ++i) {
        Entry& entry = entries_[i];
        entry.id = i;
        entry.bounds.minx = boxes[i].min_x;
        entry.bounds.miny = boxes[i].min_y;
        entry.bounds.maxx = boxes[i].max_x;
        entry.bounds.maxy = boxes[i].max_y;

        global.minx = std::min(global.minx, boxes[i].min_x);
        global.miny = std::min(global.miny, boxes[i].min_y);
        global.maxx = std::max(global.maxx, boxes[i].max_x);
        global.maxy = std::max(global.maxy, boxes[i].max_y);
    }

    tree_ = CPLQuadTreeCreate(&global, &SpatialIndex::get_bounds);
    CPLQuadTreeSetMaxDepth(tree_, CPLQuadTreeGetAdvisedMaxDepth(static_cast<int>(count_)));
    for (size_t i = 0; i < count_; ++i) {
        CPLQuadTreeInsert(tree_, &entries_[i]);
    }
}

SpatialIndex::~SpatialIndex() {
    release();
}

SpatialIndex::SpatialIndex(SpatialIndex&& other) noexcept
    : entries_(std::move(other.entries_)), count_(other.count_), tree_(other.tree_) {
    other.count_ = 0;
    other.tree_ = nullptr;
}

SpatialIndex& SpatialIndex::operator=(SpatialIndex&& other) noexcept {
    if (this != &other) {
        release();
        entries_ = std::move(other.entries_);
        count_ = other.count_;
        tree_ = other.tree_;
        other.count_ = 0;
        other.tree_ = nullptr;
    }
    return *this;
}

void SpatialIndex::release() {
    if (tree_) {
        CPLQuadTreeDestroy(tree_);
        tree_ = nullptr;
    }
}

void SpatialIndex::get_bounds(const void* feature, CPLRectObj* bounds) {
    *bounds = static_cast<const Entry*>(feature)->bounds;
}

std::vector<size_t> SpatialIndex::query(const BoundingBox& area) const {
    std::vector<size_t> ids;
    if (!tree_) {
        return ids;
    }

    CPLRectObj aoi;
    aoi.minx = area.min_x;
    aoi.miny = area.min_y;
    aoi.maxx = area.max_x;
    aoi.maxy = area.max_y;

    int found = 0;
    void** hits = CPLQuadTreeSearch(tree_, &aoi, &found);
    ids.reserve(static_cast<size_t>(found));
    for (int i = 0; i < found; ++i) {
        ids.push_back(static_cast<const Entry*>(hits[i])->id);
    }
    CPLFree(hits);

    // Tree traversal order depends on insertion history; callers need id order
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace hexmosaic

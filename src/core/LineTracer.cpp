/**
 * @file LineTracer.cpp
 * @brief Hex paths for line class features
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "LineTracer.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace hexmosaic {

LineTracer::LineTracer(const ClassProfile& profile, const ParallelExecutor& executor)
    : profile_(profile), executor_(executor), logger_("LineTracer") {
}

double LineTracer::step_length(const Tessellation& tessellation, size_t class_index) const {
    const double edge = tessellation.layout().edge_length();
    double step = 0.25 * edge;
    if (const auto* line = std::get_if<LineClass>(&profile_.class_at(class_index).kind)) {
        if (line->trace_step) {
            step = *line->trace_step;
        }
    }
    return std::max(step, 0.01 * edge);
}

std::vector<AxialCoord> LineTracer::walk(const HexLayout& layout, const LineData& line, double step) const {
    std::vector<AxialCoord> cells;

    auto visit = [&](const AxialCoord& cell) {
        if (cells.empty()) {
            cells.push_back(cell);
            return;
        }
        if (cell == cells.back()) {
            return;
        }
        if (HexLayout::distance(cells.back(), cell) > 1) {
            std::vector<AxialCoord> bridge = HexLayout::line_between(cells.back(), cell);
            cells.insert(cells.end(), bridge.begin() + 1, bridge.end());
        } else {
            cells.push_back(cell);
        }
    };

    for (size_t i = 0; i + 1 < line.points.size(); ++i) {
        const Point2D& a = line.points[i];
        const Point2D& b = line.points[i + 1];
        const double dx = b.x() - a.x();
        const double dy = b.y() - a.y();
        const size_t samples = std::max<size_t>(1, static_cast<size_t>(std::ceil(std::hypot(dx, dy) / step)));
        for (size_t k = 0; k <= samples; ++k) {
            const double t = static_cast<double>(k) / static_cast<double>(samples);
            visit(layout.locate(Point2D(a.x() + dx * t, a.y() + dy * t)));
        }
    }
    return cells;
}

TracedLine LineTracer::trace(const Tessellation& tessellation, const SampledLine& line) const {
    TracedLine traced;
    traced.class_index = line.class_index;
    traced.feature_id = line.feature_id;
    traced.snap = std::get<LineClass>(profile_.class_at(line.class_index).kind).snap;

    const double step = step_length(tessellation, line.class_index);
    std::set<EdgeId> seen_edges;

    for (const auto& part : line.lines) {
        if (part.empty()) continue;

        // Runs of consecutive cells inside the tessellation
        std::vector<std::vector<TileId>> runs(1);
        for (const AxialCoord& cell : walk(tessellation.layout(), part, step)) {
            auto id = tessellation.find(cell);
            if (!id) {
                if (!runs.back().empty()) runs.emplace_back();
                continue;
            }
            runs.back().push_back(*id);
            if (traced.tiles.empty() || traced.tiles.back() != *id) {
                traced.tiles.push_back(*id);
            }
        }

        for (const auto& run : runs) {
            if (run.size() < 2) continue;

            if (traced.snap == LineSnap::CENTERLINE) {
                LineData path;
                for (TileId id : run) {
                    path.points.push_back(tessellation.tile(id).centroid);
                }
                traced.paths.push_back(std::move(path));
                continue;
            }

            for (size_t i = 0; i + 1 < run.size(); ++i) {
                const HexTile& from = tessellation.tile(run[i]);
                const int direction = HexLayout::direction_to(from.axial, tessellation.tile(run[i + 1]).axial);
                if (direction < 0) continue;
                const EdgeId edge_id = from.edges[static_cast<size_t>(direction)];
                if (!seen_edges.insert(edge_id).second) continue;

                const HexEdge& edge = tessellation.edges()[edge_id];
                LineData segment;
                segment.points.push_back(tessellation.vertices()[edge.from].position);
                segment.points.push_back(tessellation.vertices()[edge.to].position);
                traced.edges.push_back(edge_id);
                traced.paths.push_back(std::move(segment));
            }
        }
    }
    return traced;
}

std::vector<TracedLine> LineTracer::trace_all(const Tessellation& tessellation,
                                              const std::vector<SampledLine>& lines,
                                              const CancellationToken* cancel) const {
    std::vector<TracedLine> traced(lines.size());
    executor_.for_each(lines.size(), Phase::SAMPLING, cancel, nullptr, [&](size_t i) {
        traced[i] = trace(tessellation, lines[i]);
    });

    std::vector<TracedLine> kept;
    for (auto& line : traced) {
        if (!line.empty()) {
            kept.push_back(std::move(line));
        }
    }
    logger_.detailed("Traced " + std::to_string(kept.size()) + " of " + std::to_string(lines.size()) +
                     " line features onto the tessellation");
    return kept;
}

} // namespace hexmosaic

/**
 * @file main.cpp
 * @brief Main entry point for the hexmosaic command-line tool
 *
 * Loads the boundary, elevation raster and feature sources with GDAL/OGR,
 * runs the classification engine and writes the audit and summary files.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hexmosaic.hpp"
#include "HexMosaicError.hpp"
#include "ClassProfile.hpp"
#include "core/HexMosaicEngine.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include "export/AuditExporter.hpp"
#include "io/JsonFileAttributeStore.hpp"
#include "io/RasterLoader.hpp"
#include "io/VectorLoader.hpp"
#include <algorithm>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <limits>
#include <memory>

using namespace hexmosaic;

namespace {

// Set from the SIGINT handler; the engine checks it between tiles
CancellationToken g_cancel;

extern "C" void interrupt_handler(int) {
    g_cancel.request_cancel();
}

/**
 * @brief Print run summary
 */
void print_summary(const RunSummary& summary) {
    std::cout << "\n=== Run Summary ===\n";
    std::cout << "Mode: " << to_string(summary.mode) << "\n";
    std::cout << "Tiles: " << summary.tile_count << "\n";
    for (const auto& [label, count] : summary.class_counts) {
        std::cout << "  " << std::left << std::setw(16) << label << count << "\n";
    }
    std::cout << "Confidence histogram:";
    for (size_t count : summary.confidence_histogram) {
        std::cout << " " << count;
    }
    std::cout << "\n";
    std::cout << "Reassigned by cleanup: " << summary.reassignments.size()
              << " (" << summary.cleanup_passes << " passes"
              << (summary.cleanup_converged ? "" : ", not converged") << ")\n";
    std::cout << "Without elevation: " << summary.tiles_without_elevation << "\n";
    std::cout << "Mixed: " << summary.mixed_tiles << ", Unknown: " << summary.unknown_tiles << "\n";
    if (!summary.ignored_sources.empty()) {
        std::cout << "Ignored sources:\n";
        for (const auto& source : summary.ignored_sources) {
            std::cout << "  " << source.source << " (" << source.class_label << "): " << source.reason << "\n";
        }
    }
    if (!summary.warnings.empty()) {
        std::cout << "Warnings: " << summary.warnings.size() << "\n";
    }
    std::cout << "Elapsed: " << std::fixed << std::setprecision(2) << summary.elapsed_seconds << "s\n";
    std::cout << "===================\n";
}

} // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.has_error() ? 2 : 0;  // Help, version or usage error
    }

    const RunRequest& request = cli.get_request();

    Logger::setDefaultLevel(static_cast<LogLevel>(request.config.log_level));
    if (!request.log_config.empty()) {
        Logger::parseLogConfig(request.log_config);
    }

    // Facility output is mirrored to the log file through the process-wide sink
    std::shared_ptr<std::ofstream> log_stream;
    if (request.config.log_file) {
        log_stream = std::make_shared<std::ofstream>(*request.config.log_file, std::ios::app);
        if (!log_stream->is_open()) {
            std::cerr << "Cannot open log file: " << *request.config.log_file << std::endl;
            return 2;
        }
        Logger::setSink([log_stream](LogLevel level, const std::string& facility, const std::string& message) {
            if (level > Logger::getFacilityLevel(facility)) return;
            *log_stream << "[" << to_string(level) << "] "
                        << (facility.empty() ? "" : facility + ": ") << message << std::endl;
        });
    }

    cli.print_config();

    try {
        ClassProfile profile = ClassProfile::load_file(request.profile_path);

        VectorLoader vector_loader;
        BoundaryInput boundary = vector_loader.load_boundary(request.boundary_path, request.boundary_layer);

        RunInputs inputs;
        inputs.boundary = boundary.boundary;
        inputs.crs = boundary.crs;

        for (const auto& spec : request.sources) {
            inputs.sources.push_back(vector_loader.open_source(spec.path, spec.class_label, std::nullopt,
                                                               spec.layer, boundary.crs));
        }

        if (request.raster_path) {
            // Read only the pixels under the boundary, with a one-hex margin
            BoundingBox window(std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                               std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest());
            for (const auto& point : inputs.boundary.exterior()) {
                window.min_x = std::min(window.min_x, point.x());
                window.min_y = std::min(window.min_y, point.y());
                window.max_x = std::max(window.max_x, point.x());
                window.max_y = std::max(window.max_y, point.y());
            }
            RasterLoader raster_loader;
            inputs.raster = raster_loader.load(*request.raster_path,
                                               window.expanded(request.config.tessellation.hex_edge_length));
        }

        std::unique_ptr<JsonFileAttributeStore> store;
        if (request.store_path) {
            store = std::make_unique<JsonFileAttributeStore>(*request.store_path);
            inputs.store = store.get();
        }

        if (cli.is_dry_run()) {
            std::cout << "Dry run mode - inputs loaded and configuration validated successfully\n";
            return 0;
        }

        std::signal(SIGINT, interrupt_handler);

        Logger progress_logger("Progress");
        ProgressCallback progress = [&progress_logger](const ProgressEvent& event) {
            if (event.tiles_total == 0) return;
            const size_t percent = event.tiles_processed * 100 / event.tiles_total;
            if (percent % 10 == 0 || event.tiles_processed == event.tiles_total) {
                progress_logger.detailed(std::string(to_string(event.phase)) + ": " +
                                         std::to_string(event.tiles_processed) + "/" +
                                         std::to_string(event.tiles_total) + " tiles");
            }
        };

        HexMosaicEngine engine(request.config, profile);
        RunOutcome outcome = engine.run(inputs, &g_cancel, progress);

        std::signal(SIGINT, SIG_DFL);

        AuditExporter::Options options;
        options.include_edges = request.include_edges;
        options.crs = outcome.tessellation->crs();
        AuditExporter exporter(options);
        bool exported = exporter.export_audit(*outcome.tessellation, outcome.artifact, request.audit_path);
        exported = exporter.export_summary(outcome.summary, request.summary_path) && exported;
        if (request.lines_path) {
            exported = exporter.export_line_paths(*outcome.tessellation, outcome.line_paths, profile,
                                                  *request.lines_path) && exported;
        }

        if (request.config.log_level >= 3) {
            print_summary(outcome.summary);
        }

        if (!exported) {
            std::cerr << "Error: could not write output files\n";
            return 1;
        }
        return 0;

    } catch (const HexMosaicError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return e.kind() == ErrorKind::CANCELLED ? 130 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

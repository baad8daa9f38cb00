/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the hexmosaic tool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace hexmosaic {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long and -short options, --option=value, boolean flags and
 * options that may be given more than once.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        bool repeatable;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true), repeatable(false) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "",
               bool repeatable = false)
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), repeatable(repeatable),
              default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        register_name(long_name, short_name);
    }

    void add_repeatable_option(const std::string& long_name, const std::string& short_name,
                               const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, true, "", true);
        register_name(long_name, short_name);
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        register_name(long_name, short_name);
    }

    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        repeated_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        // Store all arguments
        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    store(option, value);
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    store(option, args_[++i]);
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /**
     * @brief Every value of a repeatable option, in command-line order
     */
    std::vector<std::string> get_all(const std::string& option_name) const {
        auto it = repeated_values_.find(option_name);
        if (it != repeated_values_.end()) {
            return it->second;
        }
        return {};
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << "HEXMOSAIC - Hex tessellation and terrain classification\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --profile PROFILE.json --boundary AOI.gpkg [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --config RUN.cfg\n\n";

        std::cout << "INPUTS:\n";
        print_help_section("profile", "Class profile JSON (classes, weights, thresholds)");
        print_help_section("boundary", "Vector file holding the area of interest polygon");
        print_help_section("boundary-layer", "Layer name in the boundary file (default: first layer)");
        print_help_section("raster", "Elevation raster (any GDAL format)");
        print_help_section("source", "Feature source LABEL=PATH[#LAYER], repeatable");
        print_help_section("config", "Load run configuration from a key=value file");
        print_help_section("create-config", "Write a default run configuration file and exit");
        std::cout << "\n";

        std::cout << "TESSELLATION OPTIONS:\n";
        print_help_section("hex-size", "Hex edge length in boundary CRS units (default: 500)");
        print_help_section("orientation", "pointy or flat (default: pointy)");
        print_help_section("origin", "Lattice origin X,Y (default: 0,0)");
        print_help_section("max-tiles", "Refuse tessellations above this tile count (default: 250000)");
        print_help_section("min-sliver", "Drop clipped tiles below this fraction of a full hex (default: 1e-6)");
        std::cout << "\n";

        std::cout << "RUN OPTIONS:\n";
        print_help_section("mode", "preview or apply (default: preview)");
        print_help_section("apply", "Same as --mode apply");
        print_help_section("store", "JSON attribute store to read and, in apply mode, write");
        print_help_section("threads", "Worker threads, 0 = automatic (default: 0)");
        print_help_section("source-timeout", "Milliseconds allowed per feature source (default: 30000)");
        print_help_section("dry-run", "Parse arguments and validate without processing");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("audit", "Audit GeoJSON output path (default: hexmosaic_audit.geojson)");
        print_help_section("summary", "Run summary JSON output path (default: hexmosaic_summary.json)");
        print_help_section("include-edges", "Add the lattice edge set to the audit GeoJSON");
        std::cout << "\n";

        std::cout << "LOGGING:\n";
        print_help_section("log-level", "Verbosity: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        print_help_section("log-config", "Per-facility levels, e.g. \"3,EvidenceSampler=5\"");
        print_help_section("log-file", "Log to specified file (append if exists)");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " -p profile.json -b aoi.gpkg -r dem.tif \\\n";
        std::cout << "        -s Forest=landcover.gpkg#forest -s Water=water.shp -s River=rivers.shp\n";
        std::cout << "    " << program_name_ << " -c run.cfg --apply --store tiles.json\n";
    }

private:
    void register_name(const std::string& long_name, const std::string& short_name) {
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void store(const Option& option, const std::string& value) {
        parsed_values_[option.long_name] = value;
        if (option.repeatable) {
            repeated_values_[option.long_name].push_back(value);
        }
    }

    // Negative numbers are values, not options
    static bool is_option(const std::string& arg) {
        if (!arg.starts_with("-") || arg.size() < 2) return false;
        const char next = arg[1];
        return !(next >= '0' && next <= '9') && next != '.';
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string names = "    ";
            if (!option.short_name.empty()) {
                names += "-" + option.short_name + ", ";
            }
            names += "--" + option.long_name;
            if (option.has_value) {
                names += " VALUE";
            }
            std::cout << names;
            if (names.size() < 36) {
                std::cout << std::string(36 - names.size(), ' ');
            } else {
                std::cout << "  ";
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::map<std::string, std::vector<std::string>> repeated_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace hexmosaic

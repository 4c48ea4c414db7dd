// =============================================================================
// geocell CLI - geohash encode / decode / navigate
// =============================================================================
//
// Usage:
//   geocell [-v|-q] <command> [args]
//
// Commands:
//   encode      Encode a position as a geohash
//   decode      Decode a geohash to its readable center
//   exact       Decode a geohash to its full precision center
//   bounds      Show the bounding box of a geohash
//   error       Show the decode error of a geohash
//   adjacent    Show the adjacent cell in a direction
//   neighbors   Show all 8 neighbors
//   cell        Summarize a geohash or "lat,lon" cell
//   distance    Estimate the distance between two geohashes
//   precision   Precision needed for a resolution
//   resolution  Resolution of a precision
//   config      Show the effective configuration
//   version     Show version information
//
// Examples:
//   geocell encode 52.205 0.119 7
//   geocell neighbors u120fxw
//   geocell cell 52.205,0.119 7
//   geocell distance u120fxwsh u120fxws0
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

#include "geocell/adjacency.hpp"
#include "geocell/codec.hpp"
#include "geocell/config.hpp"
#include "geocell/distance.hpp"
#include "geocell/error.hpp"
#include "geocell/geohash_cell.hpp"
#include "geocell/logging.hpp"
#include "geocell/resolution.hpp"
#include "geocell/text.hpp"

namespace geocell::cli {
    int cmd_encode(int argc, char* argv[]);
    int cmd_decode(int argc, char* argv[]);
    int cmd_exact(int argc, char* argv[]);
    int cmd_bounds(int argc, char* argv[]);
    int cmd_error(int argc, char* argv[]);
    int cmd_adjacent(int argc, char* argv[]);
    int cmd_neighbors(int argc, char* argv[]);
    int cmd_cell(int argc, char* argv[]);
    int cmd_distance(int argc, char* argv[]);
    int cmd_precision(int argc, char* argv[]);
    int cmd_resolution(int argc, char* argv[]);
    int cmd_config(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define GEOCELL_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* usage;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"encode",     "<lat> <lon> [precision]", "Encode a position as a geohash", geocell::cli::cmd_encode},
    {"decode",     "<geohash>",               "Decode a geohash to its readable center", geocell::cli::cmd_decode},
    {"exact",      "<geohash>",               "Decode a geohash to its full precision center", geocell::cli::cmd_exact},
    {"bounds",     "<geohash>",               "Show the bounding box (S W N E)", geocell::cli::cmd_bounds},
    {"error",      "<geohash>",               "Show the decode error (lat lon, degrees)", geocell::cli::cmd_error},
    {"adjacent",   "<geohash> <N|S|E|W>",     "Show the adjacent cell in a direction", geocell::cli::cmd_adjacent},
    {"neighbors",  "<geohash>",               "Show all 8 neighbors", geocell::cli::cmd_neighbors},
    {"cell",       "<geohash|lat,lon> [prec]", "Summarize a cell (center, bounds, size, neighbors)", geocell::cli::cmd_cell},
    {"distance",   "<geohash1> <geohash2>",   "Estimate the distance in meters (3 tiers)", geocell::cli::cmd_distance},
    {"precision",  "<res_lon> [res_lat]",     "Precision needed for a resolution in degrees", geocell::cli::cmd_precision},
    {"resolution", "<prec_lon> [prec_lat]",   "Resolution in degrees of a precision", geocell::cli::cmd_resolution},
    {"config",     "",                        "Show the effective configuration", geocell::cli::cmd_config},
    {"version",    "",                        "Show version information", geocell::cli::cmd_version},
    {"help",       "",                        "Show this help message", geocell::cli::cmd_help},
    {nullptr, nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

int usage_error(const char* name) {
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, name) == 0) {
            LOG_ERROR("usage: geocell ", cmd->name, " ", cmd->usage);
            break;
        }
    }
    return 1;
}

} // anonymous namespace

namespace geocell::cli {

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geocell - geohash encoding and navigation\n";
    std::cout << "Version " << GEOCELL_VERSION_STRING << "\n\n";
    std::cout << "Usage: geocell [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = std::strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
        if (*cmd->usage) {
            std::cout << "              " << cmd->usage << "\n";
        }
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Log errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GEOCELL_LOG_LEVEL       debug, info, warn, error or fatal\n";
    std::cout << "  GEOCELL_LOG_FILE        Append log output to a file\n";
    std::cout << "  GEOCELL_EARTH_RADIUS    Radius for distance tiers 2 and 3 (meters)\n";
    std::cout << "  GEOCELL_ADJUST          Latitude-adjust the flat-earth distance\n";
    std::cout << "  GEOCELL_WRAP            Unroll longitudes across the antimeridian\n";

    return 0;
}

int cmd_config([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config::getInstance().dump(std::cout);
    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geocell " << GEOCELL_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Codec Commands
// =============================================================================

int cmd_encode(int argc, char* argv[]) {
    if (argc < 2) return usage_error("encode");

    double lat = parse_double(argv[0], "latitude");
    double lon = parse_double(argv[1], "longitude");
    if (argc >= 3) {
        std::cout << Codec::encode(lat, lon, parse_int(argv[2], "precision")) << "\n";
    } else {
        std::cout << Codec::encode(lat, lon) << "\n";
    }
    return 0;
}

int cmd_decode(int argc, char* argv[]) {
    if (argc < 1) return usage_error("decode");

    DecodedText text = Codec::decode(argv[0]);
    std::cout << text.lat << " " << text.lon << "\n";
    return 0;
}

int cmd_exact(int argc, char* argv[]) {
    if (argc < 1) return usage_error("exact");

    Coordinate c = Codec::decode_exact(argv[0]);
    std::cout << std::setprecision(17) << c.lat << " " << c.lon << "\n";
    return 0;
}

int cmd_bounds(int argc, char* argv[]) {
    if (argc < 1) return usage_error("bounds");

    BoundingBox box = Codec::bounds(argv[0]);
    std::cout << std::setprecision(12)
              << box.south << " " << box.west << " " << box.north << " " << box.east << "\n";
    return 0;
}

int cmd_error(int argc, char* argv[]) {
    if (argc < 1) return usage_error("error");

    LatLonDelta err = Codec::decode_error(argv[0]);
    std::cout << std::setprecision(12) << err.lat << " " << err.lon << "\n";
    return 0;
}

// =============================================================================
// Adjacency Commands
// =============================================================================

int cmd_adjacent(int argc, char* argv[]) {
    if (argc < 2) return usage_error("adjacent");

    std::cout << Adjacency::adjacent(argv[0], std::string_view(argv[1])) << "\n";
    return 0;
}

int cmd_neighbors(int argc, char* argv[]) {
    if (argc < 1) return usage_error("neighbors");

    Neighbors8 n = Adjacency::neighbors(argv[0]);
    for (const char* key : Neighbors8::KEYS) {
        std::cout << std::left << std::setw(3) << key << n.at(key) << "\n";
    }
    return 0;
}

int cmd_cell(int argc, char* argv[]) {
    if (argc < 1) return usage_error("cell");

    int precision = argc >= 2 ? parse_int(argv[1], "precision") : 0;
    GeohashCell cell(argv[0], precision);
    LOG_DEBUG("cell ", cell, " from '", argv[0], "'");

    DecodedText text = cell.decode();
    BoundingBox box = cell.bounds();
    LatLonDelta size = cell.sizes();

    std::cout << "geohash    " << cell << " (precision " << cell.precision() << ")\n";
    std::cout << "center     " << text.lat << " " << text.lon << "\n";
    std::cout << std::setprecision(12)
              << "bounds     " << box.south << " " << box.west << " " << box.north << " " << box.east << "\n";
    std::cout << "size (m)   " << size.lat << " x " << size.lon << "\n";

    Neighbors8 n = cell.neighbors();
    std::cout << "neighbors ";
    for (const char* key : Neighbors8::KEYS) {
        std::cout << " " << key << "=" << n.at(key);
    }
    std::cout << "\n";
    return 0;
}

// =============================================================================
// Distance / Resolution Commands
// =============================================================================

int cmd_distance(int argc, char* argv[]) {
    if (argc < 2) return usage_error("distance");

    Config& config = Config::getInstance();
    double radius = config.get<double>("geo.radius", R_M);
    bool adjust = config.get<bool>("geo.adjust", false);
    bool wrap = config.get<bool>("geo.wrap", false);
    LOG_DEBUG("distance radius=", radius, " adjust=", adjust, " wrap=", wrap);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "cell-size     " << distance1(argv[0], argv[1]) << "\n";
    std::cout << "flat-earth    " << distance2(argv[0], argv[1], radius, adjust, wrap) << "\n";
    std::cout << "great-circle  " << distance3(argv[0], argv[1], radius, wrap) << "\n";
    return 0;
}

int cmd_precision(int argc, char* argv[]) {
    if (argc < 1) return usage_error("precision");

    double res_lon = parse_double(argv[0], "resolution");
    double res_lat = argc >= 2 ? parse_double(argv[1], "resolution") : res_lon;
    std::cout << precision_for(res_lon, res_lat) << "\n";
    return 0;
}

int cmd_resolution(int argc, char* argv[]) {
    if (argc < 1) return usage_error("resolution");

    int prec_lon = parse_int(argv[0], "precision");
    int prec_lat = argc >= 2 ? parse_int(argv[1], "precision") : prec_lon;
    Resolutions r = resolution_for(prec_lon, prec_lat);
    std::cout << std::setprecision(12) << r.lon << " " << r.lat << "\n";
    return 0;
}

} // namespace geocell::cli

// =============================================================================
// Main Entry Point
// =============================================================================

void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!geocell::init_config()) {
        return 1;
    }
    if (g_options.verbose) {
        geocell::set_log_level(geocell::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        geocell::set_log_level(geocell::LogLevel::ERROR);
    }

    if (argc < 1) {
        geocell::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const geocell::GeocellException& e) {
                LOG_ERROR(e.what());
                std::cerr << "geocell " << cmd_name << ": " << geocell::error_code_name(e.code()) << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'geocell help' for usage.\n";
    return 1;
}

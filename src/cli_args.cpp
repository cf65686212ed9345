// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>

namespace slither {

// Helper to parse unsigned integer with validation
static bool parse_uint(const char* str, unsigned long long min_val, unsigned long long max_val,
                       unsigned long long& out, const char* name) {
    char* endptr;
    if (*str == '-' || *str == '\0') {
        printf("Error: invalid %s (must be %llu-%llu): %s\n", name, min_val, max_val, str);
        return false;
    }
    unsigned long long val = strtoull(str, &endptr, 10);
    if (*endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %llu-%llu): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = val;
    return true;
}

// Helper to parse double with validation
static bool parse_double(const char* str, double& out, const char* name) {
    char* endptr;
    double val = strtod(str, &endptr);
    if (*endptr != '\0' || *str == '\0') {
        printf("Error: %s requires a numeric value\n", name);
        return false;
    }
    if (!std::isfinite(val)) {
        printf("Error: %s must be finite: %s\n", name, str);
        return false;
    }
    out = val;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <file>  JSON config file (default: slither.json, created if missing)\n");
    printf("  -t, --ticks <n>      Maximum ticks to simulate (default: 6000)\n");
    printf("  --dt <seconds>       Simulated time per tick (default: 1/60)\n");
    printf("  -s, --seed <n>       Random seed for fruit placement (overrides config)\n");
    printf("  -m, --moves <script> Scripted input, e.g. 120:left,300:up,300:up\n");
    printf("  --test               Deterministic run: seed 1 unless --seed, debug logging\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nMoves at the same tick are applied in order; repeating the current\n");
    printf("direction boosts the snake one cell.\n");
}

std::optional<std::vector<ScriptedMove>> parse_moves(const std::string& script) {
    std::vector<ScriptedMove> moves;
    std::stringstream ss(script);
    std::string token;

    while (std::getline(ss, token, ',')) {
        if (token.empty()) {
            continue;
        }
        auto colon = token.find(':');
        if (colon == std::string::npos || colon == 0) {
            spdlog::error("[CLI] Move '{}' is not in tick:direction form", token);
            return std::nullopt;
        }

        std::string tick_str = token.substr(0, colon);
        unsigned long long tick = 0;
        if (!parse_uint(tick_str.c_str(), 0, UINT64_MAX, tick, "move tick")) {
            return std::nullopt;
        }

        auto dir = parse_direction(token.substr(colon + 1));
        if (!dir) {
            spdlog::error("[CLI] Unknown direction in move '{}'", token);
            return std::nullopt;
        }
        moves.push_back({static_cast<uint64_t>(tick), *dir});
    }

    std::stable_sort(moves.begin(), moves.end(), [](const ScriptedMove& a, const ScriptedMove& b) {
        return a.tick < b.tick;
    });
    return moves;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c/--config requires an argument\n");
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--ticks") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -t/--ticks requires an argument\n");
                return false;
            }
            unsigned long long ticks = 0;
            if (!parse_uint(argv[++i], 1, UINT64_MAX, ticks, "tick count"))
                return false;
            args.max_ticks = static_cast<uint64_t>(ticks);
        } else if (strcmp(argv[i], "--dt") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --dt requires an argument\n");
                return false;
            }
            double dt = 0.0;
            if (!parse_double(argv[++i], dt, "--dt"))
                return false;
            if (dt <= 0.0) {
                printf("Error: --dt must be positive: %s\n", argv[i]);
                return false;
            }
            args.dt = dt;
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--seed") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -s/--seed requires an argument\n");
                return false;
            }
            unsigned long long seed = 0;
            if (!parse_uint(argv[++i], 0, UINT32_MAX, seed, "seed"))
                return false;
            args.seed = static_cast<uint32_t>(seed);
        } else if (strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--moves") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -m/--moves requires an argument\n");
                return false;
            }
            auto moves = parse_moves(argv[++i]);
            if (!moves) {
                printf("Error: invalid move script: %s\n", argv[i]);
                return false;
            }
            args.moves = std::move(*moves);
        } else if (strcmp(argv[i], "--test") == 0) {
            args.test_mode = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (strncmp(argv[i], "-v", 2) == 0 && argv[i][2] == 'v') {
            // -vv, -vvv
            const char* p = argv[i] + 1;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
            if (*p != '\0') {
                printf("Unknown argument: %s\n", argv[i]);
                printf("Use --help for usage information\n");
                return false;
            }
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            args.log_dest = argv[++i];
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires an argument\n");
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_requested = true;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.test_mode && !args.seed) {
        args.seed = 1;
    }
    return true;
}

} // namespace slither

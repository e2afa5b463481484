/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Command line front end for generating and inspecting identifiers.
 *
 * @details
 * Two modes are supported:
 * 1. **Generate** (default): print COUNT new identifiers, one per line, either
 *    as bare strings or as JSON objects.
 * 2. **Inspect**: decode identifiers given as arguments (or read from stdin,
 *    whitespace separated) and print their fields as JSON.
 */

#include "scru128/infra/logger.hpp"
#include "scru128/infra/string.hpp"
#include "scru128/scru128.hpp"
#include "scru128/serde/json.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using scru128::infra::Logger;
using scru128::infra::LogLevel;

namespace {

/// @brief Runtime options collected from argv.
struct Options {
    bool help = false;
    bool json = false;
    bool inspect = false;
    unsigned long count = 1;
    std::vector<std::string> ids;
};

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] [COUNT]\n"
              << "       " << binary_name << " [OPTIONS] inspect [ID ...]\n"
              << "Options:\n"
              << "  COUNT       Number of identifiers to generate (Default: 1)\n"
              << "  inspect     Decode IDs (or whitespace separated stdin) to JSON\n"
              << "  --json      Print generated identifiers as JSON objects\n"
              << "  --verbose   Enable debug diagnostics on stderr\n"
              << "  --help      Show this help message\n";
}

/**
 * @brief Parses argv into `Options`.
 *
 * @throws std::invalid_argument On an unknown flag or a malformed COUNT.
 */
Options parse_args(int argc, char* argv[])
{
    Options opts;
    bool count_seen = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (opts.inspect) {
            opts.ids.push_back(arg);
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose") {
            Logger::set_level(LogLevel::DEBUG);
        } else if (arg == "inspect") {
            opts.inspect = true;
        } else if (!count_seen && !arg.empty() && arg[0] != '-') {
            std::size_t used = 0;
            opts.count = std::stoul(arg, &used);
            if (used != arg.size()) {
                throw std::invalid_argument("COUNT is not a number: " + arg);
            }
            count_seen = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return opts;
}

/// @brief Prints a cJSON node compactly on one line and releases it.
void emit_json(cJSON* node)
{
    char* raw = cJSON_PrintUnformatted(node);
    std::cout << raw << '\n';
    free(raw);
    cJSON_Delete(node);
}

/**
 * @brief Generates `count` identifiers from the shared default generator.
 */
void run_generate(const Options& opts)
{
    Logger::log(LogLevel::DEBUG, "Generate: emitting " + std::to_string(opts.count) +
                                     (opts.json ? " JSON objects" : " identifiers"));

    for (unsigned long i = 0; i < opts.count; ++i) {
        scru128::Id id = scru128::new_id();
        if (opts.json) {
            emit_json(scru128::serde::describe(id));
        } else {
            std::cout << id << '\n';
        }
    }
    std::cout.flush();
}

/**
 * @brief Decodes one token and prints its description.
 *
 * @return true If the token was a valid identifier.
 */
bool inspect_one(const std::string& token)
{
    auto id = scru128::Id::parse(token);
    if (!id) {
        Logger::log(LogLevel::WARN, "Inspect: not a valid identifier: '" + token + "'");
        return false;
    }
    Logger::log(LogLevel::TRACE, "Inspect: decoded " + token);
    emit_json(scru128::serde::describe(*id));
    return true;
}

/**
 * @brief Inspects every ID argument, or every token read from stdin.
 *
 * @return int 0 if every token decoded, 1 otherwise.
 */
int run_inspect(const Options& opts)
{
    bool all_valid = true;

    if (!opts.ids.empty()) {
        for (const auto& token : opts.ids) {
            all_valid = inspect_one(token) && all_valid;
        }
        return all_valid ? 0 : 1;
    }

    Logger::log(LogLevel::DEBUG, "Inspect: reading identifiers from stdin");
    std::string line;
    while (std::getline(std::cin, line)) {
        std::string trimmed = scru128::infra::String::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        for (const auto& token : scru128::infra::String::split_whitespace(trimmed)) {
            all_valid = inspect_one(token) && all_valid;
        }
    }
    return all_valid ? 0 : 1;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    try {
        Options opts = parse_args(argc, argv);

        if (opts.help) {
            print_help(argv[0]);
            return 0;
        }

        if (opts.inspect) {
            return run_inspect(opts);
        }

        run_generate(opts);

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

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
 * @brief `quidgen` command-line entry point.
 *
 * @details
 * Generates identifiers of a requested kind, or parses and normalises an
 * existing one:
 * 1. Argument Parsing.
 * 2. Logger Configuration.
 * 3. Generation or Parse.
 */

#include "quid/core/uuid.hpp"
#include "quid/gen/factory.hpp"
#include "quid/infra/logger.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

/// @brief Effective command-line configuration.
struct Options {
    std::string kind = "v4";
    int count = 1;
    bool canonical = false;
    quid::gen::SeparatorMode separators = quid::gen::SeparatorMode::Strip;
    std::string parse_input;
    bool parse = false;
    bool help = false;
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --kind KIND             v1 | v1-ordered | v4 | v7 (Default: v4)\n"
              << "  --count N               Number of identifiers to print (Default: 1)\n"
              << "  --canonical             Print the 8-4-4-4-12 form\n"
              << "  --preserve-separators   Keep separators in the v1-ordered text path\n"
              << "  --parse TEXT            Decode TEXT and print its normalised form\n"
              << "  --log-level LEVEL       trace | debug | info | warn | error | fatal\n"
              << "  --help                  Show this help message\n";
}

const char* variant_name(quid::core::Uuid::Variant v)
{
    switch (v) {
    case quid::core::Uuid::Variant::NCS:
        return "ncs";
    case quid::core::Uuid::Variant::RFC4122:
        return "rfc4122";
    case quid::core::Uuid::Variant::Microsoft:
        return "microsoft";
    case quid::core::Uuid::Variant::Future:
        return "future";
    }
    return "unknown";
}

Options parse_args(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help") {
            opts.help = true;
        } else if (arg == "--kind") {
            opts.kind = next();
        } else if (arg == "--count") {
            opts.count = std::stoi(next());
            if (opts.count <= 0) {
                throw std::invalid_argument("--count must be positive");
            }
        } else if (arg == "--canonical") {
            opts.canonical = true;
        } else if (arg == "--preserve-separators") {
            opts.separators = quid::gen::SeparatorMode::Preserve;
        } else if (arg == "--parse") {
            opts.parse = true;
            opts.parse_input = next();
        } else if (arg == "--log-level") {
            quid::infra::Logger::set_level(quid::infra::Logger::parse_level(next()));
        } else {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }

    if (opts.kind != "v1" && opts.kind != "v1-ordered" && opts.kind != "v4" && opts.kind != "v7") {
        throw std::invalid_argument("Unknown kind '" + opts.kind + "'");
    }
    return opts;
}

quid::core::Uuid generate(const Options& opts)
{
    if (opts.kind == "v1")
        return quid::gen::new_v1();
    if (opts.kind == "v1-ordered")
        return quid::gen::new_v1_ordered(opts.separators);
    if (opts.kind == "v7")
        return quid::gen::new_v7();
    return quid::gen::new_v4();
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        Options opts = parse_args(argc, argv);

        if (opts.help) {
            print_help(argv[0]);
            return 0;
        }

        if (opts.parse) {
            auto uuid = quid::core::Uuid::from_string(opts.parse_input);
            std::cout << (opts.canonical ? uuid.to_canonical_string() : uuid.to_string())
                      << " version=" << uuid.version() << " variant=" << variant_name(uuid.variant())
                      << std::endl;
            return 0;
        }

        quid::infra::Logger::log(quid::infra::LogLevel::DEBUG,
                                 "Config: kind=" + opts.kind + " count=" +
                                     std::to_string(opts.count));

        for (int i = 0; i < opts.count; ++i) {
            auto uuid = generate(opts);
            std::cout << (opts.canonical ? uuid.to_canonical_string() : uuid.to_string()) << "\n";
        }
        std::cout.flush();

    } catch (const std::exception& e) {
        quid::infra::Logger::log(quid::infra::LogLevel::FATAL,
                                 "quidgen: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

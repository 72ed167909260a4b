/**
 * @file cmd_sm3.cpp
 * @brief SM3 subcommand for the gmsm CLI
 *
 * Usage:
 *   gmsm sm3 -in file.txt
 *   gmsm sm3 -text abc
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <string>

#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/utils/encoding.h"

#include "cli_utils.h"

using gmsm::cli::fail;
using gmsm::cli::read_file;

void print_sm3_help() {
    std::cout << "\nUsage: gmsm sm3 [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>         Input file path\n";
    std::cout << "  -text <string>     Hash a literal string instead of a file\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  gmsm sm3 -in document.pdf\n";
    std::cout << "  gmsm sm3 -text abc\n\n";
}

int cmd_sm3(int argc, char* argv[]) {
    std::string input_file;
    std::string text;
    bool have_text = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-text" && i + 1 < argc) {
            text = argv[++i];
            have_text = true;
        } else if (arg == "--help" || arg == "-h") {
            print_sm3_help();
            return 0;
        } else {
            print_sm3_help();
            return fail("Unknown option: " + arg);
        }
    }

    if (input_file.empty() == !have_text) {
        print_sm3_help();
        return fail("Exactly one of -in or -text is required");
    }

    try {
        gmsm::ByteVec data = have_text ? gmsm::cli::to_bytes(text) : read_file(input_file);
        std::cout << gmsm::SM3Digest::hash_hex(data) << "\n";
        return 0;
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

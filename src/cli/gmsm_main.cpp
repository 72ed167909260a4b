/**
 * @file gmsm_main.cpp
 * @brief gmsm command-line tool, main entry point
 *
 * Usage:
 *   gmsm <command> [options]
 *
 * Commands:
 *   keygen       Generate an SM2 key pair
 *   sign         SM2 signature over a file
 *   verify       Verify an SM2 signature
 *   encrypt      SM2 public key encryption
 *   decrypt      SM2 private key decryption
 *   sm3          SM3 digest
 *   version      Display version information
 *   help         Show help message
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <iostream>
#include <string>

#include "gmsm/version.h"

#include <NTL/version.h>
#include <gmp.h>

// Subcommand handlers
int cmd_keygen(int argc, char* argv[]);
int cmd_sign(int argc, char* argv[]);
int cmd_verify(int argc, char* argv[]);
int cmd_encrypt(int argc, char* argv[]);
int cmd_decrypt(int argc, char* argv[]);
int cmd_sm3(int argc, char* argv[]);

void print_usage() {
    std::cout << "\nUsage: gmsm <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  keygen       Generate an SM2 key pair\n";
    std::cout << "  sign         Sign a file with an SM2 private key\n";
    std::cout << "  verify       Verify an SM2 signature\n";
    std::cout << "  encrypt      Encrypt a file to an SM2 public key\n";
    std::cout << "  decrypt      Decrypt a file with an SM2 private key\n";
    std::cout << "  sm3          Compute an SM3 digest\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  gmsm keygen -out alice\n";
    std::cout << "  gmsm sign -key <hex> -in file.txt --id alice@example.com\n";
    std::cout << "  gmsm encrypt -pub <hex> -in file.txt -out file.enc --mode c1c3c2\n";
    std::cout << "  gmsm sm3 -text abc\n\n";
    std::cout << "For command-specific help, use: gmsm <command> --help\n\n";
}

void cmd_version() {
    std::cout << "\n";
    std::cout << GMSM_LIBRARY_NAME << " - " << GMSM_DESCRIPTION << "\n\n";
    std::cout << "Version:      " << GMSM_VERSION_STRING << "\n";
    std::cout << "Build Type:   " << GMSM_BUILD_TYPE << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Supported Algorithms:\n";
    std::cout << "  - SM2 signature, encryption (C1C2C3, C1C3C2), key exchange\n";
    std::cout << "  - SM3\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - NTL " << NTL_VERSION << " (Number Theory Library)\n";
    std::cout << "  - GMP " << gmp_version << " (GNU Multiple Precision Arithmetic)\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(), ::tolower);

    if (command == "keygen") {
        return cmd_keygen(argc - 1, argv + 1);
    }
    else if (command == "sign") {
        return cmd_sign(argc - 1, argv + 1);
    }
    else if (command == "verify") {
        return cmd_verify(argc - 1, argv + 1);
    }
    else if (command == "encrypt") {
        return cmd_encrypt(argc - 1, argv + 1);
    }
    else if (command == "decrypt") {
        return cmd_decrypt(argc - 1, argv + 1);
    }
    else if (command == "sm3") {
        return cmd_sm3(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    }

    std::cerr << "[ERROR] Unknown command '" << command << "'\n";
    print_usage();
    return 1;
}

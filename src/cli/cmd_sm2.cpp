/**
 * @file cmd_sm2.cpp
 * @brief SM2 subcommands for the gmsm CLI
 *
 * Usage:
 *   gmsm keygen [-out <prefix>]
 *   gmsm sign    -key <hex> -in <file> [--id <string>]
 *   gmsm verify  -pub <hex> -in <file> -sig <hex> [--id <string>]
 *   gmsm encrypt -pub <hex> -in <file> -out <file> [--mode c1c3c2]
 *   gmsm decrypt -key <hex> -in <file> -out <file> [--mode c1c3c2]
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <optional>
#include <string>

#include "gmsm/crypto/sm/sm2.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"
#include "gmsm/utils/encoding.h"

#include "cli_utils.h"

using gmsm::ByteVec;
using gmsm::cli::fail;
using gmsm::cli::read_file;
using gmsm::cli::write_file;
using gmsm::encoding::hexDecode;
using gmsm::encoding::hexEncode;

namespace {

struct Sm2Options {
    std::string key_hex;
    std::string pub_hex;
    std::string sig_hex;
    std::string input_file;
    std::string output_file;
    std::optional<std::string> user_id;
    gmsm::sm2::SM2Mode mode = gmsm::sm2::SM2Mode::C1C2C3;
    bool help = false;
};

void print_sm2_help(const std::string& command) {
    std::cout << "\nUsage: gmsm " << command << " [options]\n\n";
    std::cout << "Options:\n";
    if (command == "keygen") {
        std::cout << "  -out <prefix>     Also write <prefix>.key and <prefix>.pub (hex)\n";
    }
    if (command == "sign" || command == "decrypt") {
        std::cout << "  -key <hex>        Private key (32 bytes, hex)\n";
    }
    if (command == "verify" || command == "encrypt") {
        std::cout << "  -pub <hex>        Public key (65-byte uncompressed or 33-byte compressed, hex)\n";
    }
    if (command != "keygen") {
        std::cout << "  -in <file>        Input file\n";
    }
    if (command == "verify") {
        std::cout << "  -sig <hex>        DER signature (hex)\n";
    }
    if (command == "encrypt" || command == "decrypt") {
        std::cout << "  -out <file>       Output file\n";
        std::cout << "  --mode <mode>     Ciphertext order: c1c2c3 (default) or c1c3c2\n";
    }
    if (command == "sign" || command == "verify") {
        std::cout << "  --id <string>     User ID (default: 1234567812345678)\n";
    }
    std::cout << "  --help            Show this help message\n\n";
}

/**
 * @return false on an unknown or incomplete option
 */
bool parse_sm2_options(int argc, char* argv[], Sm2Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        bool has_value = i + 1 < argc;

        if (arg == "-key" && has_value) {
            opts.key_hex = argv[++i];
        } else if (arg == "-pub" && has_value) {
            opts.pub_hex = argv[++i];
        } else if (arg == "-sig" && has_value) {
            opts.sig_hex = argv[++i];
        } else if (arg == "-in" && has_value) {
            opts.input_file = argv[++i];
        } else if (arg == "-out" && has_value) {
            opts.output_file = argv[++i];
        } else if (arg == "--id" && has_value) {
            opts.user_id = argv[++i];
        } else if (arg == "--mode" && has_value) {
            opts.mode = gmsm::cli::parse_mode(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            std::cerr << "[ERROR] Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::optional<ByteVec> user_id_bytes(const Sm2Options& opts) {
    if (!opts.user_id) {
        return std::nullopt;
    }
    return gmsm::cli::to_bytes(*opts.user_id);
}

/**
 * @brief Parse options, then run body with exceptions reported as [ERROR]
 */
template <typename Body>
int run_sm2_command(const std::string& command, int argc, char* argv[], Body&& body) {
    Sm2Options opts;
    try {
        if (!parse_sm2_options(argc, argv, opts)) {
            print_sm2_help(command);
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        return fail(e.what());
    }
    if (opts.help) {
        print_sm2_help(command);
        return 0;
    }

    try {
        gmsm::sm2::SM2 sm2;
        return body(sm2, opts);
    } catch (const gmsm::encoding::EncodingError& e) {
        return fail(std::string("Invalid hex input: ") + e.what());
    } catch (const gmsm::CryptoError& e) {
        return fail(std::string(e.what()) + " (" + gmsm_error_string(e.code()) + ")");
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

} // namespace

int cmd_keygen(int argc, char* argv[]) {
    return run_sm2_command("keygen", argc, argv,
                           [](gmsm::sm2::SM2& sm2, const Sm2Options& opts) {
        gmsm::ecc::ECKeyPair kp = sm2.generate_keypair();
        ByteVec d = kp.private_key.encode();
        std::string priv_hex = hexEncode(d);
        std::string pub_hex = hexEncode(kp.public_key.encode(false));
        gmsm::secure_wipe(d);

        std::cout << "Private key: " << priv_hex << "\n";
        std::cout << "Public key:  " << pub_hex << "\n";

        if (!opts.output_file.empty()) {
            write_file(opts.output_file + ".key", gmsm::cli::to_bytes(priv_hex + "\n"));
            write_file(opts.output_file + ".pub", gmsm::cli::to_bytes(pub_hex + "\n"));
            std::cout << "Wrote " << opts.output_file << ".key and "
                      << opts.output_file << ".pub\n";
        }
        gmsm::secure_wipe(priv_hex);
        return 0;
    });
}

int cmd_sign(int argc, char* argv[]) {
    return run_sm2_command("sign", argc, argv,
                           [](gmsm::sm2::SM2& sm2, const Sm2Options& opts) {
        if (opts.key_hex.empty() || opts.input_file.empty()) {
            print_sm2_help("sign");
            return fail("Missing required arguments (-key, -in)");
        }
        auto key = sm2.private_key(hexDecode(opts.key_hex));
        ByteVec message = read_file(opts.input_file);
        ByteVec sig = sm2.sign(key, message, user_id_bytes(opts));
        std::cout << hexEncode(sig) << "\n";
        return 0;
    });
}

int cmd_verify(int argc, char* argv[]) {
    return run_sm2_command("verify", argc, argv,
                           [](gmsm::sm2::SM2& sm2, const Sm2Options& opts) {
        if (opts.pub_hex.empty() || opts.input_file.empty() || opts.sig_hex.empty()) {
            print_sm2_help("verify");
            return fail("Missing required arguments (-pub, -in, -sig)");
        }
        auto key = sm2.public_key(hexDecode(opts.pub_hex));
        ByteVec message = read_file(opts.input_file);
        if (!sm2.verify(key, message, hexDecode(opts.sig_hex), user_id_bytes(opts))) {
            return fail("Signature verification FAILED");
        }
        std::cout << "Signature OK\n";
        return 0;
    });
}

int cmd_encrypt(int argc, char* argv[]) {
    return run_sm2_command("encrypt", argc, argv,
                           [](gmsm::sm2::SM2& sm2, const Sm2Options& opts) {
        if (opts.pub_hex.empty() || opts.input_file.empty() || opts.output_file.empty()) {
            print_sm2_help("encrypt");
            return fail("Missing required arguments (-pub, -in, -out)");
        }
        auto key = sm2.public_key(hexDecode(opts.pub_hex));
        ByteVec plaintext = read_file(opts.input_file);
        ByteVec ciphertext = sm2.encrypt(key, plaintext, opts.mode);
        write_file(opts.output_file, ciphertext);
        std::cout << "Encrypted " << plaintext.size() << " bytes -> "
                  << ciphertext.size() << " bytes\n";
        return 0;
    });
}

int cmd_decrypt(int argc, char* argv[]) {
    return run_sm2_command("decrypt", argc, argv,
                           [](gmsm::sm2::SM2& sm2, const Sm2Options& opts) {
        if (opts.key_hex.empty() || opts.input_file.empty() || opts.output_file.empty()) {
            print_sm2_help("decrypt");
            return fail("Missing required arguments (-key, -in, -out)");
        }
        auto key = sm2.private_key(hexDecode(opts.key_hex));
        ByteVec ciphertext = read_file(opts.input_file);
        ByteVec plaintext = sm2.decrypt(key, ciphertext, opts.mode);
        write_file(opts.output_file, plaintext);
        std::cout << "Decrypted " << plaintext.size() << " bytes\n";
        gmsm::secure_wipe(plaintext);
        return 0;
    });
}

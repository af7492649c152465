#include <iostream>
#include <string>
#include <vector>
#include "../lib/common/common.h"
#include "../lib/common/chaos_params.h"
#include "../lib/CryptoKDF/include/crypto_kdf.h"
#include "../lib/ChaosCipher/include/chaos_cipher.h"
#include "../lib/Entropy/include/entropy.h"

static void usage() {
    std::cerr << "Usage:\n"
              << "  chaos_tool derive <secret> [key_len] [salt_hex]\n"
              << "  chaos_tool encrypt <secret> <text> [salt_hex]\n"
              << "  chaos_tool decrypt <secret> <cipher_hex> [salt_hex]\n"
              << "  chaos_tool salt [len]\n"
              << "  chaos_tool attractor <secret> [points]\n"
              << "Options (before the command):\n"
              << "  --params key=value,...   e.g. logistic_r=3.98,lorenz_rho=28.5\n"
              << "  --mixing a,b,c,d         mixing weights (normalized)\n";
}

int main(int argc, char** argv) {
    ChaosParams params;
    MixingCoefficients mixing;
    std::vector<std::string> args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--params" && i + 1 < argc) {
                params = parseChaosParams(argv[++i]);
            } else if (a == "--mixing" && i + 1 < argc) {
                mixing = parseMixing(argv[++i]);
            } else {
                args.push_back(a);
            }
        }
        if (args.empty()) { usage(); return 2; }

        const std::string& cmd = args[0];
        if (cmd == "salt") {
            size_t len = args.size() > 1 ? std::stoul(args[1]) : CHAOS_MIN_SALT_LEN;
            std::vector<uint8_t> salt(len);
            if (!gatherSalt(salt.data(), salt.size())) {
                log_error("Salt generation failed");
                return 1;
            }
            std::cout << bytesToHex(salt) << std::endl;
            return 0;
        }

        if (args.size() < 2) { usage(); return 2; }
        const std::string& secret = args[1];

        if (cmd == "derive") {
            size_t len = args.size() > 2 ? std::stoul(args[2]) : 32;
            std::vector<uint8_t> salt = args.size() > 3 ? hexToBytes(args[3]) : std::vector<uint8_t>();
            std::vector<uint8_t> key = chaosDeriveKey(secret, salt, len, params, mixing);
            std::cout << "KEY:" << bytesToHex(key) << std::endl;
        } else if (cmd == "encrypt" && args.size() > 2) {
            std::vector<uint8_t> salt = args.size() > 3 ? hexToBytes(args[3]) : defaultSaltFromSecret(secret);
            ChaosCipher cipher(secret, salt, params, mixing);
            std::vector<uint8_t> ct = cipher.encrypt(args[2]);
            std::cout << "ENC:" << bytesToHex(ct) << std::endl;
            log_info("ChaosCipher", "ciphertext_length=" + std::to_string(ct.size()) +
                                   " keystream_hash=" + cipher.keystreamFingerprint());
        } else if (cmd == "decrypt" && args.size() > 2) {
            std::vector<uint8_t> salt = args.size() > 3 ? hexToBytes(args[3]) : std::vector<uint8_t>();
            std::vector<uint8_t> pt = chaosDecrypt(hexToBytes(args[2]), secret, params, mixing, salt);
            std::cout << std::string(pt.begin(), pt.end()) << std::endl;
        } else if (cmd == "attractor") {
            size_t points = args.size() > 2 ? std::stoul(args[2]) : 1000;
            ChaoticKDF kdf(secret, defaultSaltFromSecret(secret), params, mixing);
            for (const LorenzState& s : kdf.hybridMap().attractorData(points)) {
                std::cout << s.x << "," << s.y << "," << s.z << "\n";
            }
        } else {
            usage();
            return 2;
        }
    } catch (const DecryptionError& e) {
        log_error("Decryption failed: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
    return 0;
}

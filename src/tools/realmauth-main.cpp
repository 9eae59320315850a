#include "realmauth/realmauth.hpp"
#include "cmd_args.hpp"
#include "tool_config.hpp"
#include "tool_output.hpp"
#include <charconv>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void emit(const cmd_args& args, const std::string& value, const char* what) {
    auto out_opt = args.get("out");
    if (!out_opt) {
        std::cout << value << "\n";
    } else {
        write_text_file(*out_opt, value + "\n");
        std::cerr << what << " written to: " << *out_opt << "\n";
    }
}

std::int64_t parseExpiry(const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument("Invalid expiry: '" + text + "' (expected seconds)");
    }
    return value;
}

void printUsage() {
    std::cerr << R"(realmauth - realm credentials utility

Usage: realmauth <command> [options]

Commands:
    gen-keypair <realm_name>  Generate an RSA keypair for realm authentication.
                              Writes <realm_name>_private.pem and <realm_name>_public.pem
    gen-device-id             Generate a device id (Base64 URL encoded UUID v4)
    gen-jwt <type>            Generate a JWT to access one of the APIs.
                              Types: housekeeping, realm-management, pairing, appengine, channels
    pairing-jwt               Generate the short lived token used for pairing operations

Options:
    --version, -v             Show version
    --help, -h                Show this help
    --out-dir <dir>           Output directory for gen-keypair (default: current)
    --private-key, -p <file>  PEM encoded private key (gen-jwt). Housekeeping key for
                              housekeeping tokens, realm key for everything else
    --claims, -c <list>       Access patterns for gen-jwt (default: .*::.*, all access).
                              Repeat the flag or separate patterns with commas
    --expiry, -e <seconds>    Token lifetime for gen-jwt (default: 300, 0 = never expires,
                              negative = already expired)
    --realm-key, -k <file>    Realm private key (pairing-jwt, env REALMAUTH_REALM_KEY)
    --realm-name, -r <realm>  Realm name (pairing-jwt, env REALMAUTH_REALM_NAME)
    --out <file>              Output file for tokens (default: stdout)

Examples:
    realmauth gen-keypair myrealm
    realmauth gen-device-id
    realmauth gen-jwt realm-management -p myrealm_private.pem
    realmauth gen-jwt appengine -p myrealm_private.pem -c "devices::.*" -e 0
    realmauth pairing-jwt -k myrealm_private.pem -r myrealm
)";
}

void genKeypairCommand(const cmd_args& args) {
    if (args.positional.size() != 2) {
        throw std::invalid_argument("gen-keypair requires exactly one argument: <realm_name>");
    }
    const std::string& realm = args.positional[1];
    std::string dir = args.get("out-dir").value_or(".");

    auto keypair = realmauth::Keypair::generate(realmauth::RSA_KEY_BITS);
    std::cerr << "Keypair generated successfully\n";

    auto files = realmauth::writeRealmKeypair(keypair, realm, dir);
    std::cerr << "Wrote " << files.privateKey.string() << "\n";
    std::cerr << "Wrote " << files.publicKey.string() << "\n";
}

void genDeviceIdCommand(const cmd_args& /*args*/) {
    std::cout << realmauth::generateDeviceId() << "\n";
}

void genJwtCommand(const cmd_args& args) {
    if (args.positional.size() != 2) {
        throw std::invalid_argument("gen-jwt requires exactly one argument: <type>");
    }

    // Type is checked before any file is read
    auto type = realmauth::parseTokenType(args.positional[1]);

    auto key_opt = args.get({"private-key", "p"});
    if (!key_opt) {
        throw std::invalid_argument("--private-key <file> required");
    }

    std::vector<std::string> patterns;
    for (const auto& value : args.get_all({"claims", "c"})) {
        auto items = split_list(value);
        patterns.insert(patterns.end(), items.begin(), items.end());
    }

    std::int64_t expiry = realmauth::DEFAULT_EXPIRY_SECONDS;
    if (auto expiry_opt = args.get({"expiry", "e"})) {
        expiry = parseExpiry(*expiry_opt);
    }

    auto key = realmauth::Keypair::fromPrivateKeyFile(*key_opt);
    emit(args, realmauth::mintToken(type, key, patterns, expiry), "JWT");
}

void pairingJwtCommand(const cmd_args& args) {
    auto cfg = realm_config::resolve(args);
    emit(args, realmauth::mintPairingToken(cfg.name, cfg.key_path), "JWT");
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto args = cmd_args::parse(argc, argv);

        if (args.has({"version", "v"})) {
            std::cout << "realmauth version 1.0.0\n";
            return 0;
        }

        if (args.has({"help", "h"}) || argc == 1) {
            printUsage();
            return 0;
        }

        if (args.positional.empty()) {
            std::cerr << "No command specified. Use --help for usage.\n";
            return 1;
        }

        // Dispatch commands
        if (const std::string& command = args.positional[0]; command == "gen-keypair") {
            genKeypairCommand(args);
        } else if (command == "gen-device-id") {
            genDeviceIdCommand(args);
        } else if (command == "gen-jwt") {
            genJwtCommand(args);
        } else if (command == "pairing-jwt") {
            pairingJwtCommand(args);
        } else {
            std::cerr << "Unknown command: " << command << ". Use --help for usage.\n";
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

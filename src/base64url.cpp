#include "base64url.hpp"
#include <array>
#include <stdexcept>

namespace realmauth::internal {

namespace {
    constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    constexpr std::uint8_t invalid = 0xFF;

    constexpr std::array<std::uint8_t, 256> makeReverseAlphabet() {
        std::array<std::uint8_t, 256> table{};
        table.fill(invalid);
        for (std::size_t i = 0; i < alphabet.size(); ++i) {
            table[static_cast<unsigned char>(alphabet[i])] = static_cast<std::uint8_t>(i);
        }
        return table;
    }

    constexpr auto reverse_alphabet = makeReverseAlphabet();
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);

    // Shift bytes into an accumulator and emit 6 bits at a time
    std::uint32_t acc = 0;
    int bits = 0;
    for (std::uint8_t byte : data) {
        acc = (acc << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out.push_back(alphabet[(acc >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(acc << (6 - bits)) & 0x3F]);
    }
    return out;
}

std::string base64url_encode(std::string_view text) {
    return base64url_encode(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }

    // A single leftover character cannot carry a full byte
    if (input.size() % 4 == 1) {
        throw std::invalid_argument("Invalid Base64 URL input length");
    }

    std::vector<std::uint8_t> out;
    out.reserve(input.size() * 3 / 4);

    std::uint32_t acc = 0;
    int bits = 0;
    for (char c : input) {
        std::uint8_t value = reverse_alphabet[static_cast<unsigned char>(c)];
        if (value == invalid) {
            throw std::invalid_argument("Invalid Base64 URL character in input");
        }
        acc = (acc << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace realmauth::internal

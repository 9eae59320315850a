#pragma once
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// trim whitespace (both ends)
inline std::string trim(std::string s) {
    auto isspace = [](unsigned char c){ return std::isspace(c); };
    auto b = std::find_if_not(s.begin(), s.end(), isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    if (b >= e) return {};
    return {b, e};
}

// split "a,b,,c" into {"a","b","c"} (empty items dropped)
inline std::vector<std::string> split_list(std::string_view s, char sep = ',') {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto end = s.find(sep, start);
        if (end == std::string_view::npos) end = s.size();
        if (auto item = trim(std::string(s.substr(start, end - start))); !item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

struct cmd_args {
    // every value given for an option, in command line order
    std::map<std::string, std::vector<std::string>> options;
    std::vector<std::string> positional;

    static cmd_args parse(int argc, char* argv[]) {
        cmd_args result;

        auto put = [&](std::string k, std::string v) {
            result.options[trim(std::move(k))].push_back(trim(std::move(v)));
        };

        // "-60" is a value, "-x" is the next option
        auto is_value = [](const std::string& s) {
            if (s == "=") return false;
            if (s.rfind('-', 0) != 0) return true;
            return s.size() > 1 && std::isdigit(static_cast<unsigned char>(s[1]));
        };

        // value for an option at argv[i]: "x = value", "x value" or bare flag
        auto value_after = [&](int& i) -> std::string {
            if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                i += 2;
                return argv[i];
            }
            if (i + 1 < argc && is_value(argv[i + 1])) {
                return argv[++i];
            }
            return "true";
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // everything after a bare "--" is positional
            if (arg == "--") {
                for (++i; i < argc; ++i) result.positional.emplace_back(argv[i]);
                break;
            }

            // ----- LONG OPTIONS -----
            if (arg.rfind("--", 0) == 0) {
                std::string rest = arg.substr(2);
                if (auto eq = rest.find('='); eq != std::string::npos) {
                    std::string val = trim(rest.substr(eq + 1));
                    put(rest.substr(0, eq), val.empty() ? "true" : val);
                } else {
                    put(rest, value_after(i));
                }
                continue;
            }

            // ----- SHORT OPTIONS (including grouped) -----
            if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-') {
                std::string s = arg.substr(1);

                // -x=value
                if (auto eq = s.find('='); eq != std::string::npos && eq >= 1) {
                    std::string val = s.substr(eq + 1);
                    put(std::string(1, s[0]), val.empty() ? "true" : val);
                    continue;
                }

                if (s.size() > 1) {
                    // -abc => a=true,b=true,c=true
                    for (char ch : s) put(std::string(1, ch), "true");
                } else {
                    put(s, value_after(i));
                }
                continue;
            }
            result.positional.push_back(trim(arg));
        }

        return result;
    }

    // last value given for the first of the keys present
    [[nodiscard]] std::optional<std::string> get(std::initializer_list<std::string_view> keys) const {
        for (auto key : keys) {
            if (const auto it = options.find(std::string(key)); it != options.end() && !it->second.empty()) {
                return it->second.back();
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        return get(std::initializer_list<std::string_view>{key});
    }

    // all values given for any of the keys, in command line order per key
    [[nodiscard]] std::vector<std::string> get_all(std::initializer_list<std::string_view> keys) const {
        std::vector<std::string> values;
        for (auto key : keys) {
            if (const auto it = options.find(std::string(key)); it != options.end()) {
                values.insert(values.end(), it->second.begin(), it->second.end());
            }
        }
        return values;
    }

    [[nodiscard]] bool has(std::initializer_list<std::string_view> keys) const {
        return get(keys).has_value();
    }
};

#include "estimator.hpp"
#include "../text/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace tkb {

namespace {

constexpr double RATIO_CODE = 3.0;

// Measured against cl100k_base on typical source files
const std::unordered_map<std::string, double>& ratio_table() {
    static const std::unordered_map<std::string, double> table = {
        {"swift", 3.2},
        {"python", 3.5}, {"py", 3.5},
        {"javascript", 3.0}, {"js", 3.0},
        {"typescript", 3.0}, {"ts", 3.0},
        {"java", 3.4},
        {"kotlin", 3.2}, {"kt", 3.2},
        {"csharp", 3.4}, {"cs", 3.4}, {"c#", 3.4},
        {"cpp", 2.8}, {"c++", 2.8}, {"cxx", 2.8}, {"cc", 2.8}, {"hpp", 2.8},
        {"c", 2.9}, {"h", 2.9},
        {"rust", 3.1}, {"rs", 3.1},
        {"go", 3.3},
        {"html", 2.5}, {"htm", 2.5},
        {"xml", 2.5},
        {"css", 2.7},
        {"json", 2.2},
        {"yaml", 3.8}, {"yml", 3.8},
        {"markdown", 4.2}, {"md", 4.2},
        {"txt", 4.0}, {"text", 4.0},
    };
    return table;
}

} // namespace

double chars_per_token(const std::string& language_hint) {
    std::string key = language_hint;
    if (!key.empty() && key[0] == '.') {
        key.erase(0, 1);
    }
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = ratio_table().find(key);
    return it != ratio_table().end() ? it->second : RATIO_CODE;
}

size_t estimate_tokens(const uint8_t* text, size_t len, const std::string& language_hint) {
    if (len == 0) {
        return 0;
    }

    size_t chars = utf8::count_code_points(text, len);
    size_t estimated = static_cast<size_t>(static_cast<double>(chars) / chars_per_token(language_hint));
    return std::max<size_t>(1, estimated);
}

} // namespace tkb

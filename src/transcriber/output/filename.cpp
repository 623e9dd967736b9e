#include "filename.hpp"

#include <algorithm>
#include <array>
#include <cctype>

static bool is_reserved_device_name(const std::string& name) {
    static constexpr std::array<std::string_view, 4> fixed = {"CON", "PRN", "AUX", "NUL"};

    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (std::find(fixed.begin(), fixed.end(), upper) != fixed.end()) return true;
    if (upper.size() == 4 && (upper.starts_with("COM") || upper.starts_with("LPT"))) {
        return upper[3] >= '1' && upper[3] <= '9';
    }
    return false;
}

std::string sanitize_filename_component(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '<': case '>': case ':': case '"': case '/':
            case '\\': case '|': case '?': case '*': case '\0':
                cleaned += '_';
                break;
            default:
                cleaned += c;
        }
    }

    while (!cleaned.empty() && (cleaned.back() == ' ' || cleaned.back() == '.')) {
        cleaned.pop_back();
    }

    if (cleaned.empty()) return "output";
    if (is_reserved_device_name(cleaned)) return "_" + cleaned;
    return cleaned;
}

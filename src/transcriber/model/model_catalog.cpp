#include "model_catalog.hpp"

#include <algorithm>
#include <utility>

namespace catalog {

struct Entry {
    std::string name;
    std::vector<std::string> precisions;
};

// What ggerganov/whisper.cpp publishes on the mirror, in catalog order.
static const std::vector<Entry>& entries() {
    static const std::vector<Entry> table = {
        {"tiny", {"f16", "q8_0", "q5_1"}},
        {"tiny.en", {"f16", "q5_1"}},
        {"base", {"f16", "q8_0", "q5_1"}},
        {"base.en", {"f16", "q5_1"}},
        {"small", {"f16", "q8_0", "q5_1"}},
        {"small.en", {"f16", "q5_1"}},
        {"medium", {"f16", "q8_0", "q5_0"}},
        {"medium.en", {"f16", "q5_0"}},
        {"large-v1", {"f16"}},
        {"large-v2", {"f16", "q8_0", "q5_0"}},
        {"large-v3", {"f16", "q5_0"}},
        {"large-v3-turbo", {"f16", "q8_0", "q5_0"}},
    };
    return table;
}

static const Entry* find_entry(const std::string& name) {
    for (const auto& e : entries()) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

const std::vector<std::string>& model_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& e : entries()) out.push_back(e.name);
        return out;
    }();
    return names;
}

const std::vector<std::string>& precisions() {
    static const std::vector<std::string> p = {"f16", "q8_0", "q5_1", "q5_0", "q4_0"};
    return p;
}

bool is_known_model(const std::string& name) {
    return find_entry(name) != nullptr;
}

bool is_known_precision(const std::string& precision) {
    const auto& p = precisions();
    return std::find(p.begin(), p.end(), precision) != p.end();
}

bool is_published(const std::string& name, const std::string& precision) {
    auto* e = find_entry(name);
    if (!e) return false;
    return std::find(e->precisions.begin(), e->precisions.end(), precision) != e->precisions.end();
}

std::vector<std::string> published_precisions(const std::string& name) {
    auto* e = find_entry(name);
    return e ? e->precisions : std::vector<std::string>{};
}

std::string closest_published(const std::string& name, const std::string& preferred) {
    if (!find_entry(name) || is_published(name, preferred)) return preferred;
    if (preferred != "f16") {
        // precisions() lists the integer formats from largest to smallest.
        for (const auto& p : precisions()) {
            if (p != "f16" && is_published(name, p)) return p;
        }
    }
    return "f16";
}

std::string file_name(const std::string& name, const std::string& precision) {
    if (precision == "f16") return "ggml-" + name + ".bin";
    return "ggml-" + name + "-" + precision + ".bin";
}

} // namespace catalog

#include "text_stats.hpp"

#include <vector>
#include <zlib.h>

double compression_ratio(std::string_view text) {
    if (text.empty()) return 1.0;

    uLong original = static_cast<uLong>(text.size());
    uLongf packed = compressBound(original);
    std::vector<Bytef> buf(packed);
    if (compress(buf.data(), &packed, reinterpret_cast<const Bytef*>(text.data()), original) != Z_OK
        || packed == 0) {
        return 1.0;
    }
    return static_cast<double>(original) / static_cast<double>(packed);
}

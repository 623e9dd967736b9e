#include "reconcile.hpp"

#include <algorithm>
#include <cmath>

static std::string trimmed(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

static void append_text(Segment& into, const std::string& text) {
    if (text.empty()) return;
    if (!into.text.empty()) into.text += ' ';
    into.text += text;
}

// Boundaries sit on the millisecond grid the outputs are written on, so
// distinct starts stay distinct once written.
static double snap_ms(double t) {
    return std::round(t * 1000.0) / 1000.0;
}

// Clamp to the chunk and the stream, snap, drop empties, order by start.
static void normalize(ChunkReading& r, double duration) {
    double lo = std::max(0.0, r.start);
    double hi = std::min(r.end, duration);
    std::vector<Segment> kept;
    for (auto& s : r.segments) {
        s.text = trimmed(s.text);
        s.start = std::clamp(s.start, lo, std::max(lo, hi));
        s.end = std::clamp(s.end, lo, std::max(lo, hi));
        if (s.text.empty() || s.end <= s.start) continue;

        // Snapping may close up a sub-millisecond segment; it keeps one millisecond.
        s.start = snap_ms(s.start);
        s.end = std::min(snap_ms(s.end), duration);
        if (s.end <= s.start) s.end = std::min(snap_ms(s.start + 0.001), duration);
        if (s.end <= s.start) continue;
        kept.push_back(std::move(s));
    }
    std::stable_sort(kept.begin(), kept.end(),
                     [](const Segment& a, const Segment& b) { return a.start < b.start; });
    r.segments = std::move(kept);
}

static void merge_reading(std::vector<Segment>& merged, double prev_end, ChunkReading& next) {
    const double o_start = next.start;
    const double o_end = std::min(prev_end, next.end);

    if (o_end > o_start) {
        // Earlier segments entirely within the overlap give way to the later reading.
        std::erase_if(merged, [&](const Segment& s) {
            return s.start >= o_start && s.end <= o_end;
        });
    }

    for (auto it = merged.begin(); it != merged.end();) {
        const Segment& a = *it;
        if (a.end <= o_start || a.start >= o_start) {
            ++it;
            continue;
        }

        bool conflicts = std::any_of(next.segments.begin(), next.segments.end(),
                                     [&](const Segment& b) { return b.start < a.end; });
        if (!conflicts) {
            ++it;
            continue;
        }

        double mid = (a.start + a.end) / 2.0;
        if (mid < o_start) {
            // Earlier reading wins: later segments mostly covered by it go,
            // the rest start where it ends.
            double a_end = a.end;
            std::erase_if(next.segments, [&](const Segment& b) {
                return b.start < a_end && (b.start + b.end) / 2.0 < a_end;
            });
            for (auto& b : next.segments) {
                if (b.start < a_end) b.start = a_end;
            }
            ++it;
        } else {
            it = merged.erase(it);
        }
    }

    for (auto& s : next.segments) merged.push_back(std::move(s));
}

std::vector<Segment> reconcile(std::vector<ChunkReading> readings, double duration) {
    std::vector<Segment> merged;
    if (duration <= 0.0) return merged;

    std::stable_sort(readings.begin(), readings.end(),
                     [](const ChunkReading& a, const ChunkReading& b) { return a.start < b.start; });

    double covered_end = 0.0;
    for (auto& r : readings) {
        normalize(r, duration);
        merge_reading(merged, covered_end, r);
        covered_end = std::max(covered_end, r.end);
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const Segment& a, const Segment& b) { return a.start < b.start; });

    // Final pass: no overlaps, strictly increasing starts. Anything squeezed
    // to nothing keeps its words by joining the previous segment.
    std::vector<Segment> out;
    out.reserve(merged.size());
    for (auto& s : merged) {
        if (!out.empty()) {
            Segment& prev = out.back();
            if (s.start < prev.end) s.start = prev.end;
            if (s.end <= s.start) {
                append_text(prev, s.text);
                continue;
            }
        }
        out.push_back(std::move(s));
    }

    for (size_t i = 0; i < out.size(); ++i) out[i].index = static_cast<int>(i);
    return out;
}

bool is_well_ordered(const std::vector<Segment>& segments, double duration) {
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (s.index != static_cast<int>(i)) return false;
        if (!(s.start < s.end) || s.start < 0.0 || s.end > duration) return false;
        if (i > 0) {
            const auto& prev = segments[i - 1];
            if (!(prev.start < s.start) || prev.end > s.start) return false;
        }
    }
    return true;
}

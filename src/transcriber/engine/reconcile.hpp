#pragma once

#include "job.hpp"

#include <vector>

// Segments read from one chunk, already shifted to stream time.
struct ChunkReading {
    double start = 0.0;
    double end = 0.0;
    std::vector<Segment> segments;
};

// Merges chunk readings into a single sequence that is ordered by strictly
// increasing start, free of overlaps, inside [0, duration] and indexed 0..N-1.
// Boundaries are rounded to whole milliseconds; only the stream end may fall
// between them.
//
// Where two consecutive chunks overlap, segments of the earlier chunk lying
// entirely inside the overlap are dropped in favor of the later chunk. A
// segment of the earlier chunk that straddles the later chunk's start is
// kept when its midpoint falls before that start (the later chunk heard less
// than half of it), otherwise the later reading wins; a midpoint exactly at
// the later start counts as closer to the later chunk.
std::vector<Segment> reconcile(std::vector<ChunkReading> readings, double duration);

// True when segments satisfy the ordering guarantees reconcile() gives.
bool is_well_ordered(const std::vector<Segment>& segments, double duration);

#pragma once

#include "errors.hpp"
#include "job.hpp"

#include <string>

struct OutputPaths {
    std::string timestamps_txt;
    std::string segments_json;
    std::string wav;
};

// "HH:MM:SS.mmm"; negative input clamps to zero.
std::string format_timestamp(double seconds);

class ResultWriter {
public:
    // Output file names for input "dir/name.ext": <output_dir>/<name>.timestamps.txt, ...
    static OutputPaths paths_for(const std::string& input_path, const std::string& output_dir);

    // Writes both artifacts. Each file is written to a temporary name in the
    // same directory and renamed into place. When the second file fails the
    // first is removed again.
    Result<OutputPaths> write(const TranscriptResult& result, const std::string& input_path,
                              const std::string& output_dir) const;

    static std::string render_timestamps(const TranscriptResult& result);
    static std::string render_json(const TranscriptResult& result);

    static Result<void> write_atomically(const std::string& path, std::string_view content);
};

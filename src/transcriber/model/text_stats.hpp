#pragma once

#include <string_view>

// Size of text over its deflated size. Repetitive output compresses well,
// so high values flag likely hallucination. Empty text gives 1.
double compression_ratio(std::string_view text);

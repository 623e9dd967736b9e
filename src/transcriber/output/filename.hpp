#pragma once

#include <string>
#include <string_view>

// Makes name safe as a single file name component on Windows, macOS and Linux.
std::string sanitize_filename_component(std::string_view name);

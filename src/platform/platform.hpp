#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
// Falls back to the working directory when the system reports none.
std::filesystem::path temp_dir();

// Returns the working directory, or "." if it cannot be determined.
std::filesystem::path working_dir();

} // namespace platform

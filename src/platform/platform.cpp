#include "platform.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) return working_dir();
    return dir;
}

fs::path working_dir() {
    std::error_code ec;
    fs::path dir = fs::current_path(ec);
    if (ec) return fs::path(".");
    return dir;
}

} // namespace platform

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>

namespace fs = std::filesystem;

// Command handlers behind `flx gen ...` and `flx config ...`.
// Each run_* returns the process exit code.
class FlxCLI {
public:
    explicit FlxCLI(fs::path working_dir);

    // args: everything after "gen", e.g. {"feature", "auth"}
    int run_gen(const std::vector<std::string>& args);

    // args: everything after "config", e.g. {"init"} or {"--state", "bloc"}
    int run_config(const std::vector<std::string>& args);

    void print_usage() const;
    void print_gen_help() const;
    void print_config_help() const;

private:
    int run_config_init();
    int run_set_state(const std::string& state_manager);
    int run_config_show();

    fs::path working_dir_;
};

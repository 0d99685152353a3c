#include "flx_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <algorithm>
#include <iterator>

// ── Interactive prompt helpers ──────────────────────────

// Only "y" / "yes" (any case) confirm. EOF counts as no.
static bool prompt_yes_no(const std::string& question) {
    std::cout << theme::color::SKY << "    " << question << " (y/n): " << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    trim(answer);
    answer = to_lower(answer);
    return answer == "y" || answer == "yes";
}

void FlxCLI::print_config_help() const {
    std::cout << theme::section("Available config subcommands");
    std::cout << theme::usage("init", "Initialize a .flxrc.json config file");
    std::cout << theme::usage("--state <manager>", "Set state manager (getx or bloc)");
    std::cout << theme::usage("show", "Show the effective configuration");
    std::cout << "\n";
}

int FlxCLI::run_config(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("config command requires a subcommand or flag");
        print_config_help();
        return 1;
    }

    // --state may appear anywhere after "config"
    auto state_it = std::find(args.begin(), args.end(), "--state");
    if (state_it != args.end()) {
        if (std::next(state_it) == args.end()) {
            std::cout << theme::fail("--state requires a value (getx or bloc)");
            return 1;
        }
        return run_set_state(*std::next(state_it));
    }

    const std::string& sub = args[0];
    if (sub == "init") return run_config_init();
    if (sub == "show") return run_config_show();

    std::cout << theme::fail("Unknown config subcommand: " + sub);
    print_config_help();
    return 1;
}

int FlxCLI::run_config_init() {
    fs::path path = get_config_path(working_dir_);
    std::cout << theme::info("Initializing " + std::string(CONFIG_FILENAME) + " config file...");

    if (fs::exists(path)) {
        std::cout << theme::step("Config file already exists at " + path.string());
        if (!prompt_yes_no("Do you want to overwrite it?")) {
            std::cout << theme::info("Config initialization cancelled.");
            return 0;
        }
    }

    auto result = write_default_config(path);
    if (result.is_err()) {
        std::cout << theme::fail("Error creating config file: " + result.error);
        return 1;
    }

    std::cout << theme::ok("Successfully created " + std::string(CONFIG_FILENAME) + " config file");
    std::cout << theme::step("You can now edit this file to customize your preferences.");
    return 0;
}

int FlxCLI::run_set_state(const std::string& state_manager) {
    auto parsed = parse_state_manager(state_manager);
    if (!parsed) {
        std::cout << theme::fail("Invalid state manager. Use \"getx\" or \"bloc\".");
        return 1;
    }

    auto result = set_state_manager(*parsed, get_config_path(working_dir_));
    if (result.is_err()) {
        std::cout << theme::fail("Error updating config: " + result.error);
        return 1;
    }

    std::cout << theme::ok("State manager set to: " + state_manager_name(*parsed));
    return 0;
}

int FlxCLI::run_config_show() {
    auto config_result = Config::load(working_dir_);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return 1;
    }
    const Config& config = config_result.value;

    std::string source = config_exists(working_dir_)
        ? get_config_path(working_dir_).string()
        : std::string("(defaults, no ") + CONFIG_FILENAME + ")";

    std::cout << theme::section("Configuration");
    std::cout << theme::kv("File", source);
    std::cout << theme::kv(KEY_USE_FREEZED, config.use_immutable_models() ? "true" : "false");
    std::cout << theme::kv(KEY_USE_EQUATABLE, config.use_value_equality() ? "true" : "false");
    std::cout << theme::kv(KEY_STATE_MANAGER, state_manager_name(config.default_state_manager()));
    std::cout << theme::kv(KEY_AUTHOR, config.author());
    std::cout << "\n";
    return 0;
}

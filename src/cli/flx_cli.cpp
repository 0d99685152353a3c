#include "flx_cli.hpp"
#include "theme.hpp"
#include <generator/file_generator.hpp>
#include <iostream>
#include <utility>

FlxCLI::FlxCLI(fs::path working_dir) : working_dir_(std::move(working_dir)) {}

void FlxCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("flx gen feature <name>", "Generate a full Clean Architecture feature structure");
    std::cout << theme::usage("flx gen screen <name>", "Generate a new screen (page + controller + binding)");
    std::cout << theme::usage("flx gen model <name>", "Generate a model class");
    std::cout << theme::usage("flx gen usecase <name>", "Generate a domain usecase class");
    std::cout << theme::usage("flx gen repository <name>", "Generate repository classes (abstract + implementation)");
    std::cout << theme::usage("flx config init", "Initialize a .flxrc.json config file");
    std::cout << theme::usage("flx config --state <manager>", "Set state manager (getx or bloc)");
    std::cout << theme::usage("flx config show", "Show the effective configuration");
    std::cout << "\n";
    std::cout << theme::usage("flx -h, --help", "Show this help message");
    std::cout << theme::usage("flx -v, --version", "Show version information");
    std::cout << theme::section("Examples");
    std::cout << theme::dim("    flx gen feature auth\n"
                            "    flx gen screen login\n"
                            "    flx gen model user\n"
                            "    flx config init\n"
                            "    flx config --state bloc") << "\n\n";
}

void FlxCLI::print_gen_help() const {
    std::cout << theme::section("Available gen subcommands");
    std::cout << theme::usage("feature <name>", "Generate a full Clean Architecture feature structure");
    std::cout << theme::usage("screen <name>", "Generate a new screen (page + controller + binding)");
    std::cout << theme::usage("model <name>", "Generate a model class");
    std::cout << theme::usage("usecase <name>", "Generate a domain usecase class");
    std::cout << theme::usage("repository <name>", "Generate repository classes (abstract + implementation)");
    std::cout << "\n";
}

int FlxCLI::run_gen(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("gen command requires a subcommand");
        print_gen_help();
        return 1;
    }

    const std::string& sub = args[0];
    auto kind = parse_generation_kind(sub);
    if (!kind) {
        std::cout << theme::fail("Unknown gen subcommand: " + sub);
        print_gen_help();
        return 1;
    }

    if (args.size() < 2 || args[1].empty()) {
        std::cout << theme::fail(sub + " requires a name");
        std::cout << theme::step("Usage: flx gen " + sub + " <name>");
        return 1;
    }
    const std::string& name = args[1];

    auto config_result = Config::load(working_dir_);
    if (config_result.is_err()) {
        std::cout << theme::fail("Error generating " + sub + ": " + config_result.error);
        return 1;
    }

    std::cout << theme::info("Generating " + sub + ": " + name);

    auto result = generate(*kind, name, config_result.value, working_dir_);
    if (result.is_err()) {
        std::cout << theme::fail("Error generating " + sub + ": " + result.error);
        return 1;
    }

    std::cout << theme::section("Generated " + sub + " \"" + name + "\"");
    for (const auto& path : result.value) {
        std::cout << theme::ok(path);
    }

    auto note = generation_note(*kind);
    if (!note.empty()) {
        std::cout << "\n" << theme::step(note);
    }
    std::cout << "\n";
    return 0;
}

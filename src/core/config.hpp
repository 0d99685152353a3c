#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Presentation-layer family. Reactive is GetX, EventDriven is BLoC.
enum class StateManager {
    Reactive,
    EventDriven,
};

class Config {
public:
    // Load ./.flxrc.json (or dir/.flxrc.json). Missing file -> defaults.
    // Malformed JSON or a value of the wrong type (e.g. "false" for a bool)
    // is an error.
    static Result<Config> load(const fs::path& dir = fs::current_path());

    Config() = default;
    Config(bool use_immutable_models, bool use_value_equality,
           StateManager state_manager, std::string author = DEFAULT_AUTHOR);

    // Accessors
    bool use_immutable_models() const { return use_immutable_models_; }
    bool use_value_equality() const { return use_value_equality_; }
    StateManager default_state_manager() const { return state_manager_; }
    const std::string& author() const { return author_; }

private:
    bool use_immutable_models_ = true;
    bool use_value_equality_ = false;
    StateManager state_manager_ = StateManager::Reactive;
    std::string author_ = DEFAULT_AUTHOR;
};

// "getx" / "bloc"
std::string state_manager_name(StateManager state_manager);

// Case-insensitive. Returns nullopt for anything but "getx" or "bloc".
std::optional<StateManager> parse_state_manager(const std::string& name);

// Get paths
fs::path get_config_path(const fs::path& dir = fs::current_path());
bool config_exists(const fs::path& dir = fs::current_path());

// Write the default config document, replacing any existing file.
Result<void> write_default_config(const fs::path& path);

// Rewrite the config file at `path` with defaultStateManager replaced. Every
// other key is kept in place. A missing file starts from the default document.
Result<void> set_state_manager(StateManager state_manager, const fs::path& path);

// `text` as a JSON string literal, control characters escaped.
std::string json_quote(const std::string& text);

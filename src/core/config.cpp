#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// The config file is JSON, which yaml-cpp reads as YAML flow syntax.
static const char* DEFAULT_CONFIG_JSON = R"({
  "useFreezed": true,
  "useEquatable": false,
  "defaultStateManager": "getx",
  "author": "Developer"
}
)";

Config::Config(bool use_immutable_models, bool use_value_equality,
               StateManager state_manager, std::string author)
    : use_immutable_models_(use_immutable_models),
      use_value_equality_(use_value_equality),
      state_manager_(state_manager),
      author_(std::move(author)) {}

std::string state_manager_name(StateManager state_manager) {
    switch (state_manager) {
        case StateManager::EventDriven: return STATE_MANAGER_BLOC;
        case StateManager::Reactive:    break;
    }
    return STATE_MANAGER_GETX;
}

std::optional<StateManager> parse_state_manager(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == STATE_MANAGER_GETX) return StateManager::Reactive;
    if (lower == STATE_MANAGER_BLOC) return StateManager::EventDriven;
    return std::nullopt;
}

fs::path get_config_path(const fs::path& dir) {
    return dir / CONFIG_FILENAME;
}

bool config_exists(const fs::path& dir) {
    return fs::exists(get_config_path(dir));
}

// ── JSON typing on top of yaml-cpp ──────────────────────────
// yaml-cpp tags a quoted scalar "!" and a plain one "?". In JSON only
// strings are quoted, so the tag tells a string from a literal.

static bool is_quoted(const YAML::Node& node) {
    return node.Tag() == "!";
}

static bool is_json_number(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && s[i] == '-') i++;
    if (i >= s.size()) return false;
    if (s[i] == '0') {
        i++;
    } else if (s[i] >= '1' && s[i] <= '9') {
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') i++;
    } else {
        return false;
    }
    if (i < s.size() && s[i] == '.') {
        i++;
        size_t digits = i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') i++;
        if (i == digits) return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
        size_t digits = i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') i++;
        if (i == digits) return false;
    }
    return i == s.size();
}

static bool is_json_literal(const YAML::Node& node) {
    if (is_quoted(node)) return false;
    const std::string& s = node.Scalar();
    return s == "true" || s == "false" || s == "null" || is_json_number(s);
}

// A key counts as present only if it holds a non-null value.
static YAML::Node lookup(const YAML::Node& root, const char* key, const char* alias = nullptr) {
    YAML::Node node = root[key];
    if (node && !node.IsNull()) return node;
    if (alias) {
        YAML::Node aliased = root[alias];
        if (aliased && !aliased.IsNull()) return aliased;
    }
    return YAML::Node(YAML::NodeType::Undefined);
}

static Result<bool> read_bool(const YAML::Node& node, const char* key) {
    if (node.IsScalar() && !is_quoted(node)) {
        if (node.Scalar() == "true") return Result<bool>::Ok(true);
        if (node.Scalar() == "false") return Result<bool>::Ok(false);
    }
    return Result<bool>::Err(fmt::format("\"{}\" must be true or false", key));
}

static Result<std::string> read_string(const YAML::Node& node, const char* key) {
    if (node.IsScalar() && is_quoted(node)) {
        return Result<std::string>::Ok(node.Scalar());
    }
    return Result<std::string>::Err(fmt::format("\"{}\" must be a string", key));
}

static Result<Config> parse_config(const YAML::Node& root) {
    Config defaults;

    bool use_freezed = defaults.use_immutable_models();
    if (auto node = lookup(root, KEY_USE_FREEZED, KEY_USE_FREEZED_ALIAS)) {
        auto value = read_bool(node, KEY_USE_FREEZED);
        if (value.is_err()) return Result<Config>::Err(value.error);
        use_freezed = value.value;
    }

    bool use_equatable = defaults.use_value_equality();
    if (auto node = lookup(root, KEY_USE_EQUATABLE, KEY_USE_EQUATABLE_ALIAS)) {
        auto value = read_bool(node, KEY_USE_EQUATABLE);
        if (value.is_err()) return Result<Config>::Err(value.error);
        use_equatable = value.value;
    }

    StateManager state_manager = defaults.default_state_manager();
    if (auto node = lookup(root, KEY_STATE_MANAGER)) {
        auto value = read_string(node, KEY_STATE_MANAGER);
        if (value.is_err()) return Result<Config>::Err(value.error);
        auto parsed = parse_state_manager(value.value);
        if (parsed) {
            state_manager = *parsed;
        } else {
            // Anything that is not "bloc" means GetX
            flx_log(fmt::format("config: unknown state manager '{}', using {}",
                                value.value, STATE_MANAGER_GETX));
        }
    }

    std::string author = defaults.author();
    if (auto node = lookup(root, KEY_AUTHOR)) {
        auto value = read_string(node, KEY_AUTHOR);
        if (value.is_err()) return Result<Config>::Err(value.error);
        author = value.value;
    }

    return Result<Config>::Ok(Config(use_freezed, use_equatable, state_manager, author));
}

Result<Config> Config::load(const fs::path& dir) {
    fs::path path = get_config_path(dir);

    if (!fs::exists(path)) {
        flx_log(fmt::format("config: {} not found, using defaults", path.string()));
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<Config>::Err(
                fmt::format("Invalid config file {}: expected a JSON object", path.string()));
        }
        auto parsed = parse_config(root);
        if (parsed.is_err()) {
            return Result<Config>::Err(
                fmt::format("Invalid config file {}: {}", path.string(), parsed.error));
        }
        const Config& config = parsed.value;
        flx_log(fmt::format("config: loaded {} (freezed={}, equatable={}, state={})",
                            path.string(), config.use_immutable_models(),
                            config.use_value_equality(),
                            state_manager_name(config.default_state_manager())));
        return parsed;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(
            fmt::format("Invalid config file {}: {}", path.string(), e.what()));
    }
}

// ── Writing ─────────────────────────────────────────────────

std::string json_quote(const std::string& text) {
    std::string out = "\"";
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
    return out;
}

// Two-space indentation, one member per line. Plain scalars that are not
// JSON literals (YAML-only forms such as `yes` or `~x`) are written as strings.
static void append_json(std::string& out, const YAML::Node& node, int depth) {
    const std::string pad(static_cast<size_t>(depth + 1) * 2, ' ');
    const std::string close_pad(static_cast<size_t>(depth) * 2, ' ');

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            out += "null";
            return;
        case YAML::NodeType::Scalar:
            out += is_json_literal(node) ? node.Scalar() : json_quote(node.Scalar());
            return;
        case YAML::NodeType::Sequence: {
            if (node.size() == 0) { out += "[]"; return; }
            out += "[\n";
            bool first = true;
            for (const auto& item : node) {
                if (!first) out += ",\n";
                first = false;
                out += pad;
                append_json(out, item, depth + 1);
            }
            out += "\n" + close_pad + "]";
            return;
        }
        case YAML::NodeType::Map: {
            if (node.size() == 0) { out += "{}"; return; }
            out += "{\n";
            bool first = true;
            for (const auto& member : node) {
                if (!first) out += ",\n";
                first = false;
                out += pad + json_quote(member.first.Scalar()) + ": ";
                append_json(out, member.second, depth + 1);
            }
            out += "\n" + close_pad + "}";
            return;
        }
    }
}

static Result<void> write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + path.string());
    }
    out << text;
    out.close();
    if (out.fail()) {
        return Result<void>::Err("Failed to write config file " + path.string());
    }
    return Result<void>::Ok();
}

Result<void> write_default_config(const fs::path& path) {
    auto result = write_text(path, DEFAULT_CONFIG_JSON);
    if (result.is_ok()) {
        flx_log("config: wrote defaults to " + path.string());
    }
    return result;
}

Result<void> set_state_manager(StateManager state_manager, const fs::path& path) {
    std::string text;
    try {
        YAML::Node root = fs::exists(path) ? YAML::LoadFile(path.string())
                                           : YAML::Load(DEFAULT_CONFIG_JSON);
        if (!root.IsMap()) {
            return Result<void>::Err(
                fmt::format("Invalid config file {}: expected a JSON object", path.string()));
        }
        root[KEY_STATE_MANAGER] = state_manager_name(state_manager);
        append_json(text, root, 0);
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(
            fmt::format("Invalid config file {}: {}", path.string(), e.what()));
    }

    auto result = write_text(path, text + "\n");
    if (result.is_ok()) {
        flx_log(fmt::format("config: {} set to {} in {}", KEY_STATE_MANAGER,
                            state_manager_name(state_manager), path.string()));
    }
    return result;
}

#pragma once

#include <string>
#include <core/config.hpp>

// Entity/model family, in precedence order.
enum class ModelStyle {
    Immutable,       // freezed
    ValueEquality,   // equatable
    Plain,
};

// Template family selection for one render. Build it with template_options()
// so every artifact agrees on precedence.
struct TemplateOptions {
    ModelStyle model_style = ModelStyle::Immutable;
    StateManager state_manager = StateManager::Reactive;
};

// Immutable wins over value equality; value equality wins over plain.
ModelStyle model_style(const Config& config);

TemplateOptions template_options(const Config& config);

// Replace {{NAME_SNAKE}}, {{NAME_PASCAL}} and {{NAME_CAMEL}} in `text` with
// the casing forms of `name`. Single pass: substituted values are never
// rescanned. Unknown {{...}} sequences are copied through.
std::string substitute(const std::string& text, const std::string& name);

// ── Artifact renderers ──────────────────────────────────────
// Pure: no validation, no I/O. Relative imports inside the rendered text
// assume the feature layout produced by plan_feature().

std::string render_entity(const std::string& name, const TemplateOptions& opts);
std::string render_model(const std::string& name, const TemplateOptions& opts);
std::string render_repository_interface(const std::string& name, const TemplateOptions& opts);
std::string render_repository_implementation(const std::string& name, const TemplateOptions& opts);
std::string render_data_source(const std::string& name, const TemplateOptions& opts);
std::string render_usecase(const std::string& name, const TemplateOptions& opts);

// GetX controller or BLoC bloc, depending on the state manager.
std::string render_controller(const std::string& name, const TemplateOptions& opts);
std::string render_page(const std::string& name, const TemplateOptions& opts);
std::string render_binding(const std::string& name, const TemplateOptions& opts);

// BLoC only; emitted next to render_controller() when the state manager is EventDriven.
std::string render_bloc_event(const std::string& name, const TemplateOptions& opts);
std::string render_bloc_state(const std::string& name, const TemplateOptions& opts);

// Screen-only bodies: same artifact kinds, no use case or repository wiring.
std::string render_simple_controller(const std::string& name, const TemplateOptions& opts);
std::string render_simple_page(const std::string& name, const TemplateOptions& opts);
std::string render_simple_binding(const std::string& name, const TemplateOptions& opts);
std::string render_simple_bloc_event(const std::string& name, const TemplateOptions& opts);
std::string render_simple_bloc_state(const std::string& name, const TemplateOptions& opts);

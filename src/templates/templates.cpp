#include "templates.hpp"
#include <naming/naming.hpp>
#include <utility>

// Defined in model_templates.cpp
std::string freezed_entity_template();
std::string equatable_entity_template();
std::string plain_entity_template();
std::string freezed_model_template();
std::string equatable_model_template();
std::string plain_model_template();

// Defined in data_templates.cpp
std::string repository_interface_template();
std::string repository_implementation_template();
std::string data_source_template();
std::string usecase_template();

// Defined in getx_templates.cpp
std::string getx_controller_template();
std::string getx_page_template();
std::string getx_binding_template();
std::string getx_simple_controller_template();
std::string getx_simple_page_template();
std::string getx_simple_binding_template();

// Defined in bloc_templates.cpp
std::string bloc_template();
std::string bloc_event_template();
std::string bloc_state_template();
std::string bloc_page_template();
std::string bloc_provider_template();
std::string bloc_simple_template();
std::string bloc_simple_event_template();
std::string bloc_simple_state_template();
std::string bloc_simple_page_template();
std::string bloc_simple_provider_template();

ModelStyle model_style(const Config& config) {
    if (config.use_immutable_models()) return ModelStyle::Immutable;
    if (config.use_value_equality()) return ModelStyle::ValueEquality;
    return ModelStyle::Plain;
}

TemplateOptions template_options(const Config& config) {
    TemplateOptions opts;
    opts.model_style = model_style(config);
    opts.state_manager = config.default_state_manager();
    return opts;
}

std::string substitute(const std::string& text, const std::string& name) {
    const auto forms = naming::derive(name);
    const std::pair<std::string, const std::string*> placeholders[] = {
        {"{{NAME_SNAKE}}", &forms.snake},
        {"{{NAME_PASCAL}}", &forms.pascal},
        {"{{NAME_CAMEL}}", &forms.camel},
    };

    std::string result;
    result.reserve(text.size() + text.size() / 4);
    std::string::size_type pos = 0;
    while (pos < text.size()) {
        auto open = text.find("{{", pos);
        if (open == std::string::npos) {
            result.append(text, pos, std::string::npos);
            break;
        }
        result.append(text, pos, open - pos);

        bool matched = false;
        for (const auto& [placeholder, value] : placeholders) {
            if (text.compare(open, placeholder.size(), placeholder) == 0) {
                result += *value;
                pos = open + placeholder.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            result += text[open];
            pos = open + 1;
        }
    }
    return result;
}

// ── Entity / model ──────────────────────────────────────────

std::string render_entity(const std::string& name, const TemplateOptions& opts) {
    switch (opts.model_style) {
        case ModelStyle::Immutable:     return substitute(freezed_entity_template(), name);
        case ModelStyle::ValueEquality: return substitute(equatable_entity_template(), name);
        case ModelStyle::Plain:         break;
    }
    return substitute(plain_entity_template(), name);
}

std::string render_model(const std::string& name, const TemplateOptions& opts) {
    switch (opts.model_style) {
        case ModelStyle::Immutable:     return substitute(freezed_model_template(), name);
        case ModelStyle::ValueEquality: return substitute(equatable_model_template(), name);
        case ModelStyle::Plain:         break;
    }
    return substitute(plain_model_template(), name);
}

// ── Data / domain (single body) ─────────────────────────────

std::string render_repository_interface(const std::string& name, const TemplateOptions&) {
    return substitute(repository_interface_template(), name);
}

std::string render_repository_implementation(const std::string& name, const TemplateOptions&) {
    return substitute(repository_implementation_template(), name);
}

std::string render_data_source(const std::string& name, const TemplateOptions&) {
    return substitute(data_source_template(), name);
}

std::string render_usecase(const std::string& name, const TemplateOptions&) {
    return substitute(usecase_template(), name);
}

// ── Presentation ────────────────────────────────────────────

std::string render_controller(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_template(), name);
    }
    return substitute(getx_controller_template(), name);
}

std::string render_page(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_page_template(), name);
    }
    return substitute(getx_page_template(), name);
}

std::string render_binding(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_provider_template(), name);
    }
    return substitute(getx_binding_template(), name);
}

std::string render_bloc_event(const std::string& name, const TemplateOptions&) {
    return substitute(bloc_event_template(), name);
}

std::string render_bloc_state(const std::string& name, const TemplateOptions&) {
    return substitute(bloc_state_template(), name);
}

// ── Screen-only ─────────────────────────────────────────────

std::string render_simple_controller(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_simple_template(), name);
    }
    return substitute(getx_simple_controller_template(), name);
}

std::string render_simple_page(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_simple_page_template(), name);
    }
    return substitute(getx_simple_page_template(), name);
}

std::string render_simple_binding(const std::string& name, const TemplateOptions& opts) {
    if (opts.state_manager == StateManager::EventDriven) {
        return substitute(bloc_simple_provider_template(), name);
    }
    return substitute(getx_simple_binding_template(), name);
}

std::string render_simple_bloc_event(const std::string& name, const TemplateOptions&) {
    return substitute(bloc_simple_event_template(), name);
}

std::string render_simple_bloc_state(const std::string& name, const TemplateOptions&) {
    return substitute(bloc_simple_state_template(), name);
}

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <templates/templates.hpp>

namespace fs = std::filesystem;

enum class GenerationKind {
    Feature,      // full data/domain/presentation tree under lib/features/<snake>
    Screen,       // pages + bindings + controller or bloc, no data layer
    Model,        // lib/shared/models
    UseCase,      // lib/shared/usecases
    Repository,   // lib/shared/repositories (+ implementations/)
};

struct GeneratedFile {
    std::string path;       // relative to the output root, e.g. "lib/shared/models/user_model.dart"
    std::string content;
};

struct GenerationPlan {
    GenerationKind kind;
    std::vector<std::string> directories;   // created before any file is written
    std::vector<GeneratedFile> files;       // written in this order
};

// "feature", "screen", "model", "usecase", "repository"
std::string generation_kind_name(GenerationKind kind);
std::optional<GenerationKind> parse_generation_kind(const std::string& name);

// Hint shown after shared-folder generations; empty for feature and screen.
std::string generation_note(GenerationKind kind);

// Rejects empty and whitespace-only names, and names whose snake_case form is
// empty.
Result<void> validate_entity_name(const std::string& name);

// ── Plans ───────────────────────────────────────────────────
// Pure. Callers validate the name first.

GenerationPlan plan_feature(const std::string& name, const TemplateOptions& opts);
GenerationPlan plan_screen(const std::string& name, const TemplateOptions& opts);
GenerationPlan plan_model(const std::string& name, const TemplateOptions& opts);
GenerationPlan plan_usecase(const std::string& name, const TemplateOptions& opts);
GenerationPlan plan_repository(const std::string& name, const TemplateOptions& opts);
GenerationPlan build_plan(GenerationKind kind, const std::string& name, const TemplateOptions& opts);

// Create every plan directory under `root`, then write every file in order,
// truncating existing files. Stops at the first failure; files already
// written are left in place. Returns the plan-relative paths written.
Result<std::vector<std::string>> materialize(const GenerationPlan& plan, const fs::path& root);

// ── Operations ──────────────────────────────────────────────
// validate -> plan -> materialize.

Result<std::vector<std::string>> generate(GenerationKind kind, const std::string& name,
                                          const Config& config,
                                          const fs::path& root = fs::current_path());

Result<std::vector<std::string>> generate_feature(const std::string& name, const Config& config,
                                                  const fs::path& root = fs::current_path());
Result<std::vector<std::string>> generate_screen(const std::string& name, const Config& config,
                                                 const fs::path& root = fs::current_path());
Result<std::vector<std::string>> generate_model(const std::string& name, const Config& config,
                                                const fs::path& root = fs::current_path());
Result<std::vector<std::string>> generate_usecase(const std::string& name, const Config& config,
                                                  const fs::path& root = fs::current_path());
Result<std::vector<std::string>> generate_repository(const std::string& name, const Config& config,
                                                     const fs::path& root = fs::current_path());

#include "file_generator.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <naming/naming.hpp>
#include <fmt/format.h>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

std::string generation_kind_name(GenerationKind kind) {
    switch (kind) {
        case GenerationKind::Feature:    return "feature";
        case GenerationKind::Screen:     return "screen";
        case GenerationKind::Model:      return "model";
        case GenerationKind::UseCase:    return "usecase";
        case GenerationKind::Repository: return "repository";
    }
    return "unknown";
}

std::optional<GenerationKind> parse_generation_kind(const std::string& name) {
    if (name == "feature")    return GenerationKind::Feature;
    if (name == "screen")     return GenerationKind::Screen;
    if (name == "model")      return GenerationKind::Model;
    if (name == "usecase")    return GenerationKind::UseCase;
    if (name == "repository") return GenerationKind::Repository;
    return std::nullopt;
}

std::string generation_note(GenerationKind kind) {
    switch (kind) {
        case GenerationKind::Model:
            return "Model generated in shared folder. For feature-specific models, use \"flx gen feature <name>\"";
        case GenerationKind::UseCase:
            return "UseCase generated in shared folder. For feature-specific usecases, use \"flx gen feature <name>\"";
        case GenerationKind::Repository:
            return "Repository generated in shared folder. For feature-specific repositories, use \"flx gen feature <name>\"";
        case GenerationKind::Feature:
        case GenerationKind::Screen:
            break;
    }
    return "";
}

Result<void> validate_entity_name(const std::string& name) {
    if (is_blank(name)) {
        return Result<void>::Err("Name must not be empty");
    }
    // e.g. "---": nothing left to build a path segment from
    if (naming::to_snake(name).empty()) {
        return Result<void>::Err("Name '" + name + "' has no usable characters");
    }
    return Result<void>::Ok();
}

// ── Plans ───────────────────────────────────────────────────

static std::string feature_root(const std::string& snake) {
    return fmt::format("{}/{}", FEATURES_ROOT, snake);
}

static std::string state_dir(const std::string& root, StateManager state_manager) {
    if (state_manager == StateManager::EventDriven) {
        return root + "/presentation/bloc";
    }
    return root + "/presentation/controllers";
}

GenerationPlan plan_feature(const std::string& name, const TemplateOptions& opts) {
    const std::string snake = naming::to_snake(name);
    const std::string root = feature_root(snake);
    const std::string state = state_dir(root, opts.state_manager);

    GenerationPlan plan;
    plan.kind = GenerationKind::Feature;
    plan.directories = {
        root + "/data/datasources",
        root + "/data/models",
        root + "/data/repositories",
        root + "/domain/entities",
        root + "/domain/repositories",
        root + "/domain/usecases",
        root + "/presentation/pages",
        root + "/presentation/bindings",
        state,
    };

    plan.files = {
        {fmt::format("{}/domain/entities/{}_entity.dart", root, snake),
            render_entity(name, opts)},
        {fmt::format("{}/data/models/{}_model.dart", root, snake),
            render_model(name, opts)},
        {fmt::format("{}/domain/repositories/{}_repository.dart", root, snake),
            render_repository_interface(name, opts)},
        {fmt::format("{}/data/repositories/{}_repository_impl.dart", root, snake),
            render_repository_implementation(name, opts)},
        {fmt::format("{}/data/datasources/{}_remote_data_source.dart", root, snake),
            render_data_source(name, opts)},
        {fmt::format("{}/domain/usecases/{}_usecase.dart", root, snake),
            render_usecase(name, opts)},
        {fmt::format("{}/presentation/pages/{}_page.dart", root, snake),
            render_page(name, opts)},
        {fmt::format("{}/presentation/bindings/{}_binding.dart", root, snake),
            render_binding(name, opts)},
    };

    if (opts.state_manager == StateManager::EventDriven) {
        plan.files.push_back({fmt::format("{}/{}_bloc.dart", state, snake),
                              render_controller(name, opts)});
        plan.files.push_back({fmt::format("{}/{}_event.dart", state, snake),
                              render_bloc_event(name, opts)});
        plan.files.push_back({fmt::format("{}/{}_state.dart", state, snake),
                              render_bloc_state(name, opts)});
    } else {
        plan.files.push_back({fmt::format("{}/{}_controller.dart", state, snake),
                              render_controller(name, opts)});
    }
    return plan;
}

GenerationPlan plan_screen(const std::string& name, const TemplateOptions& opts) {
    const std::string snake = naming::to_snake(name);
    const std::string root = feature_root(snake);
    const std::string state = state_dir(root, opts.state_manager);

    GenerationPlan plan;
    plan.kind = GenerationKind::Screen;
    plan.directories = {
        root + "/presentation/pages",
        root + "/presentation/bindings",
        state,
    };

    plan.files = {
        {fmt::format("{}/presentation/pages/{}_page.dart", root, snake),
            render_simple_page(name, opts)},
        {fmt::format("{}/presentation/bindings/{}_binding.dart", root, snake),
            render_simple_binding(name, opts)},
    };

    if (opts.state_manager == StateManager::EventDriven) {
        plan.files.push_back({fmt::format("{}/{}_bloc.dart", state, snake),
                              render_simple_controller(name, opts)});
        plan.files.push_back({fmt::format("{}/{}_event.dart", state, snake),
                              render_simple_bloc_event(name, opts)});
        plan.files.push_back({fmt::format("{}/{}_state.dart", state, snake),
                              render_simple_bloc_state(name, opts)});
    } else {
        plan.files.push_back({fmt::format("{}/{}_controller.dart", state, snake),
                              render_simple_controller(name, opts)});
    }
    return plan;
}

GenerationPlan plan_model(const std::string& name, const TemplateOptions& opts) {
    const std::string dir = fmt::format("{}/models", SHARED_ROOT);

    GenerationPlan plan;
    plan.kind = GenerationKind::Model;
    plan.directories = {dir};
    plan.files = {
        {fmt::format("{}/{}_model.dart", dir, naming::to_snake(name)), render_model(name, opts)},
    };
    return plan;
}

GenerationPlan plan_usecase(const std::string& name, const TemplateOptions& opts) {
    const std::string dir = fmt::format("{}/usecases", SHARED_ROOT);

    GenerationPlan plan;
    plan.kind = GenerationKind::UseCase;
    plan.directories = {dir};
    plan.files = {
        {fmt::format("{}/{}_usecase.dart", dir, naming::to_snake(name)), render_usecase(name, opts)},
    };
    return plan;
}

GenerationPlan plan_repository(const std::string& name, const TemplateOptions& opts) {
    const std::string snake = naming::to_snake(name);
    const std::string dir = fmt::format("{}/repositories", SHARED_ROOT);
    const std::string impl_dir = dir + "/implementations";

    GenerationPlan plan;
    plan.kind = GenerationKind::Repository;
    plan.directories = {dir, impl_dir};
    plan.files = {
        {fmt::format("{}/{}_repository.dart", dir, snake),
            render_repository_interface(name, opts)},
        {fmt::format("{}/{}_repository_impl.dart", impl_dir, snake),
            render_repository_implementation(name, opts)},
    };
    return plan;
}

GenerationPlan build_plan(GenerationKind kind, const std::string& name, const TemplateOptions& opts) {
    switch (kind) {
        case GenerationKind::Feature:    return plan_feature(name, opts);
        case GenerationKind::Screen:     return plan_screen(name, opts);
        case GenerationKind::Model:      return plan_model(name, opts);
        case GenerationKind::UseCase:    return plan_usecase(name, opts);
        case GenerationKind::Repository: break;
    }
    return plan_repository(name, opts);
}

// ── Disk ────────────────────────────────────────────────────

// Existing directories are fine; an existing non-directory is not.
static Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    bool created = fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Failed to create directory {}: {}", dir.string(), ec.message()));
    }
    if (created) flx_log("mkdir " + dir.string());
    return Result<void>::Ok();
}

// The parent directory already exists: materialize creates every plan
// directory before the first write.
static Result<void> write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err(
            fmt::format("Failed to write {}: {}", path.string(), std::strerror(errno)));
    }
    out << content;
    out.close();
    if (out.fail()) {
        return Result<void>::Err(fmt::format("Failed to write {}: write error", path.string()));
    }
    return Result<void>::Ok();
}

Result<std::vector<std::string>> materialize(const GenerationPlan& plan, const fs::path& root) {
    using PathsResult = Result<std::vector<std::string>>;

    for (const auto& dir : plan.directories) {
        auto result = ensure_directory(root / dir);
        if (result.is_err()) {
            flx_log("materialize: " + result.error);
            return PathsResult::Err(result.error);
        }
    }

    std::vector<std::string> written;
    written.reserve(plan.files.size());
    for (const auto& file : plan.files) {
        auto result = write_file(root / file.path, file.content);
        if (result.is_err()) {
            flx_log(fmt::format("materialize: {} ({} of {} files written)",
                                result.error, written.size(), plan.files.size()));
            return PathsResult::Err(result.error);
        }
        flx_log(fmt::format("write {} ({} bytes)", file.path, file.content.size()));
        written.push_back(file.path);
    }
    return PathsResult::Ok(written);
}

// ── Operations ──────────────────────────────────────────────

Result<std::vector<std::string>> generate(GenerationKind kind, const std::string& name,
                                          const Config& config, const fs::path& root) {
    auto valid = validate_entity_name(name);
    if (valid.is_err()) {
        return Result<std::vector<std::string>>::Err(valid.error);
    }

    auto plan = build_plan(kind, name, template_options(config));
    flx_log(fmt::format("gen {} '{}' -> {} dirs, {} files in {}",
                        generation_kind_name(kind), name, plan.directories.size(),
                        plan.files.size(), root.string()));
    return materialize(plan, root);
}

Result<std::vector<std::string>> generate_feature(const std::string& name, const Config& config,
                                                  const fs::path& root) {
    return generate(GenerationKind::Feature, name, config, root);
}

Result<std::vector<std::string>> generate_screen(const std::string& name, const Config& config,
                                                 const fs::path& root) {
    return generate(GenerationKind::Screen, name, config, root);
}

Result<std::vector<std::string>> generate_model(const std::string& name, const Config& config,
                                                const fs::path& root) {
    return generate(GenerationKind::Model, name, config, root);
}

Result<std::vector<std::string>> generate_usecase(const std::string& name, const Config& config,
                                                  const fs::path& root) {
    return generate(GenerationKind::UseCase, name, config, root);
}

Result<std::vector<std::string>> generate_repository(const std::string& name, const Config& config,
                                                     const fs::path& root) {
    return generate(GenerationKind::Repository, name, config, root);
}

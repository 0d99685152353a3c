#include <gtest/gtest.h>
#include <generator/file_generator.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace fs = std::filesystem;

class FileGeneratorTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "flx_generator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read_file(const std::string& rel_path) {
        std::ifstream in(test_dir / rel_path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
    }

    // Every regular file under test_dir, relative and sorted
    std::vector<std::string> files_on_disk() {
        std::vector<std::string> files;
        for (const auto& entry : fs::recursive_directory_iterator(test_dir)) {
            if (entry.is_regular_file()) {
                files.push_back(fs::relative(entry.path(), test_dir).generic_string());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    static Config bloc_config() {
        return Config(true, false, StateManager::EventDriven);
    }
};

// ── Feature ─────────────────────────────────────────────────

TEST_F(FileGeneratorTest, FeatureDefaultLayout) {
    auto result = generate_feature("auth", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    std::vector<std::string> expected = {
        "lib/features/auth/domain/entities/auth_entity.dart",
        "lib/features/auth/data/models/auth_model.dart",
        "lib/features/auth/domain/repositories/auth_repository.dart",
        "lib/features/auth/data/repositories/auth_repository_impl.dart",
        "lib/features/auth/data/datasources/auth_remote_data_source.dart",
        "lib/features/auth/domain/usecases/auth_usecase.dart",
        "lib/features/auth/presentation/pages/auth_page.dart",
        "lib/features/auth/presentation/bindings/auth_binding.dart",
        "lib/features/auth/presentation/controllers/auth_controller.dart",
    };
    EXPECT_EQ(result.value, expected);

    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(files_on_disk(), expected);
    EXPECT_FALSE(fs::exists(test_dir / "lib/features/auth/presentation/bloc"));
}

TEST_F(FileGeneratorTest, FeatureCreatesAllLayerDirectories) {
    ASSERT_TRUE(generate_feature("auth", Config{}, test_dir).is_ok());

    for (const char* dir : {"data/datasources", "data/models", "data/repositories",
                            "domain/entities", "domain/repositories", "domain/usecases",
                            "presentation/pages", "presentation/bindings",
                            "presentation/controllers"}) {
        EXPECT_TRUE(fs::is_directory(test_dir / "lib/features/auth" / dir)) << dir;
    }
}

TEST_F(FileGeneratorTest, FeatureBlocLayout) {
    auto result = generate_feature("auth", bloc_config(), test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    ASSERT_EQ(result.value.size(), 11u);
    EXPECT_EQ(result.value[8], "lib/features/auth/presentation/bloc/auth_bloc.dart");
    EXPECT_EQ(result.value[9], "lib/features/auth/presentation/bloc/auth_event.dart");
    EXPECT_EQ(result.value[10], "lib/features/auth/presentation/bloc/auth_state.dart");

    for (const auto& path : files_on_disk()) {
        EXPECT_EQ(path.find("/controllers/"), std::string::npos) << path;
    }
    EXPECT_FALSE(fs::exists(test_dir / "lib/features/auth/presentation/controllers"));
}

TEST_F(FileGeneratorTest, FeatureUsesSnakeCaseForPaths) {
    auto result = generate_feature("UserProfile", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(fs::exists(
        test_dir / "lib/features/user_profile/domain/entities/user_profile_entity.dart"));
}

TEST_F(FileGeneratorTest, FeatureContentMatchesTemplates) {
    ASSERT_TRUE(generate_feature("auth", Config{}, test_dir).is_ok());

    auto opts = template_options(Config{});
    EXPECT_EQ(read_file("lib/features/auth/domain/entities/auth_entity.dart"),
              render_entity("auth", opts));
    EXPECT_EQ(read_file("lib/features/auth/presentation/controllers/auth_controller.dart"),
              render_controller("auth", opts));
}

// ── Screen ──────────────────────────────────────────────────

TEST_F(FileGeneratorTest, ScreenGetx) {
    auto result = generate_screen("login", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    std::vector<std::string> expected = {
        "lib/features/login/presentation/pages/login_page.dart",
        "lib/features/login/presentation/bindings/login_binding.dart",
        "lib/features/login/presentation/controllers/login_controller.dart",
    };
    EXPECT_EQ(result.value, expected);
    EXPECT_FALSE(fs::exists(test_dir / "lib/features/login/data"));
    EXPECT_FALSE(fs::exists(test_dir / "lib/features/login/domain"));
}

TEST_F(FileGeneratorTest, ScreenBloc) {
    auto result = generate_screen("login", bloc_config(), test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    ASSERT_EQ(result.value.size(), 5u);
    EXPECT_EQ(result.value[2], "lib/features/login/presentation/bloc/login_bloc.dart");
    EXPECT_EQ(result.value[3], "lib/features/login/presentation/bloc/login_event.dart");
    EXPECT_EQ(result.value[4], "lib/features/login/presentation/bloc/login_state.dart");
}

// ── Shared-folder generators ────────────────────────────────

TEST_F(FileGeneratorTest, ModelInSharedFolder) {
    auto result = generate_model("user", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 1u);
    EXPECT_EQ(result.value[0], "lib/shared/models/user_model.dart");
    EXPECT_TRUE(fs::exists(test_dir / "lib/shared/models/user_model.dart"));
}

TEST_F(FileGeneratorTest, UseCaseInSharedFolder) {
    auto result = generate_usecase("get_user", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 1u);
    EXPECT_EQ(result.value[0], "lib/shared/usecases/get_user_usecase.dart");
}

TEST_F(FileGeneratorTest, RepositoryInSharedFolder) {
    auto result = generate_repository("user", Config{}, test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    std::vector<std::string> expected = {
        "lib/shared/repositories/user_repository.dart",
        "lib/shared/repositories/implementations/user_repository_impl.dart",
    };
    EXPECT_EQ(result.value, expected);
}

TEST(GenerationNote, OnlySharedKindsHaveNotes) {
    EXPECT_TRUE(generation_note(GenerationKind::Feature).empty());
    EXPECT_TRUE(generation_note(GenerationKind::Screen).empty());
    EXPECT_FALSE(generation_note(GenerationKind::Model).empty());
    EXPECT_FALSE(generation_note(GenerationKind::UseCase).empty());
    EXPECT_FALSE(generation_note(GenerationKind::Repository).empty());
}

TEST(GenerationKindNames, ParseRoundTrip) {
    for (auto kind : {GenerationKind::Feature, GenerationKind::Screen, GenerationKind::Model,
                      GenerationKind::UseCase, GenerationKind::Repository}) {
        auto parsed = parse_generation_kind(generation_kind_name(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parse_generation_kind("widget").has_value());
    EXPECT_FALSE(parse_generation_kind("Feature").has_value());
}

// ── Overwrite and idempotence ───────────────────────────────

TEST_F(FileGeneratorTest, RerunIsByteIdentical) {
    ASSERT_TRUE(generate_feature("auth", Config{}, test_dir).is_ok());
    auto first = files_on_disk();
    std::vector<std::string> first_contents;
    for (const auto& path : first) first_contents.push_back(read_file(path));

    ASSERT_TRUE(generate_feature("auth", Config{}, test_dir).is_ok());
    EXPECT_EQ(files_on_disk(), first);
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(read_file(first[i]), first_contents[i]) << first[i];
    }
}

TEST_F(FileGeneratorTest, OverwritesEditedFiles) {
    const std::string path = "lib/shared/models/user_model.dart";
    write_file(path, "// hand edits that are much longer than nothing at all\n"
                     "// and more hand edits so truncation matters\n");

    ASSERT_TRUE(generate_model("user", Config{}, test_dir).is_ok());
    EXPECT_EQ(read_file(path), render_model("user", template_options(Config{})));
}

TEST_F(FileGeneratorTest, LeavesUnrelatedFilesAlone) {
    write_file("lib/features/auth/notes.txt", "keep me");
    ASSERT_TRUE(generate_feature("auth", Config{}, test_dir).is_ok());
    EXPECT_EQ(read_file("lib/features/auth/notes.txt"), "keep me");
}

// ── Validation ──────────────────────────────────────────────

TEST_F(FileGeneratorTest, EmptyNameRejected) {
    auto result = generate_feature("", Config{}, test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(fs::exists(test_dir / "lib"));
}

TEST_F(FileGeneratorTest, EmptyModelNameRejected) {
    auto result = generate_model("", Config{}, test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error, "Name must not be empty");
    EXPECT_TRUE(files_on_disk().empty());
    EXPECT_FALSE(fs::exists(test_dir / "lib"));
}

TEST_F(FileGeneratorTest, WhitespaceNameRejected) {
    for (auto kind : {GenerationKind::Feature, GenerationKind::Screen, GenerationKind::Model,
                      GenerationKind::UseCase, GenerationKind::Repository}) {
        auto result = generate(kind, "  \t ", Config{}, test_dir);
        EXPECT_TRUE(result.is_err()) << generation_kind_name(kind);
    }
    EXPECT_TRUE(files_on_disk().empty());
    EXPECT_FALSE(fs::exists(test_dir / "lib"));
}

TEST(ValidateEntityName, SeparatorOnlyNameRejected) {
    EXPECT_TRUE(validate_entity_name("---").is_err());
    EXPECT_TRUE(validate_entity_name("auth").is_ok());
    EXPECT_TRUE(validate_entity_name("User Profile").is_ok());
}

// ── I/O failures ────────────────────────────────────────────

TEST_F(FileGeneratorTest, FileBlockingDirectoryIsError) {
    write_file("lib", "not a directory");

    auto result = generate_feature("auth", Config{}, test_dir);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to create directory"), std::string::npos) << result.error;
    EXPECT_EQ(read_file("lib"), "not a directory");
}

TEST_F(FileGeneratorTest, FailureMidPlanKeepsEarlierFiles) {
    // A directory where the implementation file should go
    fs::create_directories(
        test_dir / "lib/shared/repositories/implementations/user_repository_impl.dart");

    auto result = generate_repository("user", Config{}, test_dir);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("user_repository_impl.dart"), std::string::npos) << result.error;

    // No rollback: the interface written first stays
    EXPECT_TRUE(fs::is_regular_file(test_dir / "lib/shared/repositories/user_repository.dart"));
}

TEST_F(FileGeneratorTest, FilesOnlyGoIntoPlannedDirectories) {
    // Directories come from the plan alone; writing a file never creates one
    GenerationPlan plan;
    plan.kind = GenerationKind::Model;
    plan.directories = {"lib/shared/models"};
    plan.files = {
        {"lib/shared/models/a_model.dart", "a"},
        {"lib/shared/unplanned/b_model.dart", "b"},
    };

    auto result = materialize(plan, test_dir);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to write"), std::string::npos) << result.error;
    EXPECT_EQ(read_file("lib/shared/models/a_model.dart"), "a");
    EXPECT_FALSE(fs::exists(test_dir / "lib/shared/unplanned"));
}

// ── Plans ───────────────────────────────────────────────────

TEST(GenerationPlan, DirectoriesCoverEveryFile) {
    for (auto sm : {StateManager::Reactive, StateManager::EventDriven}) {
        auto opts = template_options(Config(true, false, sm));
        for (auto kind : {GenerationKind::Feature, GenerationKind::Screen, GenerationKind::Model,
                          GenerationKind::UseCase, GenerationKind::Repository}) {
            auto plan = build_plan(kind, "auth", opts);
            EXPECT_EQ(plan.kind, kind);
            for (const auto& file : plan.files) {
                auto parent = fs::path(file.path).parent_path().generic_string();
                EXPECT_NE(std::find(plan.directories.begin(), plan.directories.end(), parent),
                          plan.directories.end())
                    << file.path;
            }
        }
    }
}

// ==============================================================================
// test_config_gtest.cpp - Тесты YAML конфигурации (GoogleTest)
// ==============================================================================

#include "portclean/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace portclean::config::test {

namespace {

/// Временный YAML-файл, удаляется в деструкторе
class TempYaml {
public:
    explicit TempYaml(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("portclean_test_" + std::to_string(counter_++) + ".yaml");
        std::ofstream out(path_);
        out << content;
    }

    ~TempYaml() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

}  // namespace

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ConfigTest, ParseConfig_AllKeys) {
    // Arrange
    const std::string yaml =
        "force: true\n"
        "all: true\n"
        "default_answer: \"yes\"\n"
        "quiet: true\n"
        "verbose: 2\n"
        "json: true\n";

    // Act
    ConfigResult result = parse_config(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.config.force);
    EXPECT_TRUE(result.config.all);
    EXPECT_EQ(result.config.default_answer, confirm::ConfirmPolicy::DefaultYes);
    EXPECT_TRUE(result.config.quiet);
    EXPECT_EQ(result.config.verbose, 2);
    EXPECT_TRUE(result.config.json);
    EXPECT_TRUE(result.config.unknown_keys.empty());
}

TEST(ConfigTest, ParseConfig_EmptyDocumentGivesDefaults) {
    ConfigResult result = parse_config("");

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.config.force);
    EXPECT_FALSE(result.config.all);
    EXPECT_EQ(result.config.default_answer, confirm::ConfirmPolicy::DefaultNo);
    EXPECT_EQ(result.config.verbose, 0);
}

TEST(ConfigTest, ParseConfig_UnknownKeysAreCollected) {
    ConfigResult result = parse_config("force: true\ncolour: red\n");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.config.force);
    ASSERT_EQ(result.config.unknown_keys.size(), 1u);
    EXPECT_EQ(result.config.unknown_keys[0], "colour");
}

TEST(ConfigTest, ParseConfig_BadDefaultAnswer_Fails) {
    ConfigResult result = parse_config("default_answer: maybe\n", "pc.yaml");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_NE(result.error.format().find("failed to load config 'pc.yaml'"), std::string::npos);
    EXPECT_NE(result.error.message.find("default_answer"), std::string::npos);
}

TEST(ConfigTest, ParseConfig_WrongType_Fails) {
    ConfigResult result = parse_config("force: sometimes\n");

    EXPECT_FALSE(result.ok);
}

TEST(ConfigTest, ParseConfig_NegativeVerbose_Fails) {
    ConfigResult result = parse_config("verbose: -1\n");

    EXPECT_FALSE(result.ok);
}

TEST(ConfigTest, ParseConfig_NonMappingRoot_Fails) {
    ConfigResult result = parse_config("- force\n- all\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "config root must be a mapping");
}

TEST(ConfigTest, ParseConfig_MalformedYaml_Fails) {
    ConfigResult result = parse_config("force: [true\n");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

// ==============================================================================
// load_config
// ==============================================================================

TEST(ConfigTest, LoadConfig_ReadsFile) {
    TempYaml file("all: true\ndefault_answer: no\n");

    ConfigResult result = load_config(file.path());

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.config.all);
    EXPECT_EQ(result.config.default_answer, confirm::ConfirmPolicy::DefaultNo);
}

TEST(ConfigTest, LoadConfig_MissingFile_Fails) {
    std::filesystem::path missing =
        std::filesystem::temp_directory_path() / "portclean_definitely_missing.yaml";

    ConfigResult result = load_config(missing);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "file cannot be opened");
    EXPECT_EQ(result.error.path, missing.string());
}

// ==============================================================================
// resolve_config_path
// ==============================================================================

TEST(ConfigTest, ResolvePath_CliWinsOverEnvironment) {
    set_env(CONFIG_ENV_VAR, "/from/env.yaml");

    auto path = resolve_config_path(std::filesystem::path("cli.yaml"));

    unset_env(CONFIG_ENV_VAR);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->string(), "cli.yaml");
}

TEST(ConfigTest, ResolvePath_FallsBackToEnvironment) {
    set_env(CONFIG_ENV_VAR, "/from/env.yaml");

    auto path = resolve_config_path(std::nullopt);

    unset_env(CONFIG_ENV_VAR);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->generic_string(), "/from/env.yaml");
}

TEST(ConfigTest, ResolvePath_NothingSet) {
    unset_env(CONFIG_ENV_VAR);

    EXPECT_FALSE(resolve_config_path(std::nullopt).has_value());
}

}  // namespace portclean::config::test

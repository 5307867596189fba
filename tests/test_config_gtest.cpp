// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// YAML разбор (yaml-cpp), ошибки, выбор файла.
//
// ==============================================================================

#include "lfstrack/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include <unistd.h>

namespace lfstrack::config::test {

// ==============================================================================
// parse
// ==============================================================================

TEST(ConfigTest, Parse_AllKeys) {
    // Arrange
    std::string yaml =
        "verbose: true\n"
        "dry_run: false\n"
        "lockable: yes\n"
        "install_hooks: false\n"
        "git: /usr/local/bin/git\n";

    // Act
    LoadResult result = parse(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.verbose, std::optional<bool>(true));
    EXPECT_EQ(result.config.dry_run, std::optional<bool>(false));
    EXPECT_EQ(result.config.lockable, std::optional<bool>(true));
    EXPECT_EQ(result.config.install_hooks, std::optional<bool>(false));
    EXPECT_EQ(result.config.git, std::optional<std::string>("/usr/local/bin/git"));
}

TEST(ConfigTest, Parse_EmptyDocument) {
    LoadResult result = parse("");
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.config.verbose.has_value());
    EXPECT_FALSE(result.config.git.has_value());
}

TEST(ConfigTest, Parse_MissingKeysUnset) {
    LoadResult result = parse("lockable: true\n");
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.config.dry_run.has_value());
    EXPECT_EQ(git_program(result.config), "git");
}

TEST(ConfigTest, Parse_NonMappingRoot_Error) {
    LoadResult result = parse("- a\n- b\n", "cfg.yml");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("mapping"), std::string::npos);
    EXPECT_EQ(result.error.format().rfind("config error [cfg.yml]: ", 0), 0u);
}

TEST(ConfigTest, Parse_WrongType_Error) {
    LoadResult result = parse("verbose: sometimes\n");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'verbose'"), std::string::npos);
}

TEST(ConfigTest, Parse_SequenceForBool_Error) {
    LoadResult result = parse("dry_run: [1, 2]\n");
    EXPECT_FALSE(result.ok);
}

TEST(ConfigTest, Parse_EmptyGit_Error) {
    LoadResult result = parse("git: ''\n");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'git'"), std::string::npos);
}

TEST(ConfigTest, Parse_MalformedYaml_Error) {
    LoadResult result = parse("verbose: [true\n");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

TEST(ConfigTest, ErrorFormat_WithoutPath) {
    Error err{"bad value", ""};
    EXPECT_EQ(err.format(), "config error: bad value");
}

// ==============================================================================
// load / выбор файла
// ==============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("lfstrack_config_") + test_info->name() + "_" +
                     std::to_string(getpid()));
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
        ::unsetenv(CONFIG_ENV);
    }

    void TearDown() override {
        ::unsetenv(CONFIG_ENV);
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

TEST_F(ConfigFileTest, Load_File) {
    // Arrange
    std::filesystem::path path = test_dir_ / "lfstrack.yml";
    {
        std::ofstream out(path);
        out << "lockable: true\n";
    }

    // Act
    LoadResult result = load(path);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.lockable, std::optional<bool>(true));
}

TEST_F(ConfigFileTest, Load_MissingFile_Error) {
    LoadResult result = load(test_dir_ / "absent.yml");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "file does not exist");
}

TEST_F(ConfigFileTest, DefaultPath_InsideGitDir) {
    EXPECT_EQ(default_path(test_dir_ / ".git"), test_dir_ / ".git" / "lfstrack.yml");
}

TEST_F(ConfigFileTest, ExplicitPath_CliWinsOverEnvironment) {
    ::setenv(CONFIG_ENV, "/from/env.yml", 1);

    auto path = explicit_path(std::filesystem::path("cli.yml"));

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("cli.yml"));
}

TEST_F(ConfigFileTest, ExplicitPath_Environment) {
    ::setenv(CONFIG_ENV, "/from/env.yml", 1);

    auto path = explicit_path(std::nullopt);

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("/from/env.yml"));
}

TEST_F(ConfigFileTest, ExplicitPath_NoneSet) {
    EXPECT_FALSE(explicit_path(std::nullopt).has_value());
}

}  // namespace lfstrack::config::test

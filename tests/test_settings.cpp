/**
 * @file test_settings.cpp
 * @brief Tests for layered settings and logging configuration
 *
 * Tests cover:
 * - Environment name transformation and key remapping
 * - Precedence: defaults, file, environment, overrides
 * - Validation of every recognized key
 */

#include <catch2/catch_all.hpp>
#include "trimerge/Settings.hpp"
#include "trimerge/Errors.hpp"
#include "trimerge/Logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

INITIALIZE_EASYLOGGINGPP

namespace fs = std::filesystem;

using namespace trimerge;

namespace {

class SettingsFile {
public:
    SettingsFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << content;
    }

    ~SettingsFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            original_ = old;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (original_.has_value()) {
            setenv(name_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> original_;
};

} // namespace

// ============================================================================
// Environment mapping
// ============================================================================

TEST_CASE("transform_env_name", "[settings][env]") {
    CHECK(transform_env_name("LOG_LEVEL") == "log.level");
    CHECK(transform_env_name("MERGE_MAX__DEPTH") == "merge.max_depth");
    CHECK(transform_env_name("Output_Indent") == "output.indent");
}

TEST_CASE("flatten_keys lists leaves", "[settings][env]") {
    auto keys = flatten_keys(Settings::defaults());
    CHECK(keys == std::set<std::string>{"diff.patch_text", "log.level", "merge.max_depth",
                                        "output.indent"});
}

TEST_CASE("remap_env_key", "[settings][env]") {
    const auto known = flatten_keys(Settings::defaults());

    SECTION("Known key unchanged") {
        CHECK(remap_env_key("log.level", known) == "log.level");
    }

    SECTION("Underscore key recovered") {
        CHECK(remap_env_key("merge.max.depth", known) == "merge.max_depth");
        CHECK(remap_env_key("diff.patch.text", known) == "diff.patch_text");
    }

    SECTION("Unknown key passes through") {
        CHECK(remap_env_key("custom.thing", known) == "custom.thing");
    }
}

TEST_CASE("collect_env_overrides", "[settings][env]") {
    const std::vector<std::pair<std::string, std::string>> env = {
        {"TRIMERGE_LOG_LEVEL", "debug"},
        {"trimerge_output_indent", "4"},
        {"TRIMERGE_DIFF_PATCH__TEXT", "false"},
        {"TRIMERGE_", "ignored"},
        {"TRIMERGEX_LOG_LEVEL", "ignored"},
        {"PATH", "/usr/bin"},
    };

    auto out = collect_env_overrides("TRIMERGE", env);
    REQUIRE(out.size() == 3);
    CHECK(out.at("log.level") == "debug");
    CHECK(out.at("output.indent") == 4);
    CHECK(out.at("diff.patch_text") == false);
}

// ============================================================================
// Layering
// ============================================================================

TEST_CASE("Settings defaults", "[settings]") {
    Settings settings;
    CHECK(settings.merge_options().max_depth == 64);
    CHECK(settings.differ_options().patch_text);
    CHECK(settings.log_level() == "warning");
    CHECK(settings.indent() == 2);
}

TEST_CASE("Settings precedence", "[settings]") {
    SettingsFile file("trimerge_settings_precedence.toml",
                      "[merge]\nmax_depth = 10\n\n[log]\nlevel = \"info\"\n\n[output]\nindent = 4\n");

    SettingsSources sources;
    sources.file_path = file.path();
    sources.env_prefix = std::string("TRIMERGE_TEST");

    SECTION("File over defaults") {
        auto settings = Settings::load(sources);
        CHECK(settings.merge_options().max_depth == 10);
        CHECK(settings.log_level() == "info");
        CHECK(settings.indent() == 4);
        CHECK(settings.differ_options().patch_text);
    }

    SECTION("Environment over file") {
        ScopedEnvVar depth("TRIMERGE_TEST_MERGE_MAX_DEPTH", "20");
        ScopedEnvVar level("TRIMERGE_TEST_LOG_LEVEL", "error");
        auto settings = Settings::load(sources);
        CHECK(settings.merge_options().max_depth == 20);
        CHECK(settings.log_level() == "error");
        CHECK(settings.indent() == 4);
    }

    SECTION("Overrides over environment") {
        ScopedEnvVar depth("TRIMERGE_TEST_MERGE_MAX_DEPTH", "20");
        sources.overrides["merge.max_depth"] = 30;
        CHECK(Settings::load(sources).merge_options().max_depth == 30);
    }

    SECTION("Environment disabled") {
        ScopedEnvVar depth("TRIMERGE_TEST_MERGE_MAX_DEPTH", "20");
        sources.env_prefix = std::nullopt;
        CHECK(Settings::load(sources).merge_options().max_depth == 10);
    }
}

TEST_CASE("Settings from JSON file", "[settings]") {
    SettingsFile file("trimerge_settings.json", R"({"diff": {"patch_text": false}})");
    SettingsSources sources;
    sources.file_path = file.path();
    sources.env_prefix = std::nullopt;

    auto settings = Settings::load(sources);
    CHECK_FALSE(settings.differ_options().patch_text);
    CHECK(settings.merge_options().max_depth == 64);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Settings validation", "[settings][errors]") {
    SECTION("max_depth must be a positive integer") {
        CHECK_THROWS_AS((Settings(Value{{"merge", {{"max_depth", 0}}}})), SettingsError);
        CHECK_THROWS_AS((Settings(Value{{"merge", {{"max_depth", "deep"}}}})), SettingsError);
    }

    SECTION("indent must be at least -1") {
        CHECK_NOTHROW(Settings(Value{{"output", {{"indent", -1}}}}));
        CHECK_THROWS_AS((Settings(Value{{"output", {{"indent", -2}}}})), SettingsError);
    }

    SECTION("patch_text must be boolean") {
        CHECK_THROWS_AS((Settings(Value{{"diff", {{"patch_text", "yes"}}}})), SettingsError);
    }

    SECTION("log level must be known") {
        CHECK_NOTHROW(Settings(Value{{"log", {{"level", "DEBUG"}}}}));
        try {
            Settings(Value{{"log", {{"level", "loud"}}}});
            FAIL("expected SettingsError");
        } catch (const SettingsError& e) {
            CHECK(e.key() == "log.level");
        }
    }

    SECTION("settings must be an object") {
        CHECK_THROWS_AS(Settings(Value::array({1})), SettingsError);
    }

    SECTION("missing file") {
        SettingsSources sources;
        sources.file_path = "/nonexistent/trimerge.toml";
        CHECK_THROWS_AS(Settings::load(sources), FileNotFoundError);
    }
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE("configure_logging accepts the settings levels", "[logging]") {
    for (const char* level : {"trace", "debug", "info", "warning", "error", "fatal", "off", "INFO"}) {
        CHECK_NOTHROW(configure_logging(level));
    }
    CHECK_THROWS_AS(configure_logging("loud"), std::invalid_argument);
    configure_logging("warning");
}

#include <gtest/gtest.h>
#include "shroud/env.hpp"
#include "shroud/errors.hpp"
#include "shroud/log.hpp"
#include "shroud/settings.hpp"
#include <llvm/Support/raw_ostream.h>
#include <cstdlib>

using namespace shroud;

namespace {

const SettingsSchema& schema(){
    static const SettingsSchema s{
        {"Threshold", SettingType::Number, 1.0, 0.0, 1.0, {}, "share"},
        {"Enabled", SettingType::Boolean, false, std::nullopt, std::nullopt, {}, ""},
        {"Mode", SettingType::Enum, std::string("fast"), std::nullopt, std::nullopt, {"fast", "small"}, ""},
        {"Label", SettingType::String, std::string("x"), std::nullopt, std::nullopt, {}, ""},
    };
    return s;
}

} // namespace

TEST(Settings, DefaultsFillEveryEntry){
    Settings s = resolve_settings("Demo", schema(), {});
    EXPECT_DOUBLE_EQ(s.number("Threshold"), 1.0);
    EXPECT_FALSE(s.boolean("Enabled"));
    EXPECT_EQ(s.text("Mode"), "fast");
    EXPECT_EQ(s.text("Label"), "x");
    EXPECT_EQ(s.values().size(), 4u);
}

TEST(Settings, OverridesAreCaseInsensitiveAndTyped){
    Settings s = resolve_settings("Demo", schema(), {{"threshold", "0.25"}, {"ENABLED", "yes"}, {"mode", "SMALL"}, {"label", "hi"}});
    EXPECT_DOUBLE_EQ(s.number("Threshold"), 0.25);
    EXPECT_TRUE(s.boolean("Enabled"));
    EXPECT_EQ(s.text("Mode"), "small");
    EXPECT_EQ(s.text("Label"), "hi");
}

TEST(Settings, RejectsBadOverrides){
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Nope", "1"}}), config_error);
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Threshold", "abc"}}), config_error);
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Threshold", "1.5"}}), config_error);
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Threshold", "-0.1"}}), config_error);
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Enabled", "maybe"}}), config_error);
    EXPECT_THROW(resolve_settings("Demo", schema(), {{"Mode", "slow"}}), config_error);
}

TEST(Settings, ErrorsNameTheOwner){
    try {
        resolve_settings("Demo", schema(), {{"Threshold", "2"}});
        FAIL() << "expected a config_error";
    } catch(const config_error& e){
        EXPECT_NE(std::string(e.what()).find("Demo.Threshold"), std::string::npos);
    }
}

TEST(Settings, WrongTypeAccessIsAConfigError){
    Settings s = resolve_settings("Demo", schema(), {});
    EXPECT_THROW(s.boolean("Threshold"), config_error);
    EXPECT_THROW(s.number("Missing"), config_error);
}

TEST(Settings, Formatting){
    EXPECT_EQ(format_setting(SettingValue{true}), "true");
    EXPECT_EQ(format_setting(SettingValue{3.0}), "3");
    EXPECT_EQ(format_setting(SettingValue{std::string("base64")}), "base64");
    EXPECT_STREQ(setting_type_name(SettingType::Enum), "enum");
}

TEST(Log, LevelsFilterMessages){
    std::string captured;
    llvm::raw_string_ostream os(captured);
    log::Level saved = log::level();
    log::set_sink(&os);
    log::set_level(log::Level::Warn);
    log::info("test", "hidden");
    log::warn("test", "shown");
    log::set_level(log::Level::Debug);
    log::debug("test", "verbose");
    log::set_sink(nullptr);
    log::set_level(saved);
    os.flush();
    EXPECT_EQ(captured, "[warn][test] shown\n[dbg][test] verbose\n");
}

TEST(Log, ParseLevel){
    EXPECT_EQ(log::parse_level("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::parse_level("warning"), log::Level::Warn);
    EXPECT_FALSE(log::parse_level("loud"));
}

TEST(Env, ReadsShroudVariables){
    ::setenv("SHROUD_SEED", "99", 1);
    ::setenv("SHROUD_VERIFY", "1", 1);
    ::setenv("SHROUD_LOG", "info", 1);
    Env e = detect_env();
    ::unsetenv("SHROUD_SEED");
    ::unsetenv("SHROUD_VERIFY");
    ::unsetenv("SHROUD_LOG");
    ASSERT_TRUE(e.seed);
    EXPECT_EQ(*e.seed, 99u);
    EXPECT_TRUE(e.verify);
    EXPECT_EQ(e.log_level, log::Level::Info);
}

TEST(Env, IgnoresMalformedValues){
    ::setenv("SHROUD_SEED", "12abc", 1);
    Env e = detect_env();
    ::unsetenv("SHROUD_SEED");
    EXPECT_FALSE(e.seed);
    EXPECT_FALSE(e.verify);
}

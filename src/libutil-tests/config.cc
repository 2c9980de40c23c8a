#include "gcrelay/util/configuration.hh"
#include "gcrelay/util/config-global.hh"
#include "gcrelay/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace gcrelay {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    std::string value;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
}

TEST(Config, getDefinedSetting)
{
    Config config;
    std::string value;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "");
    ASSERT_EQ(iter->second.description, "description\n");
}

TEST(Config, getDefinedOverriddenSettingNotSet)
{
    Config config;
    std::string value;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ true);
    const auto e = settings.find("name-of-the-setting");
    ASSERT_EQ(e, settings.end());
}

TEST(Config, getDefinedSettingSet)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_TRUE(config.set("name-of-the-setting", "value"));

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto e = settings.find("name-of-the-setting");
    ASSERT_NE(e, settings.end());
    ASSERT_EQ(e->second.value, "value");
    ASSERT_TRUE(setting.overridden);
}

TEST(Config, withInitialValue)
{
    const StringMap initials = {
        {"key", "value"},
    };
    Config config(initials);

    {
        std::map<std::string, Config::SettingInfo> settings;
        config.getSettings(settings, /* overriddenOnly = */ false);
        ASSERT_EQ(settings.find("key"), settings.end());
    }

    Setting<std::string> setting{&config, "default-value", "key", "description"};

    {
        std::map<std::string, Config::SettingInfo> settings;
        config.getSettings(settings, /* overriddenOnly = */ false);
        ASSERT_EQ(settings["key"].value, "value");
    }
}

TEST(Config, resetOverriddenWithSetting)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    {
        std::map<std::string, Config::SettingInfo> settings;

        setting.set("foo");
        ASSERT_EQ(setting.get(), "foo");
        config.getSettings(settings, /* overriddenOnly = */ true);
        ASSERT_TRUE(settings.empty());
    }

    {
        std::map<std::string, Config::SettingInfo> settings;

        setting.override("bar");
        ASSERT_TRUE(setting.overridden);
        ASSERT_EQ(setting.get(), "bar");
        config.getSettings(settings, /* overriddenOnly = */ true);
        ASSERT_FALSE(settings.empty());
    }

    {
        std::map<std::string, Config::SettingInfo> settings;

        config.resetOverridden();
        ASSERT_FALSE(setting.overridden);
        config.getSettings(settings, /* overriddenOnly = */ true);
        ASSERT_TRUE(settings.empty());
    }
}

TEST(Config, toJSONOnEmptyConfig)
{
    ASSERT_EQ(Config().toJSON().dump(), "{}");
}

TEST(Config, toJSONOnNonEmptyConfig)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    setting.assign("value");

    ASSERT_EQ(
        config.toJSON().dump(),
        R"#({"name-of-the-setting":{"aliases":[],"defaultValue":"","description":"description\n","documentDefault":true,"value":"value"}})#");
}

TEST(Config, toKeyValue)
{
    Config config;
    Setting<unsigned int> port{&config, 25565, "port", "a port"};
    Setting<bool> flag{&config, false, "flag", "a flag"};

    ASSERT_EQ(config.toKeyValue(), "flag = false\nport = 25565\n");
}

TEST(Config, setSettingAlias)
{
    Config config;
    Setting<std::string> setting{&config, "", "some-int", "best number", {"another-int"}};
    ASSERT_TRUE(config.set("some-int", "1"));
    ASSERT_EQ(setting.get(), "1");
    ASSERT_TRUE(config.set("another-int", "2"));
    ASSERT_EQ(setting.get(), "2");
    ASSERT_TRUE(config.set("some-int", "3"));
    ASSERT_EQ(setting.get(), "3");
}

TEST(Config, integerSettings)
{
    Config config;
    Setting<size_t> size{&config, 0, "size", "a size"};

    ASSERT_TRUE(config.set("size", "4K"));
    ASSERT_EQ(size.get(), 4096u);
    ASSERT_THROW(config.set("size", "lots"), UsageError);
}

TEST(Config, booleanSettings)
{
    Config config;
    Setting<bool> flag{&config, false, "flag", "a flag"};

    ASSERT_TRUE(config.set("flag", "yes"));
    ASSERT_TRUE(flag.get());
    ASSERT_TRUE(config.set("flag", "0"));
    ASSERT_FALSE(flag.get());
    ASSERT_THROW(config.set("flag", "maybe"), UsageError);
}

TEST(Config, pathSettingsAreCanonicalised)
{
    Config config;
    PathSetting path{&config, "/default", "path", "a path"};

    ASSERT_TRUE(config.set("path", "/foo//bar/"));
    ASSERT_EQ(path.get(), "/foo/bar");
    ASSERT_THROW(config.set("path", ""), UsageError);
}

TEST(Config, appendToStringSet)
{
    Config config;
    Setting<StringSet> set{&config, {}, "set", "a set"};

    ASSERT_TRUE(config.set("set", "a b"));
    ASSERT_TRUE(config.set("extra-set", "c"));
    ASSERT_EQ(set.get(), (StringSet{"a", "b", "c"}));
}

TEST(Config, applyConfigEmpty)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigEmptyWithComment)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("# just a comment");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigAssignment)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = value-from-file #useful comment\n"
        "# name-of-the-setting = foo\n");
    config.getSettings(settings);
    ASSERT_FALSE(settings.empty());
    ASSERT_EQ(settings["name-of-the-setting"].value, "value-from-file");
}

TEST(Config, applyConfigWithReassignedSetting)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = first-value\n"
        "name-of-the-setting = second-value\n");
    config.getSettings(settings);
    ASSERT_FALSE(settings.empty());
    ASSERT_EQ(settings["name-of-the-setting"].value, "second-value");
}

TEST(Config, applyConfigFailsOnMissingIncludes)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_THROW(
        config.applyConfig(
            "name-of-the-setting = value-from-file\n"
            "# name-of-the-setting = foo\n"
            "include /nix/store/does/not/exist.nix"),
        Error);
}

TEST(Config, applyConfigIgnoresMissingOptionalIncludes)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    config.applyConfig(
        "name-of-the-setting = value-from-file\n"
        "!include /nix/store/does/not/exist.nix");
    ASSERT_EQ(setting.get(), "value-from-file");
}

TEST(Config, applyConfigFollowsIncludes)
{
    AutoDelete tmpDir(createTempDir());
    auto confPath = (tmpDir.path() / "main.conf").string();
    writeFile((tmpDir.path() / "extra.conf").string(), "name-of-the-setting = included\n");

    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    config.applyConfig("include extra.conf\n", confPath);
    ASSERT_EQ(setting.get(), "included");
}

TEST(Config, applyConfigInvalidThrows)
{
    Config config;
    ASSERT_THROW(config.applyConfig("value == key"), UsageError);
    ASSERT_THROW(config.applyConfig("value "), UsageError);
}

/* ----------------------------------------------------------------------------
 * GlobalConfig
 * --------------------------------------------------------------------------*/

TEST(GlobalConfig, setReachesRegisteredConfig)
{
    static Config config;
    static Setting<std::string> setting{&config, "", "global-config-test-setting", "description"};
    static GlobalConfig::Register r(&config);

    ASSERT_TRUE(globalConfig.set("global-config-test-setting", "value"));
    ASSERT_EQ(setting.get(), "value");
    ASSERT_FALSE(globalConfig.set("global-config-test-unknown", "value"));
}

} // namespace gcrelay

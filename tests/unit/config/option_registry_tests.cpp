#include <gtest/gtest.h>

#include "mt/options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace
{

std::filesystem::path makeTempPath(const std::string &suffix)
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("mt_options_test_" + std::to_string(dist(rng)) + suffix);
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / ("mt_options_test" + suffix);
}

void registerSample(mt::config::OptionRegistry &registry)
{
    mt::config::OptionDefinition depth{"depth", mt::config::OptionKind::Integer,
                                       mt::config::OptionValue(std::int64_t{64}), "Depth", "Nesting ceiling"};
    depth.minimum = 1;
    depth.maximum = 100;
    registry.registerOption(depth);

    mt::config::OptionDefinition format{"format", mt::config::OptionKind::String, mt::config::OptionValue("json"),
                                        "Format", "Output format"};
    format.choices = {"json", "outline"};
    registry.registerOption(format);

    registry.registerOption({"verbose", mt::config::OptionKind::Boolean, mt::config::OptionValue(false), "Verbose",
                             "Extra output"});
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.hasOption("depth"));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_EQ(registry.getInteger("depth"), 64);
    EXPECT_EQ(registry.getString("format"), "json");
    EXPECT_FALSE(registry.getBool("verbose", true));
    EXPECT_TRUE(registry.get("missing").isNull());
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.set("depth", mt::config::OptionValue("42")));
    EXPECT_TRUE(registry.set("verbose", mt::config::OptionValue("yes")));

    EXPECT_EQ(registry.getInteger("depth"), 42);
    EXPECT_TRUE(registry.getBool("verbose"));
    EXPECT_EQ(registry.get("depth").type(), mt::config::OptionValueType::Integer);
}

TEST(OptionRegistry, RejectsInvalidValues)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_FALSE(registry.set("depth", mt::config::OptionValue("deep")));
    EXPECT_FALSE(registry.set("verbose", mt::config::OptionValue("maybe")));
    EXPECT_FALSE(registry.set("format", mt::config::OptionValue("yaml")));
    EXPECT_FALSE(registry.set("missing", mt::config::OptionValue(true)));

    EXPECT_EQ(registry.getInteger("depth"), 64);
    EXPECT_FALSE(registry.getBool("verbose"));
    EXPECT_EQ(registry.getString("format"), "json");
}

TEST(OptionRegistry, ClampsIntegersToRange)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.set("depth", mt::config::OptionValue(std::int64_t{0})));
    EXPECT_EQ(registry.getInteger("depth"), 1);
    EXPECT_TRUE(registry.set("depth", mt::config::OptionValue(std::int64_t{5000})));
    EXPECT_EQ(registry.getInteger("depth"), 100);

    registry.reset("depth");
    EXPECT_EQ(registry.getInteger("depth"), 64);
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);
    registry.set("depth", mt::config::OptionValue(std::int64_t{12}));
    registry.set("format", mt::config::OptionValue("outline"));
    registry.set("verbose", mt::config::OptionValue(true));

    const auto filePath = makeTempPath(".json");
    ASSERT_TRUE(registry.saveToFile(filePath));

    mt::config::OptionRegistry loaded("test-app");
    registerSample(loaded);
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getInteger("depth"), 12);
    EXPECT_EQ(loaded.getString("format"), "outline");
    EXPECT_TRUE(loaded.getBool("verbose"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, LoadSkipsUnknownAndMistypedEntries)
{
    const auto filePath = makeTempPath(".json");
    {
        std::ofstream out(filePath);
        out << R"({"depth": "not a number", "format": "outline", "unknown": 1, "verbose": [1, 2]})";
    }

    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);
    ASSERT_TRUE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("depth"), 64);
    EXPECT_EQ(registry.getString("format"), "outline");
    EXPECT_FALSE(registry.getBool("verbose"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, LoadRejectsMalformedFiles)
{
    const auto filePath = makeTempPath(".json");
    {
        std::ofstream out(filePath);
        out << "{ not json";
    }

    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_FALSE(registry.loadFromFile(filePath.string() + ".missing"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DefaultsLiveUnderXdgConfigHome)
{
    const auto root = makeTempPath("_config");
    const char *previous = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = previous ? previous : "";
    ::setenv("XDG_CONFIG_HOME", root.c_str(), 1);

    mt::config::OptionRegistry registry("mt-test");
    registerSample(registry);
    EXPECT_EQ(registry.defaultOptionsPath(), root / "marktree" / "mt-test" / "defaults.json");

    EXPECT_FALSE(registry.loadDefaults());
    registry.set("depth", mt::config::OptionValue(std::int64_t{7}));
    ASSERT_TRUE(registry.saveDefaults());

    mt::config::OptionRegistry reloaded("mt-test");
    registerSample(reloaded);
    ASSERT_TRUE(reloaded.loadDefaults());
    EXPECT_EQ(reloaded.getInteger("depth"), 7);

    EXPECT_TRUE(reloaded.clearDefaults());
    EXPECT_FALSE(std::filesystem::exists(reloaded.defaultOptionsPath()));

    if (previous)
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(OptionRegistry, ListsOptionsSortedByKey)
{
    mt::config::OptionRegistry registry("test-app");
    registerSample(registry);
    auto options = registry.listRegisteredOptions();
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].key, "depth");
    EXPECT_EQ(options[1].key, "format");
    EXPECT_EQ(options[2].key, "verbose");
    ASSERT_NE(registry.definition("format"), nullptr);
    EXPECT_EQ(registry.definition("format")->choices.size(), 2u);
}

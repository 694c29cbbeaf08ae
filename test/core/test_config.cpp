#include <gtest/gtest.h>

#include <string>

#include "test_utils.hpp"
#include "core/Config.hpp"
#include "core/Constants.hpp"

using namespace runcfg;
using namespace runcfg::test;
using namespace runcfg::test::utils;

namespace {

Config sampleConfig() {
    Config config;
    Commands& commands = config.commands();
    CommandContext rustTest("rust-test");

    commands.updateConfig(rustTest, "cargo-test", makeDetails("cargo test", CommandType::Cargo));

    CommandDetailsBuilder verbose("cargo test", CommandType::Cargo);
    verbose.params({"--", "--nocapture"})
        .env({{"RUST_LOG", "trace"}, {"RUST_BACKTRACE", "1"}})
        .preCommand("cargo-test")
        .workingDirectory("crates/engine")
        .allowMultipleInstances(true);
    auto built = verbose.build();
    EXPECT_TRUE(built.has_value());
    if (built) commands.updateConfig(rustTest, "cargo-test-verbose", built.value());
    EXPECT_TRUE(commands.setDefaultConfig(rustTest, "cargo-test-verbose").has_value());

    commands.updateConfig(CommandContext("script"), "deploy", makeDetails("./deploy.sh", CommandType::Shell, {"prod"}));
    commands.getOrInsertConfigs(CommandContext("bench"));
    config.settings().contextPolicy = ContextPolicy::Lenient;
    return config;
}

}

// Test: save then load reproduces the registry
TEST(ConfigTest, SaveLoadRoundTrip) {
    Config original = sampleConfig();
    MemoryConfigStore store;

    ASSERT_TRUE(original.save(store).has_value());
    ASSERT_TRUE(store.data.has_value());

    auto loaded = Config::load(store);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message << "\n" << *store.data;
    EXPECT_EQ(loaded.value(), original);
    EXPECT_EQ(loaded.value().commands().size(), 3u);
    EXPECT_EQ(loaded.value().settings().contextPolicy, ContextPolicy::Lenient);
}

// Test: An empty config key and an empty context name survive save and load
TEST(ConfigTest, EmptyNamesRoundTrip) {
    Config config;
    Commands& commands = config.commands();
    CommandContext ctx("ctx");
    commands.updateConfig(ctx, "", makeDetails("ls"));
    commands.updateConfig(ctx, "other", makeDetails("pwd"));
    ASSERT_TRUE(commands.setDefaultConfig(ctx, "").has_value());
    commands.updateConfig(CommandContext(""), "k", makeDetails("echo hi"));

    MemoryConfigStore store;
    ASSERT_TRUE(config.save(store).has_value());
    auto loaded = Config::load(store);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value(), config) << *store.data;

    auto def = loaded.value().commands().getOrDefaultConfig(ctx);
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def.value().command(), "ls");
    auto unnamed = loaded.value().commands().getConfig(CommandContext(""), "k");
    ASSERT_TRUE(unnamed.has_value());
    EXPECT_EQ(unnamed.value().command(), "echo hi");
}

// Test: Details set with empty optional strings equal their loaded form
TEST(ConfigTest, EmptyOptionalFieldsRoundTrip) {
    Config config;
    auto built = CommandDetailsBuilder("ls", CommandType::Shell).preCommand("").workingDirectory("").build();
    ASSERT_TRUE(built.has_value());
    config.commands().updateConfig(CommandContext("ctx"), "list", built.value());

    MemoryConfigStore store;
    ASSERT_TRUE(config.save(store).has_value());
    EXPECT_EQ(store.data->find("pre_command"), std::string::npos);
    EXPECT_EQ(store.data->find("working_directory"), std::string::npos);

    auto loaded = Config::load(store);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value(), config);
}

// Test: Serialization is deterministic and survives a second pass unchanged
TEST(ConfigTest, SerializeIsStable) {
    Config original = sampleConfig();
    std::string first = original.serialize();
    EXPECT_EQ(first, original.serialize());

    auto reparsed = Config::parse(first);
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed.value().serialize(), first);
}

// Test: Missing optional fields get their defaults
TEST(ConfigTest, MissingFieldsDefault) {
    auto parsed = Config::parse(
        "commands:\n"
        "  rust-test:\n"
        "    entries:\n"
        "      cargo-test:\n"
        "        command: cargo test\n");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const Config& config = parsed.value();
    EXPECT_EQ(config.settings().contextPolicy, ContextPolicy::Strict);
    auto got = config.commands().getConfig(CommandContext("rust-test"), "cargo-test");
    ASSERT_TRUE(got.has_value());
    const CommandDetails& d = got.value();
    EXPECT_EQ(d.command(), "cargo test");
    EXPECT_EQ(d.commandType(), CommandType::Shell);
    EXPECT_TRUE(d.env().empty());
    EXPECT_TRUE(d.params().empty());
    EXPECT_FALSE(d.preCommand().has_value());
    EXPECT_FALSE(d.workingDirectory().has_value());
    EXPECT_FALSE(d.allowMultipleInstances());
    EXPECT_FALSE(config.commands().getConfigs(CommandContext("rust-test")).defaultKey().has_value());
}

// Test: Empty document loads as an empty registry
TEST(ConfigTest, EmptyDocument) {
    auto parsed = Config::parse("");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed.value().commands().empty());

    auto noCommands = Config::parse("settings:\n  context_policy: strict\n");
    ASSERT_TRUE(noCommands.has_value());
    EXPECT_TRUE(noCommands.value().commands().empty());
}

// Test: Unparseable text is a ParseFailure
TEST(ConfigTest, UnparseableText) {
    auto parsed = Config::parse("commands:\n  run: {entries: [\n");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseFailure);
}

// Test: Entries without a command are skipped, their siblings kept
TEST(ConfigTest, EntryWithoutCommandIsSkipped) {
    auto parsed = Config::parse(
        "commands:\n"
        "  run:\n"
        "    default_key: broken\n"
        "    entries:\n"
        "      broken:\n"
        "        params: [--release]\n"
        "      blank:\n"
        "        command: \"  \"\n"
        "      good:\n"
        "        command: cargo run\n");
    ASSERT_TRUE(parsed.has_value());

    CommandConfig run = parsed.value().commands().getConfigs(CommandContext("run"));
    ASSERT_EQ(run.size(), 1u);
    EXPECT_TRUE(run.contains("good"));
    // The default named a skipped entry, so it is dropped
    EXPECT_FALSE(run.defaultKey().has_value());
    auto resolved = parsed.value().commands().getOrDefaultConfig(CommandContext("run"));
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value().command(), "cargo run");
}

// Test: Unknown command type and policy fall back to defaults
TEST(ConfigTest, UnknownEnumsFallBack) {
    auto parsed = Config::parse(
        "settings:\n"
        "  context_policy: sometimes\n"
        "commands:\n"
        "  run:\n"
        "    entries:\n"
        "      app:\n"
        "        command: npm start\n"
        "        command_type: npm\n");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().settings().contextPolicy, ContextPolicy::Strict);
    auto got = parsed.value().commands().getConfig(CommandContext("run"), "app");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value().commandType(), CommandType::Shell);
}

// Test: materialize is usable on a hand-built sparse image
TEST(ConfigTest, MaterializeSparseImage) {
    RawConfig raw;
    RawCommandConfig cfg;
    RawCommandDetails a;
    a.command = "cargo build";
    a.commandType = "cargo";
    a.preCommand = "";
    a.workingDirectory = "";
    cfg.entries.emplace_back("a", a);
    cfg.defaultKey = "a";
    raw.commands.emplace_back("build", cfg);

    Config config = Config::materialize(raw);
    auto got = config.commands().getOrDefaultConfig(CommandContext("build"));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value().commandType(), CommandType::Cargo);
    // Empty strings mean "unset" for optional fields
    EXPECT_FALSE(got.value().preCommand().has_value());
    EXPECT_FALSE(got.value().workingDirectory().has_value());
}

// Test: A store without data yields the seeded defaults
TEST(ConfigTest, LoadWithoutDataUsesDefaults) {
    MemoryConfigStore store;
    auto loaded = Config::load(store);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value(), Config::withDefaults());
    EXPECT_EQ(store.writeCount, 0);
}

// Test: Seeded defaults contain the cargo contexts
TEST(ConfigTest, WithDefaultsContents) {
    Config config = Config::withDefaults();
    const Commands& commands = config.commands();
    ASSERT_EQ(commands.size(), 4u);

    for (const char* name : {Constants::CONTEXT_RUN, Constants::CONTEXT_TEST,
                             Constants::CONTEXT_BUILD, Constants::CONTEXT_BENCH}) {
        CommandConfig configs = commands.getConfigs(CommandContext(name));
        ASSERT_EQ(configs.size(), 1u) << name;
        ASSERT_TRUE(configs.defaultKey().has_value()) << name;
        EXPECT_EQ(*configs.defaultKey(), Constants::DEFAULT_CONFIG_KEY);
        auto d = commands.getOrDefaultConfig(CommandContext(name));
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().commandType(), CommandType::Cargo);
    }
    EXPECT_EQ(commands.getOrDefaultConfig(CommandContext("test")).value().command(), "test");
    EXPECT_FALSE(commands.contains(CommandContext(Constants::CONTEXT_SCRIPT)));
}

// Test: Write failures are reported and leave memory untouched
TEST(ConfigTest, SaveFailureReported) {
    Config config = sampleConfig();
    Config before = config;
    MemoryConfigStore store;
    store.failWrites = true;

    auto res = config.save(store);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::WriteFailure);
    EXPECT_EQ(config, before);
    EXPECT_FALSE(store.data.has_value());
}

// Test: Parse errors from a store carry the location
TEST(ConfigTest, LoadParseFailureFromStore) {
    MemoryConfigStore store("commands: [\n");
    auto loaded = Config::load(store);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::ParseFailure);
    EXPECT_NE(loaded.error().message.find("<memory>"), std::string::npos);
}

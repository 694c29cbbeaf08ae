#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "core/CommandDetailsBuilder.hpp"
#include "core/Validator.hpp"

using namespace runcfg;

namespace {

/// Validator that records its position in a shared call log
class RecordingValidator : public Validator {
public:
    RecordingValidator(std::vector<int>& log, int id, bool pass) : calls(log), myId(id), passes(pass) {}

    Expected<void> validate(const CommandDetails&) const override {
        calls.push_back(myId);
        if (passes) return {};
        return Error{ErrorCode::ValidationFailed, "validator " + std::to_string(myId) + " rejected"};
    }

private:
    std::vector<int>& calls;
    int myId;
    bool passes;
};

}

// Test: Required fields only, every optional field defaulted
TEST(CommandDetailsBuilderTest, BuildWithDefaults) {
    auto built = CommandDetailsBuilder("cargo test", CommandType::Cargo).build();
    ASSERT_TRUE(built.has_value()) << built.error().message;

    const CommandDetails& d = built.value();
    EXPECT_EQ(d.command(), "cargo test");
    EXPECT_EQ(d.commandType(), CommandType::Cargo);
    EXPECT_TRUE(d.env().empty());
    EXPECT_FALSE(d.preCommand().has_value());
    EXPECT_TRUE(d.params().empty());
    EXPECT_FALSE(d.workingDirectory().has_value());
    EXPECT_FALSE(d.allowMultipleInstances());
}

// Test: Every setter lands in the built value
TEST(CommandDetailsBuilderTest, BuildWithAllFields) {
    CommandDetailsBuilder builder("make", CommandType::Shell);
    builder.env({{"RUST_LOG", "debug"}, {"CI", "1"}})
        .preCommand("generate")
        .params({"-j", "8"})
        .workingDirectory("/tmp/project")
        .allowMultipleInstances(true);

    auto built = builder.build();
    ASSERT_TRUE(built.has_value()) << built.error().message;

    const CommandDetails& d = built.value();
    EXPECT_EQ(d.env().size(), 2u);
    EXPECT_EQ(d.env().at("RUST_LOG"), "debug");
    ASSERT_TRUE(d.preCommand().has_value());
    EXPECT_EQ(*d.preCommand(), "generate");
    EXPECT_EQ(d.params(), (std::vector<std::string>{"-j", "8"}));
    ASSERT_TRUE(d.workingDirectory().has_value());
    EXPECT_EQ(d.workingDirectory()->generic_string(), "/tmp/project");
    EXPECT_TRUE(d.allowMultipleInstances());
}

// Test: Repeated setter calls overwrite, including the command type
TEST(CommandDetailsBuilderTest, SettersOverwrite) {
    CommandDetailsBuilder builder("test", CommandType::Cargo);
    builder.params({"a"}).params({"b", "c"}).commandType(CommandType::Shell).allowMultipleInstances(true)
        .allowMultipleInstances(false);

    auto built = builder.build();
    ASSERT_TRUE(built.has_value());
    EXPECT_EQ(built.value().params(), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(built.value().commandType(), CommandType::Shell);
    EXPECT_FALSE(built.value().allowMultipleInstances());
}

// Test: Empty command is rejected whatever else is set
TEST(CommandDetailsBuilderTest, EmptyCommandIsInvalid) {
    CommandDetailsBuilder builder("", CommandType::Cargo);
    builder.params({"--release"}).env({{"A", "b"}}).allowMultipleInstances(true);

    auto built = builder.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::InvalidCommand);
}

// Test: Whitespace-only command counts as empty
TEST(CommandDetailsBuilderTest, BlankCommandIsInvalid) {
    auto built = CommandDetailsBuilder("   \t", CommandType::Shell).build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::InvalidCommand);
}

// Test: Command emptiness is checked before any validator runs
TEST(CommandDetailsBuilderTest, InvalidCommandTakesPrecedenceOverValidators) {
    std::vector<int> calls;
    CommandDetailsBuilder builder("", CommandType::Shell);
    builder.addValidator(std::make_unique<RecordingValidator>(calls, 1, false));

    auto built = builder.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::InvalidCommand);
    EXPECT_TRUE(calls.empty());
}

// Test: A failing validator fails the build even if others pass
TEST(CommandDetailsBuilderTest, FailingValidatorFailsBuild) {
    std::vector<int> calls;
    CommandDetailsBuilder builder("ls", CommandType::Shell);
    builder.addValidator(std::make_unique<RecordingValidator>(calls, 1, true))
        .addValidator(std::make_unique<RecordingValidator>(calls, 2, false))
        .addValidator(std::make_unique<RecordingValidator>(calls, 3, true));

    auto built = builder.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(built.error().message, "validator 2 rejected");
    // Short-circuit: validator 3 never ran
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

// Test: First failure in insertion order is the one reported
TEST(CommandDetailsBuilderTest, FirstFailureReported) {
    std::vector<int> calls;
    CommandDetailsBuilder builder("ls", CommandType::Shell);
    builder.addValidator(std::make_unique<RecordingValidator>(calls, 7, false))
        .addValidator(std::make_unique<RecordingValidator>(calls, 8, false));

    auto built = builder.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().message, "validator 7 rejected");
    EXPECT_EQ(calls, (std::vector<int>{7}));
}

// Test: All validators run when all pass
TEST(CommandDetailsBuilderTest, AllValidatorsRunInOrder) {
    std::vector<int> calls;
    CommandDetailsBuilder builder("ls", CommandType::Shell);
    for (int i = 0; i < 4; ++i) {
        builder.addValidator(std::make_unique<RecordingValidator>(calls, i, true));
    }
    EXPECT_EQ(builder.validatorCount(), 4u);

    auto built = builder.build();
    ASSERT_TRUE(built.has_value());
    EXPECT_EQ(calls, (std::vector<int>{0, 1, 2, 3}));
}

// Test: Closure validators see the assembled value
TEST(CommandDetailsBuilderTest, ClosureValidatorSeesCandidate) {
    CommandDetailsBuilder builder("cargo run", CommandType::Cargo);
    builder.params({"--release"});
    builder.addValidator([](const CommandDetails& d) -> Expected<void> {
        if (d.params().empty()) return Error{ErrorCode::ValidationFailed, "params required"};
        return {};
    });

    auto built = builder.build();
    EXPECT_TRUE(built.has_value());
}

// Test: Closure validator message is surfaced as ValidationFailed
TEST(CommandDetailsBuilderTest, ClosureValidatorMessage) {
    CommandDetailsBuilder builder("cargo run", CommandType::Cargo);
    builder.addValidator([](const CommandDetails& d) -> Expected<void> {
        if (d.workingDirectory()) return {};
        return Error{ErrorCode::InvalidArgs, "working directory required"};
    });

    auto built = builder.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, ErrorCode::ValidationFailed);
    EXPECT_EQ(built.error().message, "working directory required");
}

// Test: Boolean predicates pass/fail with the given or generic message
TEST(CommandDetailsBuilderTest, PredicateValidators) {
    {
        CommandDetailsBuilder builder("echo hi", CommandType::Shell);
        builder.addPredicate([](const CommandDetails& d) { return d.commandType() == CommandType::Cargo; },
                             "cargo commands only");
        auto built = builder.build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::ValidationFailed);
        EXPECT_EQ(built.error().message, "cargo commands only");
    }
    {
        CommandDetailsBuilder builder("echo hi", CommandType::Shell);
        builder.addPredicate([](const CommandDetails&) { return false; });
        auto built = builder.build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().message, "validation failed");
    }
    {
        CommandDetailsBuilder builder("echo hi", CommandType::Shell);
        builder.addPredicate([](const CommandDetails&) { return true; });
        EXPECT_TRUE(builder.build().has_value());
    }
}

// Test: build() spends the builder
TEST(CommandDetailsBuilderTest, SecondBuildFails) {
    CommandDetailsBuilder builder("ls", CommandType::Shell);
    builder.addPredicate([](const CommandDetails&) { return true; });

    ASSERT_TRUE(builder.build().has_value());
    EXPECT_EQ(builder.validatorCount(), 0u);

    auto again = builder.build();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidCommand);
}

// Test: Empty pre-command and working directory build as unset
TEST(CommandDetailsBuilderTest, EmptyOptionalFieldsAreUnset) {
    auto built = CommandDetailsBuilder("ls", CommandType::Shell).preCommand("").workingDirectory("").build();
    ASSERT_TRUE(built.has_value());
    EXPECT_FALSE(built.value().preCommand().has_value());
    EXPECT_FALSE(built.value().workingDirectory().has_value());

    auto plain = CommandDetailsBuilder("ls", CommandType::Shell).build();
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(built.value(), plain.value());
}

// Test: from() copies every field, so an unchanged rebuild is equal
TEST(CommandDetailsBuilderTest, FromCopiesAllFields) {
    CommandDetailsBuilder original("cargo bench", CommandType::Cargo);
    original.env({{"K", "V"}}).preCommand("build").params({"--", "--save-baseline", "main"})
        .workingDirectory("crates/core").allowMultipleInstances(true);
    auto first = original.build();
    ASSERT_TRUE(first.has_value());

    auto copy = CommandDetailsBuilder::from(first.value()).build();
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy.value(), first.value());

    auto changed = CommandDetailsBuilder::from(first.value()).clearPreCommand().clearWorkingDirectory().build();
    ASSERT_TRUE(changed.has_value());
    EXPECT_NE(changed.value(), first.value());
    EXPECT_FALSE(changed.value().preCommand().has_value());
    EXPECT_FALSE(changed.value().workingDirectory().has_value());
    EXPECT_EQ(changed.value().params(), first.value().params());
}

// Test: Persisted names of command types
TEST(CommandTypeTest, NamesRoundTrip) {
    EXPECT_STREQ(toString(CommandType::Cargo), "cargo");
    EXPECT_STREQ(toString(CommandType::Shell), "shell");
    EXPECT_EQ(parseCommandType("cargo"), CommandType::Cargo);
    EXPECT_EQ(parseCommandType(" Shell "), CommandType::Shell);
    EXPECT_FALSE(parseCommandType("npm").has_value());
    EXPECT_FALSE(parseCommandType("").has_value());
}

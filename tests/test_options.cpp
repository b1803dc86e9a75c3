#include <gtest/gtest.h>

#include <vector>

#include "../src/cli/Options.hpp"

using pour::CliOptions;
using pour::SolvingMethod;

namespace {
    CliOptions parse(std::vector<const char*> args) {
        args.insert(args.begin(), "pour_cli");
        return pour::parseArgs((int)args.size(), args.data());
    }
}

TEST(ParseArgs, Defaults) {
    CliOptions cfg = parse({});
    EXPECT_EQ(cfg.inPath, "puzzles.csv");
    EXPECT_TRUE(cfg.outPath.empty());
    EXPECT_EQ(cfg.method, SolvingMethod::Fastest);
    EXPECT_EQ(cfg.params.capacity, 4);
    EXPECT_EQ(cfg.params.minEmpty, 0);
    EXPECT_EQ(cfg.params.maxEmpty, 4);
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_FALSE(cfg.quiet);
    EXPECT_FALSE(cfg.showHelp);
}

TEST(ParseArgs, AllFlags) {
    CliOptions cfg = parse({ "--in=levels.csv", "--out=answers.csv", "--method=balanced", "--capacity=5",
                             "--min-empty=1", "--max-empty=3", "--log-level=debug", "--quiet" });
    EXPECT_EQ(cfg.inPath, "levels.csv");
    EXPECT_EQ(cfg.outPath, "answers.csv");
    EXPECT_EQ(cfg.method, SolvingMethod::Balanced);
    EXPECT_EQ(cfg.params.capacity, 5);
    EXPECT_EQ(cfg.params.minEmpty, 1);
    EXPECT_EQ(cfg.params.maxEmpty, 3);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_TRUE(cfg.quiet);
}

TEST(ParseArgs, Help) {
    EXPECT_TRUE(parse({ "--help" }).showHelp);
    EXPECT_TRUE(parse({ "-h" }).showHelp);
    EXPECT_NE(pour::usage().find("--method"), std::string::npos);
}

TEST(ParseArgs, RejectsUnknownAndMalformed) {
    EXPECT_THROW(parse({ "--verbose" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--method=quickest" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--capacity=0" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--capacity=four" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--min-empty=-1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--max-empty=2x" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--in=" }), std::invalid_argument);
}

TEST(ParseArgs, RejectsEmptyRangeBelowMinimum) {
    EXPECT_THROW(parse({ "--min-empty=3", "--max-empty=2" }), std::invalid_argument);
    EXPECT_NO_THROW(parse({ "--min-empty=2", "--max-empty=2" }));
}

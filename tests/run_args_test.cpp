#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/run_args.hpp"

using sandpool::cli::ParseRunArgs;
using sandpool::cli::RunArgs;
using sandpool::config::Config;

namespace {

std::vector<std::string> WithTarget(std::vector<std::string> extra) {
    std::vector<std::string> flags = {
        "--project", "libpng",
        "--target-name", "libpng_read_fuzzer",
        "--target-path", "/src/libpng_read_fuzzer.cc",
    };
    flags.insert(flags.end(), extra.begin(), extra.end());
    return flags;
}

}  // namespace

TEST(RunArgs, ParsesTargetAndOverrides) {
    Config config{};
    RunArgs args{};
    ASSERT_TRUE(ParseRunArgs(WithTarget({"--pool-size", "2", "--fuzz-timeout", "30",
                                         "--corpus", "seeds", "--driver", "fuzzer.cc", "--no-cache"}),
                             config, args));
    EXPECT_EQ(config.benchmark.project, "libpng");
    EXPECT_EQ(config.benchmark.target_name, "libpng_read_fuzzer");
    EXPECT_EQ(config.pool.pool_size, 2);
    EXPECT_EQ(config.pool.fuzz_timeout_s, 30);
    EXPECT_FALSE(config.pool.use_build_cache);
    EXPECT_EQ(args.corpus_dir, "seeds");
    EXPECT_EQ(args.log_dir, ".");
    ASSERT_TRUE(args.driver_path.has_value());
    EXPECT_EQ(*args.driver_path, "fuzzer.cc");
    EXPECT_FALSE(args.build_script_path.has_value());
}

TEST(RunArgs, RejectsPoolSizeBelowOne) {
    for (const std::string value : {"0", "-2"}) {
        Config config{};
        RunArgs args{};
        EXPECT_FALSE(ParseRunArgs(WithTarget({"--pool-size", value}), config, args)) << value;
    }
}

TEST(RunArgs, RejectsFuzzTimeoutBelowOne) {
    for (const std::string value : {"0", "-5"}) {
        Config config{};
        RunArgs args{};
        EXPECT_FALSE(ParseRunArgs(WithTarget({"--fuzz-timeout", value}), config, args)) << value;
    }
}

TEST(RunArgs, RejectsNonNumericValues) {
    Config config{};
    RunArgs args{};
    EXPECT_FALSE(ParseRunArgs(WithTarget({"--pool-size", "4x"}), config, args));
    EXPECT_FALSE(ParseRunArgs(WithTarget({"--fuzz-timeout", "soon"}), config, args));
}

TEST(RunArgs, RejectsOutOfRangeConfigValues) {
    Config config{};
    config.pool.fuzz_timeout_s = -1;
    RunArgs args{};
    EXPECT_FALSE(ParseRunArgs(WithTarget({}), config, args));
}

TEST(RunArgs, RequiresTarget) {
    Config config{};
    RunArgs args{};
    EXPECT_FALSE(ParseRunArgs({"--project", "libpng"}, config, args));
}

TEST(RunArgs, RejectsUnknownFlagAndMissingValue) {
    Config config{};
    RunArgs args{};
    EXPECT_FALSE(ParseRunArgs(WithTarget({"--bogus", "1"}), config, args));
    EXPECT_FALSE(ParseRunArgs(WithTarget({"--corpus"}), config, args));
}

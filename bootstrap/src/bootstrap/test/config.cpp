/**
 * Copyright (c) 2019 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <map>
#include <sstream>

#include <gtest/gtest.h>

#include "bootstrap/error.hpp"
#include "bootstrap/config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace bootstrap { namespace test {

namespace {

Environment environment(const std::map<std::string, std::string> &vars)
{
    return [vars](const std::string &name) -> boost::optional<std::string>
    {
        auto fvars(vars.find(name));
        if (fvars == vars.end()) { return boost::none; }
        return fvars->second;
    };
}

void parse(Config &config, const std::vector<std::string> &args)
{
    po::options_description desc;
    config.configuration(desc);

    po::variables_map vars;
    po::store(po::command_line_parser(args).options(desc).run(), vars);
    po::notify(vars);
    config.configure(vars);
}

} // namespace

TEST(Config, defaults)
{
    Config config;
    EXPECT_EQ(fs::path("config/mapproxy.yaml"), config.mainConfigPath());
    EXPECT_EQ(fs::path("config/seed.yaml"), config.seedConfigPath());
    EXPECT_EQ(fs::path("config/log.ini"), config.logConfigPath());
    EXPECT_FALSE(config.wsgiAppPath());

    EXPECT_EQ("mapproxy-util", config.tools.util);
    EXPECT_EQ("mapproxy-seed", config.tools.seed);

    EXPECT_FALSE(config.seed.skip);
    EXPECT_GE(config.seed.concurrency, 1u);
}

TEST(Config, absolutePathsAreKept)
{
    Config config;
    config.configDir = "/srv/mapproxy";
    config.logConfig = "/etc/mapproxy/log.ini";

    EXPECT_EQ(fs::path("/srv/mapproxy/mapproxy.yaml")
              , config.mainConfigPath());
    EXPECT_EQ(fs::path("/etc/mapproxy/log.ini"), config.logConfigPath());

    config.configDir.clear();
    EXPECT_EQ(fs::path("seed.yaml"), config.seedConfigPath());
}

TEST(Config, options)
{
    Config config;
    parse(config, { "--bootstrap.configDir", "/data"
                , "--bootstrap.wsgiApp", "app.py"
                , "--seed.concurrency", "3"
                , "--seed.continue", "true"
                , "--seed.logFile", "/var/log/seed.log" });

    EXPECT_EQ(fs::path("/data/app.py"), *config.wsgiAppPath());
    EXPECT_EQ(3u, config.seed.concurrency);
    EXPECT_TRUE(config.seed.resume);
    EXPECT_FALSE(config.seed.progressFile);
    ASSERT_TRUE(bool(config.seed.logFile));
    EXPECT_EQ(fs::path("/var/log/seed.log"), *config.seed.logFile);
}

TEST(Config, zeroConcurrencyIsInvalid)
{
    Config config;
    EXPECT_THROW(parse(config, { "--seed.concurrency", "0" })
                 , po::validation_error);
}

TEST(Config, negativeConcurrencyIsInvalid)
{
    Config config;
    EXPECT_THROW(parse(config, { "--seed.concurrency", "-1" })
                 , po::validation_error);
}

TEST(Config, pathsWithSpaces)
{
    Config config;
    parse(config, { "--bootstrap.configDir", "/srv/map data"
                , "--bootstrap.logConfig", "log files/log.ini"
                , "--seed.logFile", "/var/log/map seed.log" });

    EXPECT_EQ(fs::path("/srv/map data/mapproxy.yaml")
              , config.mainConfigPath());
    EXPECT_EQ(fs::path("/srv/map data/log files/log.ini")
              , config.logConfigPath());
    ASSERT_TRUE(bool(config.seed.logFile));
    EXPECT_EQ(fs::path("/var/log/map seed.log"), *config.seed.logFile);
}

TEST(Config, defaultsSurviveParsing)
{
    Config config;
    parse(config, {});

    EXPECT_EQ(fs::path("config/mapproxy.yaml"), config.mainConfigPath());
    EXPECT_FALSE(config.wsgiAppPath());
    EXPECT_GE(config.seed.concurrency, 1u);
}

TEST(Environment, noSeed)
{
    Config config;
    applyEnvironment(config, environment({ { "NO_SEED", "YES" } }));
    EXPECT_TRUE(config.seed.skip);
}

TEST(Environment, noSeedNeedsLiteralYes)
{
    for (const auto value : { "yes", "1", "true", "" }) {
        Config config;
        applyEnvironment(config, environment({ { "NO_SEED", value } }));
        EXPECT_FALSE(config.seed.skip) << "NO_SEED=" << value;
    }
}

TEST(Environment, seedNumCore)
{
    Config config;
    config.seed.concurrency = 16;
    applyEnvironment(config, environment({ { "SEED_NUM_CORE", "4" } }));
    EXPECT_EQ(4u, config.seed.concurrency);
}

TEST(Environment, invalidSeedNumCore)
{
    for (const auto value : { "0", "-2", "four", "" }) {
        Config config;
        EXPECT_THROW(applyEnvironment
                     (config, environment({ { "SEED_NUM_CORE", value } }))
                     , InvalidConfiguration) << "SEED_NUM_CORE=" << value;
    }
}

TEST(Environment, unsetKeepsConfiguration)
{
    Config config;
    config.seed.skip = true;
    config.seed.concurrency = 7;
    applyEnvironment(config, environment({}));
    EXPECT_TRUE(config.seed.skip);
    EXPECT_EQ(7u, config.seed.concurrency);
}

TEST(Config, print)
{
    Config config;
    config.seed.concurrency = 2;

    std::ostringstream os;
    printConfig(os, "\t", config);
    const auto str(os.str());
    EXPECT_NE(std::string::npos, str.find("\tseed.concurrency = 2\n"));
    EXPECT_EQ(std::string::npos, str.find("wsgiApp"));
}

} } // namespace bootstrap::test

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

#include <cstdlib>
#include <ostream>

#include <boost/thread.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace bootstrap {

namespace {

const std::string NoSeedVariable("NO_SEED");
const std::string SeedNumCoreVariable("SEED_NUM_CORE");

unsigned int processorCount()
{
    const auto count(boost::thread::hardware_concurrency());
    return count ? count : 1;
}

// paths are passed as plain strings, fs::path needs quotes in case of
// spaces in filename
fs::path pathValue(const po::variables_map &vars, const std::string &name)
{
    return vars[name].as<std::string>();
}

boost::optional<fs::path> optionalPath(const po::variables_map &vars
                                       , const std::string &name)
{
    if (!vars.count(name)) { return boost::none; }
    return fs::path(vars[name].as<std::string>());
}

} // namespace

SeedOptions::SeedOptions()
    : skip(false), concurrency(processorCount()), resume(false)
{}

Config::Config()
    : configDir("config")
    , mainConfig("mapproxy.yaml")
    , seedConfig("seed.yaml")
    , logConfig("log.ini")
{}

fs::path Config::resolve(const fs::path &path) const
{
    if (path.is_absolute() || configDir.empty()) { return path; }
    return configDir / path;
}

fs::path Config::mainConfigPath() const { return resolve(mainConfig); }

fs::path Config::seedConfigPath() const { return resolve(seedConfig); }

fs::path Config::logConfigPath() const { return resolve(logConfig); }

boost::optional<fs::path> Config::wsgiAppPath() const
{
    if (!wsgiApp) { return boost::none; }
    return resolve(*wsgiApp);
}

void Config::configuration(po::options_description &config)
{
    config.add_options()
        ("bootstrap.configDir", po::value<std::string>()
         ->default_value(configDir.string())->required()
         , "Configuration directory. Target of the base-config template.")
        ("bootstrap.mainConfig", po::value<std::string>()
         ->default_value(mainConfig.string())->required()
         , "Main MapProxy configuration, relative to configDir unless "
         "absolute.")
        ("bootstrap.seedConfig", po::value<std::string>()
         ->default_value(seedConfig.string())->required()
         , "Seed configuration, relative to configDir unless absolute.")
        ("bootstrap.logConfig", po::value<std::string>()
         ->default_value(logConfig.string())->required()
         , "Logging configuration, relative to configDir unless absolute.")
        ("bootstrap.wsgiApp", po::value<std::string>()
         , "WSGI application module to create from the wsgi-app template "
         "if missing. Not created when not set.")

        ("tools.util", po::value(&tools.util)
         ->default_value(tools.util)->required()
         , "MapProxy utility (template tool).")
        ("tools.seed", po::value(&tools.seed)
         ->default_value(tools.seed)->required()
         , "MapProxy seeding tool.")

        ("seed.skip", po::value(&seed.skip)
         ->default_value(seed.skip)->required()
         , "Do not run seeding. Forced by NO_SEED=YES.")
        ("seed.concurrency", po::value<int>()
         ->default_value(int(seed.concurrency))->required()
         , "Number of parallel seeding processes. Overridden by "
         "SEED_NUM_CORE.")
        ("seed.continue", po::value(&seed.resume)
         ->default_value(seed.resume)->required()
         , "Continue seeding from the last known progress.")
        ("seed.progressFile", po::value<std::string>()
         , "Seeding progress file.")
        ("seed.logFile", po::value<std::string>()
         , "Append seeding output to this file. Inherited when not set.")
        ;
}

void Config::configure(const po::variables_map &vars)
{
    configDir = pathValue(vars, "bootstrap.configDir");
    mainConfig = pathValue(vars, "bootstrap.mainConfig");
    seedConfig = pathValue(vars, "bootstrap.seedConfig");
    logConfig = pathValue(vars, "bootstrap.logConfig");
    wsgiApp = optionalPath(vars, "bootstrap.wsgiApp");
    seed.progressFile = optionalPath(vars, "seed.progressFile");
    seed.logFile = optionalPath(vars, "seed.logFile");

    // signed, negative values are rejected rather than wrapped
    const auto concurrency(vars["seed.concurrency"].as<int>());
    if (concurrency <= 0) {
        throw po::validation_error
            (po::validation_error::invalid_option_value, "seed.concurrency");
    }
    seed.concurrency = concurrency;
}

Environment processEnvironment()
{
    return [](const std::string &name) -> boost::optional<std::string>
    {
        if (const auto *value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return boost::none;
    };
}

void applyEnvironment(Config &config, const Environment &environment)
{
    if (const auto noSeed = environment(NoSeedVariable)) {
        if (*noSeed == "YES") {
            LOG(info2) << NoSeedVariable << "=YES: seeding disabled.";
            config.seed.skip = true;
        }
    }

    if (const auto numCore = environment(SeedNumCoreVariable)) {
        int value(0);
        try {
            value = boost::lexical_cast<int>(*numCore);
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(err2, InvalidConfiguration)
                << SeedNumCoreVariable << ": <" << *numCore
                << "> is not a number.";
        }

        if (value <= 0) {
            LOGTHROW(err2, InvalidConfiguration)
                << SeedNumCoreVariable << ": <" << *numCore
                << "> is not a positive number.";
        }

        config.seed.concurrency = value;
    }
}

void printConfig(std::ostream &os, const std::string &prefix
                 , const Config &config)
{
    os << prefix << "bootstrap.configDir = " << config.configDir
       << "\n" << prefix << "bootstrap.mainConfig = "
       << config.mainConfigPath()
       << "\n" << prefix << "bootstrap.seedConfig = "
       << config.seedConfigPath()
       << "\n" << prefix << "bootstrap.logConfig = "
       << config.logConfigPath()
       << "\n";
    if (const auto wsgiApp = config.wsgiAppPath()) {
        os << prefix << "bootstrap.wsgiApp = " << *wsgiApp << "\n";
    }

    os << prefix << "tools.util = " << config.tools.util
       << "\n" << prefix << "tools.seed = " << config.tools.seed
       << "\n" << prefix << "seed.skip = " << std::boolalpha
       << config.seed.skip
       << "\n" << prefix << "seed.concurrency = " << config.seed.concurrency
       << "\n" << prefix << "seed.continue = " << config.seed.resume
       << "\n";
    if (config.seed.progressFile) {
        os << prefix << "seed.progressFile = " << *config.seed.progressFile
           << "\n";
    }
    if (config.seed.logFile) {
        os << prefix << "seed.logFile = " << *config.seed.logFile << "\n";
    }
}

} // namespace bootstrap

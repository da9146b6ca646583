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

#ifndef bootstrap_config_hpp_included_
#define bootstrap_config_hpp_included_

#include <string>
#include <functional>
#include <iosfwd>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>

namespace bootstrap {

/** Seeding tool options.
 */
struct SeedOptions {
    /** Do not seed at all (NO_SEED=YES).
     */
    bool skip;

    /** Number of seeding processes (SEED_NUM_CORE). Defaults to the number
     *  of available processors.
     */
    unsigned int concurrency;

    /** Continue from previous progress (--continue).
     */
    bool resume;

    boost::optional<boost::filesystem::path> progressFile;

    /** Append seeding output to this file instead of inheriting our
     *  stdout/stderr.
     */
    boost::optional<boost::filesystem::path> logFile;

    SeedOptions();
};

/** External MapProxy tools.
 */
struct Tools {
    std::string util;
    std::string seed;

    Tools() : util("mapproxy-util"), seed("mapproxy-seed") {}
};

struct Config {
    /** Configuration directory, default base-config template target.
     */
    boost::filesystem::path configDir;

    // following paths are relative to configDir unless absolute
    boost::filesystem::path mainConfig;
    boost::filesystem::path seedConfig;
    boost::filesystem::path logConfig;

    /** WSGI application module, created only when set.
     */
    boost::optional<boost::filesystem::path> wsgiApp;

    Tools tools;
    SeedOptions seed;

    Config();

    boost::filesystem::path mainConfigPath() const;
    boost::filesystem::path seedConfigPath() const;
    boost::filesystem::path logConfigPath() const;
    boost::optional<boost::filesystem::path> wsgiAppPath() const;

    /** Resolves path against configDir.
     */
    boost::filesystem::path resolve(const boost::filesystem::path &path)
        const;

    /** Registers configuration options.
     */
    void configuration(boost::program_options::options_description &config);

    /** Fetches values from parsed options and validates them.
     */
    void configure(const boost::program_options::variables_map &vars);
};

/** Environment variable getter. Returns boost::none for unset variables.
 */
typedef std::function<boost::optional<std::string>(const std::string&)>
    Environment;

/** Reads real process environment.
 */
Environment processEnvironment();

/** Applies NO_SEED and SEED_NUM_CORE overrides.
 *
 * \throws InvalidConfiguration when SEED_NUM_CORE is not a positive integer
 */
void applyEnvironment(Config &config, const Environment &environment);

void printConfig(std::ostream &os, const std::string &prefix
                 , const Config &config);

} // namespace bootstrap

#endif // bootstrap_config_hpp_included_

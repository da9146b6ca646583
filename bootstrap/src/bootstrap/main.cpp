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
#include <string>
#include <vector>

#include "dbglog/dbglog.hpp"

#include "utility/streams.hpp"
#include "utility/buildsys.hpp"
#include "service/cmdline.hpp"

#include "./error.hpp"
#include "./config.hpp"
#include "./process.hpp"
#include "./orchestrator.hpp"

namespace po = boost::program_options;

namespace bs = bootstrap;

class Bootstrap : public service::Cmdline {
public:
    Bootstrap(const bs::Command &command)
        : service::Cmdline("mapproxy-bootstrap", BUILD_TARGET_VERSION)
        , command_(command)
    {}

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map &vars);

    bool help(std::ostream &out, const std::string &what) const;

    int run();

    bs::Config config_;

    /** Foreground command given after "--".
     */
    bs::Command command_;

    /** Foreground command given as positional arguments.
     */
    std::vector<std::string> positional_;
};

void Bootstrap::configuration(po::options_description &cmdline
                              , po::options_description &config
                              , po::positional_options_description &pd)
{
    config_.configuration(config);

    cmdline.add_options()
        ("command", po::value(&positional_)
         , "Foreground command and its arguments. Use \"--\" to separate "
         "a command whose arguments start with a dash.")
        ;

    pd.add("command", -1);
}

void Bootstrap::configure(const po::variables_map &vars)
{
    config_.configure(vars);

    try {
        bs::applyEnvironment(config_, bs::processEnvironment());
    } catch (const bs::InvalidConfiguration&) {
        throw po::validation_error
            (po::validation_error::invalid_option_value, "SEED_NUM_CORE");
    }

    if (command_.empty()) {
        command_ = bs::Command::fromArgv(positional_);
    } else if (!positional_.empty()) {
        LOG(warn2, log_)
            << "Ignoring positional command in favor of the one given "
            "after \"--\".";
    }

    LOG(info3, log_)
        << "Config:\n"
        << utility::LManip([&](std::ostream &os) {
                bs::printConfig(os, "\t", config_);
            })
        << "\tcommand = " << command_
        << "\n"
        ;
}

bool Bootstrap::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        // program help
        out << ("mapproxy container bootstrap\n"
                "    Creates missing MapProxy configuration from templates,\n"
                "    starts background seeding and then executes the\n"
                "    given command in place of itself.\n"
                "\n"
                "usage: mapproxy-bootstrap [options] [--] command [args...]\n"
                "\n"
                "    Without \"--\" any dash argument of the command is taken\n"
                "    as an option of mapproxy-bootstrap. Containers should\n"
                "    therefore use:\n"
                "        ENTRYPOINT [\"mapproxy-bootstrap\", \"--\"]\n"
                "\n"
                "environment:\n"
                "    NO_SEED=YES      do not seed\n"
                "    SEED_NUM_CORE=N  seeding concurrency\n"
                "\n"
                );

        return true;
    }

    return false;
}

int Bootstrap::run()
{
    bs::Orchestrator orchestrator(config_);

    try {
        orchestrator.prepare();
    } catch (const bs::Error &e) {
        LOG(fatal) << "Bootstrap failed: " << e.what();
        return EXIT_FAILURE;
    }

    if (command_.empty()) {
        LOG(info3) << "No command given, nothing to run.";
        return EXIT_SUCCESS;
    }

    try {
        orchestrator.handoff(command_);
    } catch (const bs::ExecError &e) {
        return e.exitCode;
    }

    // not reached, handoff either replaces us or throws
    return EXIT_FAILURE;
}

int main(int argc, char *argv[])
{
    // everything after first "--" is the foreground command, verbatim
    int split(argc);
    for (int i(1); i < argc; ++i) {
        if (std::string(argv[i]) == "--") {
            split = i;
            break;
        }
    }

    bs::Command command;
    if (split < argc) {
        command = bs::Command::fromArgv
            (std::vector<std::string>(argv + split + 1, argv + argc));
    }

    return Bootstrap(command)(split, argv);
}

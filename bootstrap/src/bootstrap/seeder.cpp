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

#include <system_error>

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "./seeder.hpp"

namespace fs = boost::filesystem;

namespace bootstrap {

Command Seeder::command(const fs::path &mainConfig
                        , const fs::path &seedConfig
                        , const SeedOptions &options) const
{
    Command cmd(tool_, {
            "-f", mainConfig.string()
            , "-s", seedConfig.string()
            , "-c", boost::lexical_cast<std::string>(options.concurrency)
        });

    if (options.resume) { cmd.args.push_back("--continue"); }

    if (options.progressFile) {
        cmd.args.push_back("--progress-file");
        cmd.args.push_back(options.progressFile->string());
    }

    return cmd;
}

boost::optional<Process::Id>
Seeder::launch(const fs::path &mainConfig, const fs::path &seedConfig
               , const SeedOptions &options) const
{
    const auto cmd(command(mainConfig, seedConfig, options));

    Redirect redirect;
    redirect.output = options.logFile;

    try {
        auto process(spawn(cmd, redirect));
        const auto id(process.detach());
        LOG(info3) << "Seeding running in background (pid " << id
                   << ", concurrency " << options.concurrency << ").";
        return id;
    } catch (const std::system_error &e) {
        LOG(warn3) << "Unable to start seeding <" << cmd << ">: <"
                   << e.code() << ", " << e.what() << ">; continuing.";
    }

    return boost::none;
}

} // namespace bootstrap

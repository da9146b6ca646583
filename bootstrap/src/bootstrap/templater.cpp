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

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./templater.hpp"

namespace fs = boost::filesystem;

namespace bootstrap {

Command Templater::command(const std::string &templateName
                           , const fs::path &target
                           , const std::vector<std::string> &extraArgs)
    const
{
    Command cmd(tool_, { "create", "-t", templateName });
    cmd.args.insert(cmd.args.end(), extraArgs.begin(), extraArgs.end());
    cmd.args.push_back(target.string());
    return cmd;
}

void Templater::create(const std::string &templateName
                       , const fs::path &target
                       , const std::vector<std::string> &extraArgs) const
{
    const auto cmd(command(templateName, target, extraArgs));

    Process process;
    try {
        process = spawn(cmd);
    } catch (const std::system_error &e) {
        LOGTHROW(err3, TemplateError)
            << "Unable to run <" << cmd << ">: <" << e.code()
            << ", " << e.what() << ">.";
    }

    Process::ExitCode ec(0);
    try {
        ec = process.join();
    } catch (const std::system_error &e) {
        process.detach();
        LOGTHROW(err3, TemplateError)
            << "Unable to wait for <" << cmd << ">: <" << e.code()
            << ", " << e.what() << ">.";
    }

    if (ec) {
        LOGTHROW(err3, TemplateError)
            << "Template " << templateName << " -> " << target
            << " failed: <" << cmd << "> exited with status " << ec << ".";
    }

    LOG(info3) << "Created " << target << " from template "
               << templateName << ".";
}

} // namespace bootstrap

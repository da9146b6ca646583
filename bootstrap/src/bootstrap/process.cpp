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

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <ostream>

#include "dbglog/dbglog.hpp"

#include "utility/process.hpp"

#include "./error.hpp"
#include "./process.hpp"

namespace bootstrap {

namespace {

/** Calls execvp. Returns errno on failure.
 */
int execCommand(const Command &command)
{
    const auto args(command.argv());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(argv.front(), argv.data());
    return errno;
}

/** Child side of spawn(). Never returns.
 */
void runChild(const Command &command, const Redirect &redirect)
{
    if (redirect.output) {
        auto fd(::open(redirect.output->c_str()
                       , O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
        if (fd < 0) {
            std::system_error e(errno, std::system_category());
            LOG(err2) << "Cannot open " << *redirect.output
                      << " for output of <" << command << ">: <"
                      << e.code() << ", " << e.what() << ">.";
            ::_exit(EXIT_FAILURE);
        }

        if ((::dup2(fd, STDOUT_FILENO) < 0)
            || (::dup2(fd, STDERR_FILENO) < 0))
        {
            ::_exit(EXIT_FAILURE);
        }
        ::close(fd);
    }

    const auto error(execCommand(command));

    std::system_error e(error, std::system_category());
    LOG(err2) << "Cannot execute <" << command << ">: <"
              << e.code() << ", " << e.what() << ">.";
    ::_exit(execFailureCode(error));
}

} // namespace

Command Command::fromArgv(const std::vector<std::string> &argv)
{
    if (argv.empty()) { return {}; }
    return Command(argv.front()
                   , std::vector<std::string>(argv.begin() + 1, argv.end()));
}

std::vector<std::string> Command::argv() const
{
    std::vector<std::string> out;
    out.reserve(args.size() + 1);
    out.push_back(program);
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::ostream& operator<<(std::ostream &os, const Command &command)
{
    os << command.program;
    for (const auto &arg : command.args) { os << ' ' << arg; }
    return os;
}

int execFailureCode(int errorCode)
{
    return (errorCode == ENOENT) ? 127 : 126;
}

Process::ExitCode Process::join()
{
    if (!joinable()) {
        std::system_error e(EINVAL, std::system_category());
        LOG(err3) << "Cannot join non-joinable process.";
        throw e;
    }

    if (id_ == ::getpid()) {
        std::system_error e(EDEADLK, std::system_category());
        LOG(err3) << "Cannot join a process from within.";
        throw e;
    }

    LOG(debug) << "Joining process " << id_ << ".";

    int status;
    for (;;) {
        auto res(::waitpid(id_, &status, 0));
        if (res < 0) {
            if (EINTR == errno) { continue; }

            std::system_error e(errno, std::system_category());
            LOG(warn1) << "waitpid(" << id_ << ") failed: <" << e.code()
                       << ", " << e.what() << ">";
            throw e;
        }
        break;
    }

    LOG(info1) << "Joined process " << id_ << ", status: " << status << ".";

    // reset ID
    id_ = 0;

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return EXIT_FAILURE;
}

Process::Id Process::detach()
{
    if (!joinable()) {
        std::system_error e(EINVAL, std::system_category());
        LOG(err3) << "Cannot detach non-joinable process.";
        throw e;
    }

    const auto id(id_);
    id_ = 0;
    return id;
}

void Process::kill(Id id)
{
    auto res(::kill(id, SIGKILL));

    if (res < 0) {
        std::system_error e(errno, std::system_category());
        LOG(warn1) << "kill(" << id << ", SIGKILL) failed: <" << e.code()
                   << ", " << e.what() << ">";
        throw e;
    }
}

void Process::kill()
{
    if (!joinable()) {
        std::system_error e(EINVAL, std::system_category());
        LOG(err3) << "Cannot kill non-joinable process.";
        throw e;
    }

    kill(id_);
    killed_ = true;
}

Process::Id Process::run(const std::function<void()> &func
                         , const Flags &flags)
{
    int pflags(utility::SpawnFlag::none);
    if (flags.quickExit()) {
        pflags |= utility::SpawnFlag::quickExit;
    }

    return utility::spawn([=]() -> int { func(); return EXIT_SUCCESS; }
                          , pflags);
}

Process spawn(const Command &command, const Redirect &redirect)
{
    LOG(info2) << "Spawning <" << command << ">.";
    return Process(Process::Flags().quickExit(true)
                   , [command, redirect]() { runChild(command, redirect); });
}

void execute(const Command &command)
{
    if (command.empty()) {
        LOG(err2) << "Cannot execute an empty command.";
        throw ExecError("empty command", ENOENT, execFailureCode(ENOENT));
    }

    LOG(info2) << "Executing <" << command << ">.";
    const auto error(execCommand(command));

    std::system_error e(error, std::system_category());
    LOG(err3) << "Cannot execute <" << command << ">: <"
              << e.code() << ", " << e.what() << ">.";
    throw ExecError(e.what(), error, execFailureCode(error));
}

} // namespace bootstrap

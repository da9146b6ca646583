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

#ifndef bootstrap_process_hpp_included_
#define bootstrap_process_hpp_included_

#include <exception>
#include <functional>
#include <utility>
#include <string>
#include <vector>
#include <iosfwd>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

namespace bootstrap {

/** Program and its arguments. Program is looked up in PATH unless it
 *  contains a slash.
 */
struct Command {
    std::string program;
    std::vector<std::string> args;

    Command() {}
    Command(const std::string &program
            , const std::vector<std::string> &args = {})
        : program(program), args(args)
    {}

    /** Builds command from argument vector, first element is program.
     */
    static Command fromArgv(const std::vector<std::string> &argv);

    bool empty() const { return program.empty(); }

    /** Full argument vector, program included.
     */
    std::vector<std::string> argv() const;
};

std::ostream& operator<<(std::ostream &os, const Command &command);

class Process {
public:
    typedef int Id;
    typedef int ExitCode;

    class Flags {
    public:
        Flags() : quickExit_(false) {}
        Flags& quickExit(bool value) { quickExit_ = value; return *this; }
        bool quickExit() const { return quickExit_; }

    private:
        bool quickExit_;
    };

    Process() : id_(), killed_(false) {}
    Process(Process &&other);

    template<typename Function, typename ...Args>
    Process(const Flags &flags, Function &&f, Args &&...args);

    Process(const Process&) = delete;
    ~Process();

    Process& operator=(Process &&other);
    Process& operator=(Process &other) = delete;

    Id id() const { return id_; }

    inline bool joinable() const { return id_ > 0; }

    /** Joins process. Can throw system_error, see std::thread documentation.
     *
     * \return exit status, 128 + signal number when killed by a signal
     */
    ExitCode join();

    /** Lets the process run on its own. Process is never joined
     *  afterwards. Returns its ID.
     */
    Id detach();

    /** Kill the process (hard kill).
     */
    void kill();

    bool killed() const { return killed_; }

    static void kill(Id id);

private:
    static Id run(const std::function<void()> &func, const Flags &flags);

    Id id_;

    bool killed_;
};

/** Where spawned command's output goes.
 */
struct Redirect {
    /** Append both stdout and stderr to this file. Inherited if unset.
     */
    boost::optional<boost::filesystem::path> output;
};

/** Runs command in a child process.
 */
Process spawn(const Command &command, const Redirect &redirect = Redirect());

/** Replaces current process image with given command. Returns only by
 *  throwing ExecError.
 */
void execute(const Command &command);

/** Exit code a shell uses when exec fails with given errno.
 */
int execFailureCode(int errorCode);

// inlines

inline Process::Process(Process &&other)
    : id_(other.id_), killed_(other.killed_)
{
    other.id_ = 0;
    other.killed_ = false;
}

inline Process& Process::operator=(Process &&other)
{
    if (joinable()) { std::terminate(); }
    id_ = other.id_;
    killed_ = other.killed_;
    other.id_ = 0;
    other.killed_ = false;
    return *this;
}

template<class Function, typename ...Args>
inline Process::Process(const Flags &flags, Function &&f, Args &&...args)
    : killed_(false)
{
    id_ = run(std::bind<void>(std::forward<Function>(f)
                              , std::forward<Args>(args)...)
              , flags);
}

inline Process::~Process()
{
    if (joinable()) { std::terminate(); }
}

} // namespace bootstrap

#endif // bootstrap_process_hpp_included_

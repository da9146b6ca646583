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

#ifndef bootstrap_test_sandbox_hpp_included_
#define bootstrap_test_sandbox_hpp_included_

#include <string>
#include <vector>
#include <fstream>
#include <iterator>

#include <boost/filesystem.hpp>

namespace bootstrap { namespace test {

/** Temporary directory with stub tools. Removed on destruction.
 */
class Sandbox {
public:
    Sandbox()
        : root_(boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("bootstrap-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(root_);
    }

    ~Sandbox() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(root_, ec);
    }

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    const boost::filesystem::path& root() const { return root_; }

    boost::filesystem::path path(const std::string &name) const {
        return root_ / name;
    }

    /** Writes executable shell script.
     */
    boost::filesystem::path script(const std::string &name
                                   , const std::string &body) const
    {
        const auto p(path(name));
        {
            std::ofstream f(p.string());
            f << "#!/bin/sh\n" << body << "\n";
        }
        boost::filesystem::permissions
            (p, boost::filesystem::owner_all
             | boost::filesystem::group_read
             | boost::filesystem::group_exe
             | boost::filesystem::others_read
             | boost::filesystem::others_exe);
        return p;
    }

    /** Template tool stub: records its arguments in `log` and creates
     *  requested artifacts.
     */
    boost::filesystem::path utilStub(const std::string &log = "util.log")
        const
    {
        return script("mapproxy-util"
                      , "echo \"$*\" >> '" + path(log).string() + "'\n"
                      "for target; do :; done\n"
                      "case \"$3\" in\n"
                      "base-config)\n"
                      "    mkdir -p \"$target\" || exit 1\n"
                      "    [ -f \"$target/mapproxy.yaml\" ] "
                      "|| echo base > \"$target/mapproxy.yaml\"\n"
                      "    [ -f \"$target/seed.yaml\" ] "
                      "|| echo seed > \"$target/seed.yaml\"\n"
                      "    ;;\n"
                      "*)\n"
                      "    echo \"$3\" > \"$target\"\n"
                      "    ;;\n"
                      "esac\n");
    }

    /** Tool stub that records its arguments and exits with given code.
     */
    boost::filesystem::path recorder(const std::string &name
                                     , const std::string &log
                                     , int exitCode = 0) const
    {
        return script(name, "echo \"$*\" >> '" + path(log).string() + "'\n"
                      "exit " + std::to_string(exitCode));
    }

    void touch(const boost::filesystem::path &p
               , const std::string &content = "existing") const
    {
        boost::filesystem::create_directories(p.parent_path());
        std::ofstream f(p.string());
        f << content << "\n";
    }

    /** Returns file lines, empty if file does not exist.
     */
    std::vector<std::string> lines(const boost::filesystem::path &p) const {
        std::vector<std::string> out;
        std::ifstream f(p.string());
        std::string line;
        while (std::getline(f, line)) { out.push_back(line); }
        return out;
    }

    std::vector<std::string> lines(const std::string &name) const {
        return lines(path(name));
    }

    std::vector<std::string> lines(const char *name) const {
        return lines(std::string(name));
    }

    std::string content(const boost::filesystem::path &p) const {
        std::ifstream f(p.string());
        return std::string(std::istreambuf_iterator<char>(f)
                           , std::istreambuf_iterator<char>());
    }

private:
    boost::filesystem::path root_;
};

} } // namespace bootstrap::test

#endif // bootstrap_test_sandbox_hpp_included_

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

#ifndef bootstrap_templater_hpp_included_
#define bootstrap_templater_hpp_included_

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "./process.hpp"

namespace bootstrap {

/** Creates configuration artifacts via `<tool> create -t <template>`.
 */
class Templater {
public:
    Templater(const std::string &tool) : tool_(tool) {}

    /** Runs the template tool and waits for it.
     *
     * \param templateName template to instantiate (base-config, log-ini...)
     * \param target file or directory to create
     * \param extraArgs arguments placed between template and target
     * \throws TemplateError if the tool fails in any way
     */
    void create(const std::string &templateName
                , const boost::filesystem::path &target
                , const std::vector<std::string> &extraArgs = {}) const;

    /** Command run by create().
     */
    Command command(const std::string &templateName
                    , const boost::filesystem::path &target
                    , const std::vector<std::string> &extraArgs = {}) const;

private:
    std::string tool_;
};

} // namespace bootstrap

#endif // bootstrap_templater_hpp_included_

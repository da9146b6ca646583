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

#ifndef bootstrap_seeder_hpp_included_
#define bootstrap_seeder_hpp_included_

#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "./config.hpp"
#include "./process.hpp"

namespace bootstrap {

/** Launches tile seeding in background. Seeding is never waited for and its
 *  outcome is not reported back.
 */
class Seeder {
public:
    Seeder(const std::string &tool) : tool_(tool) {}

    /** Spawns seeding tool and detaches from it.
     *
     * \return seeding process ID or none if the process cannot be spawned
     */
    boost::optional<Process::Id>
    launch(const boost::filesystem::path &mainConfig
           , const boost::filesystem::path &seedConfig
           , const SeedOptions &options) const;

    Command command(const boost::filesystem::path &mainConfig
                    , const boost::filesystem::path &seedConfig
                    , const SeedOptions &options) const;

private:
    std::string tool_;
};

} // namespace bootstrap

#endif // bootstrap_seeder_hpp_included_

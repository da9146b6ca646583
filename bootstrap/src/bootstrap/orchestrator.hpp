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

#ifndef bootstrap_orchestrator_hpp_included_
#define bootstrap_orchestrator_hpp_included_

#include <boost/optional.hpp>

#include "./config.hpp"
#include "./process.hpp"
#include "./templater.hpp"
#include "./seeder.hpp"

namespace bootstrap {

/** Container start sequence: makes sure MapProxy configuration exists,
 *  optionally starts background seeding and then replaces itself with the
 *  foreground command.
 *
 *  Existing configuration files are never touched, running the sequence
 *  again on the same configuration directory invokes no template.
 */
class Orchestrator {
public:
    struct Outcome {
        bool baseConfigCreated;
        bool logConfigCreated;
        bool wsgiAppCreated;

        /** Background seeding process, if launched.
         */
        boost::optional<Process::Id> seeding;

        Outcome()
            : baseConfigCreated(false), logConfigCreated(false)
            , wsgiAppCreated(false)
        {}

        bool seedLaunched() const { return bool(seeding); }
    };

    Orchestrator(const Config &config);

    /** Creates missing configuration and launches seeding.
     *
     * \throws TemplateError when any template cannot be created
     */
    Outcome prepare() const;

    /** Replaces current process with given command. Returns only by throwing
     *  ExecError.
     */
    void handoff(const Command &command) const;

    /** prepare() + handoff()
     */
    void operator()(const Command &command) const;

    const Config& config() const { return config_; }

private:
    /** Returns true if both main and seed configuration were present.
     */
    bool ensureBaseConfig(Outcome &outcome) const;

    void ensureLogConfig(Outcome &outcome) const;

    void ensureWsgiApp(Outcome &outcome) const;

    void seed(Outcome &outcome) const;

    Config config_;
    Templater templater_;
    Seeder seeder_;
};

} // namespace bootstrap

#endif // bootstrap_orchestrator_hpp_included_

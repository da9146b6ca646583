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

#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./orchestrator.hpp"

namespace fs = boost::filesystem;

namespace bootstrap {

namespace {

const std::string BaseConfigTemplate("base-config");
const std::string LogIniTemplate("log-ini");
const std::string WsgiAppTemplate("wsgi-app");

void ensureDirectory(const fs::path &dir)
{
    if (dir.empty()) { return; }

    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOGTHROW(err3, TemplateError)
            << "Unable to create directory " << dir << ": <"
            << ec << ", " << ec.message() << ">.";
    }
}

} // namespace

Orchestrator::Orchestrator(const Config &config)
    : config_(config), templater_(config.tools.util)
    , seeder_(config.tools.seed)
{}

bool Orchestrator::ensureBaseConfig(Outcome &outcome) const
{
    const auto mainConfig(config_.mainConfigPath());
    const auto seedConfig(config_.seedConfigPath());

    if (fs::exists(mainConfig) && fs::exists(seedConfig)) {
        LOG(info3) << "Found " << mainConfig << " and " << seedConfig << ".";
        return true;
    }

    LOG(info3) << "Missing one of " << mainConfig << " or " << seedConfig
               << ". Creating new one from template " << BaseConfigTemplate
               << ".";

    ensureDirectory(config_.configDir);
    templater_.create(BaseConfigTemplate
                      , config_.configDir.empty()
                      ? fs::path(".") : config_.configDir);
    outcome.baseConfigCreated = true;
    return false;
}

void Orchestrator::ensureLogConfig(Outcome &outcome) const
{
    const auto logConfig(config_.logConfigPath());

    if (fs::exists(logConfig)) {
        LOG(info3) << "Found " << logConfig << ".";
        return;
    }

    LOG(info3) << "Missing " << logConfig
               << ". Creating new one from template " << LogIniTemplate
               << ".";

    ensureDirectory(logConfig.parent_path());
    templater_.create(LogIniTemplate, logConfig);
    outcome.logConfigCreated = true;
}

void Orchestrator::ensureWsgiApp(Outcome &outcome) const
{
    const auto wsgiApp(config_.wsgiAppPath());
    if (!wsgiApp) { return; }

    if (fs::exists(*wsgiApp)) {
        LOG(info3) << "Found " << *wsgiApp << ".";
        return;
    }

    LOG(info3) << "Missing " << *wsgiApp
               << ". Creating new one from template " << WsgiAppTemplate
               << ".";

    ensureDirectory(wsgiApp->parent_path());
    templater_.create(WsgiAppTemplate, *wsgiApp
                      , { "-f", config_.mainConfigPath().string() });
    outcome.wsgiAppCreated = true;
}

void Orchestrator::seed(Outcome &outcome) const
{
    if (config_.seed.skip) {
        LOG(info3) << "Seeding disabled.";
        return;
    }

    LOG(info3) << "Seeding with concurrency "
               << config_.seed.concurrency << ".";
    outcome.seeding = seeder_.launch(config_.mainConfigPath()
                                     , config_.seedConfigPath()
                                     , config_.seed);
}

Orchestrator::Outcome Orchestrator::prepare() const
{
    Outcome outcome;

    const auto configured(ensureBaseConfig(outcome));
    ensureLogConfig(outcome);
    ensureWsgiApp(outcome);

    // freshly created configuration describes demo sources only
    if (configured) {
        seed(outcome);
    } else {
        LOG(info3) << "Configuration has just been created, not seeding.";
    }

    return outcome;
}

void Orchestrator::handoff(const Command &command) const
{
    LOG(info3) << "Running <" << command << ">.";
    execute(command);
}

void Orchestrator::operator()(const Command &command) const
{
    prepare();
    handoff(command);
}

} // namespace bootstrap

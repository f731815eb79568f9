#include <servherd/app/log_reader.h>
#include <servherd/app/server_service.h>
#include <servherd/common/env_compare.h>
#include <servherd/common/time_parser.h>
#include <servherd/naming/name_generator.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace servherd::app {

using registry::ServerEntry;

namespace {

int selectorCount(const Selector& s) {
    return (s.name ? 1 : 0) + (s.all ? 1 : 0) + (s.tag ? 1 : 0);
}

BatchResult failure(const std::string& name, const Error& error) {
    BatchResult r;
    r.name = name;
    r.success = false;
    r.message = error.message;
    return r;
}

void appendMissing(std::vector<templates::MissingVariable>& into,
                   std::vector<templates::MissingVariable> more) {
    for (auto& mv : more) {
        bool seen = std::any_of(into.begin(), into.end(), [&](const auto& existing) {
            return existing.templateVar == mv.templateVar;
        });
        if (!seen) {
            into.push_back(std::move(mv));
        }
    }
}

} // namespace

ServerService::ServerService(config::GlobalConfig config, registry::RegistryService& registry,
                             process::IProcessBackend& backend)
    : ServerService(std::move(config), registry, backend, Options{}) {}

ServerService::ServerService(config::GlobalConfig config, registry::RegistryService& registry,
                             process::IProcessBackend& backend, Options options)
    : config_(std::move(config)), registry_(registry), backend_(backend),
      options_(std::move(options)) {}

templates::TemplateContext ServerService::templateContext(const std::string& cwd) const {
    templates::TemplateContext ctx;
    ctx.lookupServer = [this](const std::string& name, const std::string& dir) {
        return registry_.findByCwdAndName(dir, name);
    };
    ctx.cwd = cwd;
    return ctx;
}

bool ServerService::confirm(const std::string& question) const {
    return options_.confirm ? options_.confirm(question) : false;
}

Result<ServerService::Rendered> ServerService::render(const std::string& command,
                                                      const std::optional<EnvMap>& env, int port,
                                                      Protocol protocol,
                                                      const std::string& hostname,
                                                      const std::string& cwd) const {
    auto vars = templates::getTemplateVariables(config_, port, protocol, hostname);

    auto missing = templates::findMissingVariables(command, vars);
    if (env) {
        for (const auto& [key, value] : *env) {
            appendMissing(missing, templates::findMissingVariables(value, vars));
        }
    }
    if (!missing.empty()) {
        return Error{ErrorCode::TemplateMissingVariable,
                     templates::formatMissingVariablesError(missing)};
    }

    Rendered out;
    try {
        auto ctx = templateContext(cwd);
        out.resolvedCommand = templates::render(command, vars, ctx);
        if (env) {
            out.env = templates::renderEnvTemplates(*env, vars, ctx);
        }
    } catch (const templates::TemplateLookupError& e) {
        return Error{ErrorCode::TemplateLookupFailed, e.what()};
    }

    out.usedConfigKeys = drift::extractUsedConfigKeys(command, config_.variables);
    if (env) {
        for (const auto& [key, value] : *env) {
            for (auto& k : drift::extractUsedConfigKeys(value, config_.variables)) {
                if (std::find(out.usedConfigKeys.begin(), out.usedConfigKeys.end(), k) ==
                    out.usedConfigKeys.end()) {
                    out.usedConfigKeys.push_back(std::move(k));
                }
            }
        }
    }
    out.snapshot = drift::createConfigSnapshot(config_, out.usedConfigKeys);
    return out;
}

Result<void> ServerService::startProcess(const ServerEntry& entry) {
    auto [script, args] = process::splitCommand(entry.resolvedCommand);
    process::StartSpec spec;
    spec.name = entry.processHandle;
    spec.script = std::move(script);
    spec.args = std::move(args);
    spec.cwd = entry.cwd;
    spec.env = entry.env;
    spec.env["PORT"] = std::to_string(entry.port);
    spdlog::debug("Starting {} as {} on port {}", entry.name, entry.processHandle, entry.port);
    return backend_.start(spec);
}

Result<void> ServerService::deleteIgnoringMissing(const std::string& handle) {
    auto r = backend_.remove(handle);
    if (!r && r.error().code == ErrorCode::ProcessNotFound) {
        return Result<void>();
    }
    return r;
}

Result<port::PortAssignment> ServerService::assignPort(const std::string& cwd,
                                                       const std::string& command,
                                                       std::optional<int> explicitPort) {
    port::PortAllocator allocator(config_, options_.probe);
    if (!options_.ciMode) {
        return allocator.assign(cwd, command, explicitPort);
    }
    allocator.loadCiUsedPorts();
    auto assigned = allocator.assign(cwd, command, explicitPort, true, registry_.ports());
    if (assigned) {
        allocator.saveCiUsedPorts();
    }
    return assigned;
}

Result<ServerEntry> ServerService::rerender(const ServerEntry& entry, const std::string& command,
                                            const std::optional<EnvMap>& env, Protocol protocol,
                                            const drift::DriftResult& driftState,
                                            std::optional<int>* reassignedFrom) {
    int port = entry.port;
    if (driftState.portOutOfRange) {
        auto assigned = assignPort(entry.cwd, command, std::nullopt);
        if (!assigned) {
            return assigned.error();
        }
        port = assigned.value().port;
        if (reassignedFrom && port != entry.port) {
            *reassignedFrom = entry.port;
        }
        spdlog::info("Port {} of {} is outside {}-{}, moving to {}", entry.port, entry.name,
                     config_.portRange.min, config_.portRange.max, port);
    }

    auto rendered = render(command, env, port, protocol, config_.hostname, entry.cwd);
    if (!rendered) {
        return rendered.error();
    }

    registry::ServerUpdate update;
    update.command = command;
    update.resolvedCommand = rendered.value().resolvedCommand;
    update.port = port;
    update.protocol = protocol;
    update.hostname = config_.hostname;
    update.env = rendered.value().env.value_or(EnvMap{});
    update.usedConfigKeys = rendered.value().usedConfigKeys;
    update.configSnapshot = rendered.value().snapshot;

    // The registry only takes the new settings once the old process is gone.
    if (auto d = deleteIgnoringMissing(entry.processHandle); !d) {
        return d.error();
    }
    auto updated = registry_.updateServer(entry.id, update);
    if (!updated) {
        return updated.error();
    }
    if (auto s = startProcess(updated.value()); !s) {
        return s.error();
    }
    return updated;
}

Result<StartResult> ServerService::start(const StartOptions& opts) {
    if (opts.port) {
        port::PortAllocator allocator(config_, options_.probe);
        if (auto v = allocator.validateInRange(*opts.port); !v) {
            return v.error();
        }
    }

    std::optional<ServerEntry> existing;
    std::string deterministicName;
    if (opts.name) {
        existing = registry_.findByCwdAndName(opts.cwd, *opts.name);
    } else {
        deterministicName =
            naming::generateDeterministicName(opts.command, opts.env.value_or(EnvMap{}));
        existing = registry_.findByCwdAndName(opts.cwd, deterministicName);
        if (!existing) {
            existing = registry_.findByCommandHash(opts.cwd, opts.command);
        }
    }

    if (!existing) {
        std::string name = opts.name.value_or(deterministicName);
        if (!opts.name && registry_.findByName(name)) {
            name = naming::generateName(registry_.names());
        }
        return startNew(opts, name);
    }

    const ServerEntry entry = *existing;
    const bool commandChanged = opts.name.has_value() && entry.command != opts.command;

    auto driftState = drift::detectDrift(entry, config_);
    bool declined = false;
    if (driftState.hasDrift) {
        switch (config_.refreshOnChange) {
            case RefreshOnChange::OnStart:
            case RefreshOnChange::Auto:
                return refreshOnStart(entry, opts, driftState, commandChanged);
            case RefreshOnChange::Prompt:
                if (!options_.ciMode &&
                    confirm(fmt::format("Server \"{}\" has config drift:\n{}\nRefresh it now?",
                                        entry.name, drift::formatDrift(driftState)))) {
                    return refreshOnStart(entry, opts, driftState, commandChanged);
                }
                declined = true;
                break;
            case RefreshOnChange::Manual:
                break;
        }
    }

    auto status = process::getStatus(backend_, entry.processHandle);
    if (!status) {
        return status.error();
    }

    std::optional<EnvMap> resolvedEnv;
    if (opts.env) {
        auto vars = templates::getTemplateVariables(config_, entry.port, entry.protocol,
                                                    entry.hostname);
        try {
            resolvedEnv = templates::renderEnvTemplates(*opts.env, vars, templateContext(opts.cwd));
        } catch (const templates::TemplateLookupError& e) {
            return Error{ErrorCode::TemplateLookupFailed, e.what()};
        }
    }
    const bool envChanged = common::hasEnvChanged(entry.env, resolvedEnv);

    StartResult result;
    result.entry = entry;
    result.configDrift = driftState.hasDrift;
    result.driftDetails = drift::driftDetails(driftState);
    result.userDeclinedRefresh = declined;

    if (status.value() == ServerStatus::Online && !envChanged && !commandChanged) {
        result.action = StartAction::Existing;
        result.status = ServerStatus::Online;
        return result;
    }

    if (envChanged || commandChanged) {
        const Protocol protocol = opts.protocol.value_or(entry.protocol);
        auto rendered =
            render(opts.command, opts.env, entry.port, protocol, entry.hostname, opts.cwd);
        if (!rendered) {
            return rendered.error();
        }
        registry::ServerUpdate update;
        update.command = opts.command;
        update.resolvedCommand = rendered.value().resolvedCommand;
        update.protocol = protocol;
        update.env = rendered.value().env.value_or(EnvMap{});
        update.usedConfigKeys = rendered.value().usedConfigKeys;
        update.configSnapshot = rendered.value().snapshot;
        if (auto d = deleteIgnoringMissing(entry.processHandle); !d) {
            return d.error();
        }
        auto updated = registry_.updateServer(entry.id, update);
        if (!updated) {
            return updated.error();
        }
        if (auto s = startProcess(updated.value()); !s) {
            return s.error();
        }
        spdlog::info("Restarted {} ({})", entry.name,
                     envChanged ? "environment changed" : "command changed");
        result.action = StartAction::Restarted;
        result.entry = updated.value();
        result.envChanged = envChanged;
        result.commandChanged = commandChanged;
        result.status = ServerStatus::Online;
        return result;
    }

    if (auto r = backend_.restart(entry.processHandle); !r) {
        spdlog::debug("Restart of {} failed ({}), starting fresh", entry.processHandle,
                      r.error().message);
        if (auto s = startProcess(entry); !s) {
            return s.error();
        }
    }
    result.action = StartAction::Restarted;
    result.status = ServerStatus::Online;
    return result;
}

Result<StartResult> ServerService::startNew(const StartOptions& opts, const std::string& name) {
    auto assigned = assignPort(opts.cwd, opts.command, opts.port);
    if (!assigned) {
        return assigned.error();
    }
    const auto& assignment = assigned.value();

    registry::NewServer fields;
    fields.name = name;
    fields.command = opts.command;
    fields.cwd = opts.cwd;
    fields.port = assignment.port;
    fields.protocol = opts.protocol.value_or(config_.protocol);
    fields.hostname = config_.hostname;
    fields.tags = opts.tags;
    fields.description = opts.description;

    auto rendered = render(opts.command, opts.env, fields.port, fields.protocol, fields.hostname,
                           opts.cwd);
    if (!rendered) {
        return rendered.error();
    }
    fields.resolvedCommand = rendered.value().resolvedCommand;
    fields.env = rendered.value().env.value_or(EnvMap{});
    fields.usedConfigKeys = rendered.value().usedConfigKeys;
    fields.configSnapshot = rendered.value().snapshot;

    auto added = registry_.addServer(fields);
    if (!added) {
        return added.error();
    }
    if (auto s = startProcess(added.value()); !s) {
        spdlog::warn("{} is registered but failed to start: {}", name, s.error().message);
        return s.error();
    }
    spdlog::info("Started {} on port {}", name, assignment.port);

    StartResult result;
    result.action = StartAction::Started;
    result.entry = added.value();
    result.status = ServerStatus::Online;
    result.portReassigned = assignment.reassigned;
    if (assignment.reassigned) {
        result.originalPort = assignment.requestedPort;
    }
    return result;
}

Result<StartResult> ServerService::refreshOnStart(const ServerEntry& entry,
                                                  const StartOptions& opts,
                                                  const drift::DriftResult& driftState,
                                                  bool commandChanged) {
    const std::string command = commandChanged ? opts.command : entry.command;
    const std::optional<EnvMap> env = opts.env ? opts.env : std::optional<EnvMap>{entry.env};
    const Protocol protocol = opts.protocol.value_or(config_.protocol);

    std::optional<int> reassignedFrom;
    auto updated = rerender(entry, command, env, protocol, driftState, &reassignedFrom);
    if (!updated) {
        return updated.error();
    }
    spdlog::info("Refreshed {} after config drift", entry.name);

    StartResult result;
    result.action = StartAction::Refreshed;
    result.entry = updated.value();
    result.status = ServerStatus::Online;
    result.configDrift = true;
    result.driftDetails = drift::driftDetails(driftState);
    result.commandChanged = commandChanged;
    result.envChanged = opts.env.has_value() && common::hasEnvChanged(entry.env,
                                                                      updated.value().env);
    result.portReassigned = reassignedFrom.has_value();
    result.originalPort = reassignedFrom;
    return result;
}

Result<std::vector<ServerEntry>> ServerService::select(const Selector& selector,
                                                       bool allowEmpty) const {
    const int count = selectorCount(selector);
    if (count > 1) {
        return Error{ErrorCode::InvalidArgument,
                     "Specify only one of a server name, --all, or --tag"};
    }
    if (count == 0) {
        if (allowEmpty) {
            return registry_.servers();
        }
        return Error{ErrorCode::InvalidArgument, "Provide a server name, --all, or --tag"};
    }
    if (selector.name) {
        auto entry = registry_.findByName(*selector.name);
        if (!entry) {
            return Error{ErrorCode::ServerNotFound,
                         fmt::format("Server \"{}\" not found in registry", *selector.name)};
        }
        return std::vector<ServerEntry>{*entry};
    }
    if (selector.tag) {
        registry::ServerFilter filter;
        filter.tag = selector.tag;
        return registry_.list(filter);
    }
    return registry_.servers();
}

Result<std::vector<BatchResult>> ServerService::stop(const Selector& selector, bool force) {
    auto targets = select(selector);
    if (!targets) {
        if (selector.name && targets.error().code == ErrorCode::ServerNotFound) {
            return std::vector<BatchResult>{failure(*selector.name, targets.error())};
        }
        return targets.error();
    }

    std::vector<BatchResult> results;
    for (const auto& entry : targets.value()) {
        auto r = force ? backend_.remove(entry.processHandle) : backend_.stop(entry.processHandle);
        if (!r) {
            spdlog::warn("Stopping {} failed: {}", entry.name, r.error().message);
            results.push_back(failure(entry.name, r.error()));
            continue;
        }
        BatchResult ok;
        ok.name = entry.name;
        ok.success = true;
        ok.status = ServerStatus::Stopped;
        results.push_back(std::move(ok));
    }
    return results;
}

Result<std::vector<BatchResult>> ServerService::restart(const Selector& selector) {
    auto targets = select(selector);
    if (!targets) {
        return targets.error();
    }

    const bool refreshDrift = config_.refreshOnChange == RefreshOnChange::OnStart ||
                              config_.refreshOnChange == RefreshOnChange::Auto;
    std::vector<BatchResult> results;
    for (const auto& entry : targets.value()) {
        BatchResult r;
        r.name = entry.name;

        auto driftState = drift::detectDrift(entry, config_);
        if (driftState.hasDrift && refreshDrift) {
            std::optional<int> from;
            auto updated =
                rerender(entry, entry.command, entry.env, config_.protocol, driftState, &from);
            if (!updated) {
                results.push_back(failure(entry.name, updated.error()));
                continue;
            }
            r.configRefreshed = true;
            r.driftDetails = drift::formatDrift(driftState);
            r.portReassigned = from.has_value();
            r.originalPort = from;
            if (from) {
                r.newPort = updated.value().port;
            }
        } else if (auto restarted = backend_.restart(entry.processHandle); !restarted) {
            if (restarted.error().code != ErrorCode::ProcessNotFound) {
                results.push_back(failure(entry.name, restarted.error()));
                continue;
            }
            if (auto s = startProcess(entry); !s) {
                results.push_back(failure(entry.name, s.error()));
                continue;
            }
        }

        r.success = true;
        r.status =
            process::getStatus(backend_, entry.processHandle).value_or(ServerStatus::Unknown);
        results.push_back(std::move(r));
    }
    return results;
}

Result<std::vector<BatchResult>> ServerService::remove(const Selector& selector, bool force) {
    if (options_.ciMode && !force) {
        return Error{ErrorCode::InvalidState,
                     "Remove requires --force flag in CI mode to prevent hanging on "
                     "confirmation prompt"};
    }
    auto targets = select(selector);
    if (!targets) {
        return targets.error();
    }
    const auto& entries = targets.value();

    std::vector<BatchResult> results;
    if (!force && !entries.empty()) {
        std::string question;
        if (entries.size() == 1) {
            question = fmt::format("Are you sure you want to remove server \"{}\"?",
                                   entries.front().name);
        } else {
            std::vector<std::string> names;
            for (const auto& e : entries) {
                names.push_back(e.name);
            }
            question = fmt::format("Are you sure you want to remove {} servers ({})?",
                                   entries.size(), fmt::join(names, ", "));
        }
        if (!confirm(question)) {
            for (const auto& e : entries) {
                BatchResult r;
                r.name = e.name;
                r.cancelled = true;
                r.message = "Cancelled by user";
                results.push_back(std::move(r));
            }
            return results;
        }
    }

    for (const auto& entry : entries) {
        if (auto d = deleteIgnoringMissing(entry.processHandle); !d) {
            results.push_back(failure(entry.name, d.error()));
            continue;
        }
        if (auto rm = registry_.removeServer(entry.id); !rm) {
            results.push_back(failure(entry.name, rm.error()));
            continue;
        }
        spdlog::info("Removed {}", entry.name);
        BatchResult r;
        r.name = entry.name;
        r.success = true;
        results.push_back(std::move(r));
    }
    return results;
}

BatchResult ServerService::refreshOne(const ServerEntry& entry,
                                      const drift::DriftResult& driftState, bool dryRun) {
    BatchResult r;
    r.name = entry.name;
    r.driftDetails = drift::formatDrift(driftState);

    if (dryRun) {
        r.success = true;
        r.skipped = true;
        r.message = "Would refresh (dry-run mode)";
        if (driftState.portOutOfRange) {
            port::PortAllocator allocator(config_, options_.probe);
            auto assigned = allocator.assign(entry.cwd, entry.command);
            if (assigned) {
                r.portReassigned = true;
                r.originalPort = entry.port;
                r.newPort = assigned.value().port;
                r.message = fmt::format("Would refresh and reassign port {} → {} (dry-run mode)",
                                        entry.port, assigned.value().port);
            }
        }
        return r;
    }

    std::optional<int> from;
    auto updated = rerender(entry, entry.command, entry.env, config_.protocol, driftState, &from);
    if (!updated) {
        spdlog::warn("Refreshing {} failed: {}", entry.name, updated.error().message);
        r.message = updated.error().message;
        return r;
    }
    r.success = true;
    r.configRefreshed = true;
    r.status = process::getStatus(backend_, entry.processHandle).value_or(ServerStatus::Online);
    if (from) {
        r.portReassigned = true;
        r.originalPort = from;
        r.newPort = updated.value().port;
    }
    return r;
}

Result<std::vector<BatchResult>> ServerService::refresh(const Selector& selector, bool dryRun) {
    auto targets = select(selector, true);
    if (!targets) {
        return targets.error();
    }

    auto drifted = drift::findServersWithDrift(targets.value(), config_);
    std::vector<BatchResult> results;
    if (drifted.empty()) {
        BatchResult none;
        none.success = true;
        none.skipped = true;
        none.message = "No servers have config drift";
        results.push_back(std::move(none));
        return results;
    }
    for (const auto& [server, driftState] : drifted) {
        results.push_back(refreshOne(server, driftState, dryRun));
    }
    return results;
}

Result<InfoResult> ServerService::info(const std::string& name) {
    auto entry = registry_.findByName(name);
    if (!entry) {
        return Error{ErrorCode::ServerNotFound,
                     fmt::format("Server \"{}\" not found in registry", name)};
    }
    auto described = backend_.describe(entry->processHandle);
    if (!described) {
        return described.error();
    }

    InfoResult result;
    result.entry = *entry;
    result.process = described.value();
    result.status = result.process ? result.process->status : ServerStatus::Unknown;
    result.hasDrift = drift::detectDrift(*entry, config_).hasDrift;
    return result;
}

Result<std::vector<ListItem>> ServerService::list(const ListOptions& opts) {
    if (opts.running && opts.stopped) {
        return Error{ErrorCode::InvalidArgument, "Cannot use --running and --stopped together"};
    }

    std::vector<ListItem> items;
    for (const auto& entry : registry_.list(opts.filter)) {
        auto status = process::getStatus(backend_, entry.processHandle);
        if (!status) {
            return status.error();
        }
        if (opts.running && status.value() != ServerStatus::Online) {
            continue;
        }
        if (opts.stopped && status.value() == ServerStatus::Online) {
            continue;
        }
        ListItem item;
        item.entry = entry;
        item.status = status.value();
        item.hasDrift = drift::detectDrift(entry, config_).hasDrift;
        items.push_back(std::move(item));
    }
    return items;
}

Result<LogsResult> ServerService::logs(const LogsOptions& opts) {
    auto entry = registry_.findByName(opts.name);
    if (!entry) {
        return Error{ErrorCode::ServerNotFound,
                     fmt::format("Server \"{}\" not found in registry", opts.name)};
    }

    std::optional<std::chrono::system_clock::time_point> since;
    if (opts.since) {
        auto parsed = common::TimeParser::parse(*opts.since);
        if (!parsed) {
            return parsed.error();
        }
        since = parsed.value();
    }

    LogsResult result;
    result.name = entry->name;
    result.requested = opts.head.value_or(opts.lines);

    auto described = backend_.describe(entry->processHandle);
    if (!described) {
        return described.error();
    }
    if (!described.value()) {
        result.notice = "(process not found)";
        return result;
    }
    const auto& desc = *described.value();
    result.status = desc.status;
    result.outLogPath = desc.outLogPath;
    result.errLogPath = desc.errLogPath;

    const auto& path = opts.error ? desc.errLogPath : desc.outLogPath;
    if (!path) {
        result.notice = "(no log path available)";
        return result;
    }
    std::error_code ec;
    if (!std::filesystem::exists(*path, ec)) {
        result.notice = "(log file does not exist)";
        return result;
    }

    auto lines = readLogLines(*path);
    if (!lines) {
        return lines.error();
    }
    auto selected = std::move(lines).value();
    if (since) {
        selected = filterLogsByTime(selected, *since);
    }
    result.lines = selectLines(selected, opts.head, opts.lines);
    return result;
}

Result<std::string> ServerService::flush(const std::optional<std::string>& name) {
    if (!name) {
        if (auto r = backend_.flushAll(); !r) {
            return r.error();
        }
        return std::string("Logs flushed for all servers");
    }
    auto entry = registry_.findByName(*name);
    if (!entry) {
        return Error{ErrorCode::ServerNotFound,
                     fmt::format("Server \"{}\" not found in registry", *name)};
    }
    if (auto r = backend_.flush(entry->processHandle); !r) {
        return r.error();
    }
    return fmt::format("Logs flushed for server \"{}\"", *name);
}

ConfigRefreshOutcome ServerService::handleConfigChange(const std::string& changedKey) {
    ConfigRefreshOutcome outcome;
    auto affected = drift::findServersUsingConfigKey(registry_.servers(), changedKey);
    if (affected.empty()) {
        return outcome;
    }

    const auto pending = fmt::format(
        "{} server(s) use this config value. Run \"servherd refresh\" to apply changes.",
        affected.size());

    bool apply = false;
    switch (config_.refreshOnChange) {
        case RefreshOnChange::Auto:
            apply = true;
            break;
        case RefreshOnChange::Prompt:
            apply = !options_.ciMode &&
                    confirm(fmt::format("{} server(s) use \"{}\". Refresh them now?",
                                        affected.size(), changedKey));
            break;
        case RefreshOnChange::Manual:
        case RefreshOnChange::OnStart:
            break;
    }
    if (!apply) {
        outcome.message = pending;
        return outcome;
    }

    std::vector<std::string> refreshed;
    for (const auto& entry : affected) {
        auto driftState = drift::detectDrift(entry, config_);
        if (!driftState.hasDrift) {
            continue;
        }
        auto r = refreshOne(entry, driftState, false);
        if (r.success) {
            refreshed.push_back(r.name);
        }
        outcome.results.push_back(std::move(r));
    }
    outcome.refreshed = !refreshed.empty();
    outcome.message = fmt::format("Refreshed {} server(s): {}", refreshed.size(),
                                  fmt::join(refreshed, ", "));
    return outcome;
}

} // namespace servherd::app

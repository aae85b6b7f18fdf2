#pragma once

#include <sre_gateway/config/app_config.hpp>
#include <sre_gateway/core/result.hpp>
#include <sre_gateway/exec/i_process_spawner.hpp>
#include <sre_gateway/exec/process_runner.hpp>
#include <sre_gateway/mcp/mcp_dispatcher.hpp>
#include <sre_gateway/mcp/tool_registry.hpp>
#include <sre_gateway/tools/cli_catalog.hpp>
#include <sre_gateway/tools/cli_runner.hpp>
#include <sre_gateway/tools/tool_settings.hpp>

#include <functional>
#include <memory>
#include <mutex>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// GatewayState — everything derived from one AppConfig. Immutable; a
// reload builds a new one and publishes it atomically.
// ---------------------------------------------------------------------------
struct GatewayState {
    AppConfig config;
    ToolSettings settings;
    std::shared_ptr<const CliCatalog> catalog;
    std::shared_ptr<const CliToolRunner> cli;

    static std::shared_ptr<const GatewayState> Build(const AppConfig& config);
};

// ---------------------------------------------------------------------------
// Gateway — shared core behind both transports: one process runner, the
// tool registry, the protocol dispatcher and the reloadable state.
//
// Runner options (dry-run, admission limit, base environment) are fixed at
// start-up; a reload replaces tool settings, the CLI catalog and the
// registry.
// ---------------------------------------------------------------------------
class Gateway {
public:
    using ConfigSource = std::function<Result<AppConfig, Error>()>;

    Gateway(const AppConfig& config, std::unique_ptr<IProcessSpawner> spawner,
            ConfigSource reload_source = {});

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    [[nodiscard]] ProcessRunner& Runner() noexcept { return runner_; }
    [[nodiscard]] McpDispatcher& Dispatcher() noexcept { return dispatcher_; }
    [[nodiscard]] std::shared_ptr<SharedToolRegistry> Registry() const noexcept {
        return registry_;
    }

    [[nodiscard]] std::shared_ptr<const GatewayState> State() const;

    /// Re-reads configuration from the reload source and swaps state and
    /// registry. On error nothing changes. Concurrent reloads are serialized.
    Result<void, Error> Reload();

    /// Publishes state and registry derived from `config`.
    void Apply(const AppConfig& config);

private:
    void Publish(const AppConfig& config);

    std::mutex reload_mutex_;
    ProcessRunner runner_;
    std::shared_ptr<SharedToolRegistry> registry_;
    std::shared_ptr<const GatewayState> state_;
    McpDispatcher dispatcher_;
    ConfigSource reload_source_;
};

} // namespace sre_gateway

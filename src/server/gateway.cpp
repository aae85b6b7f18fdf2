#include <sre_gateway/server/gateway.hpp>

#include <sre_gateway/config/config_loader.hpp>
#include <sre_gateway/core/log.hpp>
#include <sre_gateway/tools/sre_tools.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <mutex>

namespace sre_gateway {

std::shared_ptr<const GatewayState> GatewayState::Build(const AppConfig& config) {
    auto state = std::make_shared<GatewayState>();
    state->config = config;
    state->settings = ToolSettings::FromConfig(config);
    state->catalog = std::make_shared<const CliCatalog>(config.tools);
    state->cli = std::make_shared<const CliToolRunner>(state->settings, state->catalog);
    return state;
}

Gateway::Gateway(const AppConfig& config, std::unique_ptr<IProcessSpawner> spawner,
                 ConfigSource reload_source)
    : runner_(std::move(spawner), RunnerOptions::FromConfig(config)),
      registry_(std::make_shared<SharedToolRegistry>(std::make_shared<const ToolRegistry>())),
      state_(GatewayState::Build(config)),
      dispatcher_(registry_, runner_,
                  [this] { return RedactedConfigJson(State()->config); }),
      reload_source_(std::move(reload_source)) {
    registry_->Reload(BuildSreRegistry(state_->settings, state_->catalog));
}

std::shared_ptr<const GatewayState> Gateway::State() const {
    return std::atomic_load(&state_);
}

void Gateway::Apply(const AppConfig& config) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    Publish(config);
}

// Caller holds reload_mutex_, so state and registry always come from the
// same configuration.
void Gateway::Publish(const AppConfig& config) {
    auto state = GatewayState::Build(config);
    registry_->Reload(BuildSreRegistry(state->settings, state->catalog));
    std::atomic_store(&state_, std::move(state));
}

Result<void, Error> Gateway::Reload() {
    if (!reload_source_) {
        return Result<void, Error>::Err(Error{"Gateway", "no configuration source to reload from",
                                              std::nullopt, ErrorCategory::Unsupported});
    }
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto config = reload_source_();
    if (config.IsErr()) {
        LogWarn("gateway", "reload failed: " + config.Error().ToString());
        return Result<void, Error>::Err(config.Error());
    }
    Publish(config.Value());
    LogInfo("gateway", "configuration reloaded; " +
                           std::to_string(State()->catalog->ActiveNames().size()) +
                           " CLI tools active");
    return Result<void, Error>::Ok();
}

} // namespace sre_gateway

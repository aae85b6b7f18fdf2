#include <sre_gateway/config/config_loader.hpp>
#include <sre_gateway/core/log.hpp>
#include <sre_gateway/core/terminal.hpp>
#include <sre_gateway/core/version.hpp>
#include <sre_gateway/exec/posix_process_spawner.hpp>
#include <sre_gateway/server/gateway.hpp>
#include <sre_gateway/server/http_api.hpp>
#include <sre_gateway/server/ws_server.hpp>

#include <httplib.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

extern char** environ;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 2;
constexpr int kExitBind    = 3;
constexpr int kExitSignal  = 4;

void PrintError(const sre_gateway::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

std::unique_ptr<sre_gateway::ILogSink> MakeLogSink(const sre_gateway::LoggingConfig& logging) {
    using namespace sre_gateway;
    std::unique_ptr<ILogSink> console;
    if (logging.json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        bool use_color = !NoColorEnvSet() && IsStderrTty();
        console = std::make_unique<ColorConsoleSink>(use_color);
    }
    if (!logging.file.has_value()) {
        return console;
    }
    return std::make_unique<TeeSink>(
        std::move(console), std::make_unique<FileSink>(*logging.file, logging.json));
}

sre_gateway::LogLevel EffectiveLogLevel(const sre_gateway::LoggingConfig& logging) {
    using sre_gateway::LogLevel;
    if (logging.verbose) {
        return LogLevel::Debug;
    }
    if (logging.quiet) {
        return LogLevel::Error;
    }
    return sre_gateway::ParseLogLevel(logging.level).value_or(LogLevel::Info);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace sre_gateway;

    // Step 1: CLI flags (argparse handles --help and --version itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return kExitConfig;
    }
    const auto cli = std::move(cli_result).Value();

    // Step 2: defaults -> YAML -> environment -> CLI.
    const auto env = CaptureEnvironment(environ);
    auto config_result = LoadAppConfig(cli, env);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return kExitConfig;
    }
    const auto config = std::move(config_result).Value();

    // Step 3: logging.
    InitGlobalLogger(MakeLogSink(config.logging), EffectiveLogLevel(config.logging));
    LogInfo("main", std::string("Starting ") + kServerName + " " + kVersion);
    if (config.config_file.has_value()) {
        LogInfo("main", "Configuration loaded from " + *config.config_file);
    }
    if (config.execution.dry_run) {
        LogWarn("main", "Dry-run mode: commands are reported, not executed");
    }

    // SIGINT/SIGTERM are taken by sigwait below. Blocked before any thread
    // starts so every thread inherits the mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    // Step 4: gateway core. A reload re-runs the same pipeline.
    Gateway gateway(config, std::make_unique<PosixProcessSpawner>(),
                    [cli, env]() { return LoadAppConfig(cli, env); });

    // Step 5: HTTP.
    httplib::Server http;
    HttpApi api(gateway);
    api.Mount(http);
    if (!http.bind_to_port(config.server.host, config.server.port)) {
        LogError("main", "Cannot bind HTTP server to " + config.server.host + ":" +
                             std::to_string(config.server.port));
        return kExitBind;
    }
    std::thread http_thread([&http]() { http.listen_after_bind(); });
    LogInfo("main", "HTTP server listening on " + config.server.host + ":" +
                        std::to_string(config.server.port));

    // Step 6: WebSocket.
    WebSocketServer ws(gateway, config.websocket);
    auto started = ws.Start(config.server.host, config.server.ws_port);
    if (started.IsErr()) {
        LogError("main", started.Error().ToString());
        http.stop();
        http_thread.join();
        return kExitBind;
    }
    LogInfo("main", "WebSocket server listening on ws://" + config.server.host + ":" +
                        std::to_string(ws.Port()) + "/mcp");

    // Step 7: wait for a stop signal, then shut down both transports.
    int signal_number = 0;
    if (sigwait(&stop_signals, &signal_number) != 0) {
        LogError("main", "sigwait failed");
        signal_number = 0;
    }
    LogInfo("main", "Received signal " + std::to_string(signal_number) + ", shutting down");

    ws.Stop();
    http.stop();
    http_thread.join();
    LogInfo("main", "Stopped");

    return signal_number == 0 ? kExitSignal : kExitSuccess;
}

#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include "src/server/config.h"
#include "src/server/harness.h"
#include "src/server/isolation.h"
#include "src/server/lifecycle_registry.h"
#include "src/server/logger.h"
#include "src/server/reaper.h"
#include "src/server/sandbox.h"
#include "src/server/service.h"
#include "src/server/suite_runner.h"

using grpc::Server;
using grpc::ServerBuilder;
using evalbox::CodeEvaluatorServiceImpl;
using evalbox::EngineConfig;
using evalbox::HarnessGenerator;
using evalbox::IsolationClient;
using evalbox::LifecycleRegistry;
using evalbox::Logger;
using evalbox::Reaper;
using evalbox::Sandbox;
using evalbox::SuiteRunner;

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>]\n"
              << "  --config <path>  EngineConfig in protobuf text format\n";
}

int RunServer(const EngineConfig& config, sigset_t* shutdown_signals) {
    IsolationClient client(evalbox::MakeBackend(config));
    client.Connect();

    LifecycleRegistry registry;
    Reaper reaper(registry, client, std::chrono::seconds(config.reaper_interval_seconds()));
    reaper.Start();

    Sandbox sandbox(client, registry, evalbox::MakeSandboxOptions(config));
    SuiteRunner runner(sandbox, HarnessGenerator(config.entry_point()));
    CodeEvaluatorServiceImpl service(sandbox, runner, static_cast<int>(config.max_concurrent_executions()),
                                     std::chrono::seconds(config.sandbox_ttl_seconds()));

    ServerBuilder builder;
    builder.AddListeningPort(config.listen_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        Logger::Error("Failed to listen on ", config.listen_address());
        reaper.Stop();
        return 1;
    }
    Logger::Info("Server listening on ", config.listen_address(), " using the ", client.BackendName(), " backend");

    std::thread signal_thread([&server, shutdown_signals]() {
        int signal_number = 0;
        sigwait(shutdown_signals, &signal_number);
        Logger::Info("Received signal ", signal_number, ", shutting down");
        server->Shutdown();
    });

    server->Wait();
    signal_thread.join();

    // Stops the sweep and destroys whatever is still registered.
    reaper.Stop();
    Logger::Info("Shutdown complete");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(std::string("--config=").size());
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            Logger::Error("Unknown argument: ", arg);
            PrintUsage(argv[0]);
            return 2;
        }
    }

    EngineConfig config = evalbox::DefaultConfig();
    if (!config_path.empty()) {
        std::string error;
        if (!evalbox::LoadConfig(config_path, &config, &error)) {
            Logger::Error("Invalid config: ", error);
            return 1;
        }
        Logger::Info("Loaded config from ", config_path);
    }
    Logger::SetLevel(evalbox::ToLogLevel(config.log_level()));

    // Blocked before any thread exists so only the signal thread receives them.
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    return RunServer(config, &shutdown_signals);
}

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <rpcmesh/rpcmesh.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace
{

constexpr int kExitConfigError = 1;
constexpr int kExitCallFailed = 2;

std::atomic<bool> g_terminate{false};

struct CliOptions
{
  std::string configFile = RPCMESH_DEFAULT_CONFIG_FILE_PATH;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  bool status = false;
  bool daemon = false;
  std::optional<std::uint32_t> runSeconds;
  std::optional<std::string> callChain;
  std::string callMethod;
  rpcmesh::core::Json callParams = rpcmesh::core::Json::array();
  rpcmesh::rpc::Urgency urgency = rpcmesh::rpc::Urgency::Medium;
  std::optional<std::string> streamChain;
  std::optional<rpcmesh::core::Json> subscribeParams;
};

/// \brief Print help message
void printHelp()
{
  std::cout
      << "RpcMesh Options:\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              Configuration file path\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, "
         "warning, error, fatal)\n"
      << "  -f, --log-file <file>            Log file path\n"
      << "      --call <chain> <method> [<params-json>]\n"
      << "                                   Issue one call and print the response\n"
      << "      --urgency <level>            Urgency for --call (low, medium, high, "
         "critical)\n"
      << "      --stream <chain> [<params-json>]\n"
      << "                                   Open the chain's stream and print each message;\n"
      << "                                   params are sent with eth_subscribe\n"
      << "      --status                     Print metrics and provider status as JSON\n"
      << "      --run                        Run the background loops until SIGINT\n"
      << "      --run-seconds <n>            Run the background loops for n seconds\n";
}

/// \brief Parse command-line arguments
CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      options.logFile = argv[++i];
    }
    else if (arg == "--call" && i + 2 < argc)
    {
      options.callChain = argv[++i];
      options.callMethod = argv[++i];
      if (i + 1 < argc && argv[i + 1][0] != '-')
      {
        try
        {
          options.callParams = rpcmesh::core::Json::parse(argv[++i]);
        }
        catch (const std::exception &e)
        {
          throw std::runtime_error("Invalid params JSON: " + std::string(e.what()));
        }
      }
    }
    else if (arg == "--urgency" && i + 1 < argc)
    {
      auto urgency = rpcmesh::rpc::urgencyFromString(argv[++i]);
      if (!urgency)
      {
        throw std::runtime_error("Invalid urgency: " + std::string(argv[i]));
      }
      options.urgency = *urgency;
    }
    else if (arg == "--stream" && i + 1 < argc)
    {
      options.streamChain = argv[++i];
      if (i + 1 < argc && argv[i + 1][0] != '-')
      {
        try
        {
          options.subscribeParams = rpcmesh::core::Json::parse(argv[++i]);
        }
        catch (const std::exception &e)
        {
          throw std::runtime_error("Invalid subscription params JSON: " + std::string(e.what()));
        }
      }
      options.daemon = true;
    }
    else if (arg == "--status")
    {
      options.status = true;
    }
    else if (arg == "--run")
    {
      options.daemon = true;
    }
    else if (arg == "--run-seconds" && i + 1 < argc)
    {
      try
      {
        options.runSeconds = static_cast<std::uint32_t>(std::stoul(argv[++i]));
      }
      catch (const std::exception &)
      {
        throw std::runtime_error("Invalid run seconds: " + std::string(argv[i]));
      }
      options.daemon = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
  return options;
}

void waitForTermination(const CliOptions &options)
{
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(options.runSeconds.value_or(0));
  while (!g_terminate.load())
  {
    if (options.runSeconds && std::chrono::steady_clock::now() >= deadline)
    {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
}

} // namespace

int main(int argc, char **argv)
{
  CliOptions options;
  rpcmesh::OrchestratorConfig config;
  try
  {
    options = parseCliArgs(argc, argv);
    config = rpcmesh::loadConfigFile(options.configFile);
    if (options.logLevel)
    {
      auto level = rpcmesh::core::Logger::levelFromString(*options.logLevel);
      if (!level)
      {
        throw rpcmesh::rpc::ConfigError("Invalid log level: " + *options.logLevel);
      }
      config.log.level = *level;
    }
    if (options.logFile)
    {
      config.log.file = *options.logFile;
    }
    rpcmesh::applyLogging(config.log);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error loading configuration: " << ex.what() << std::endl;
    return kExitConfigError;
  }

  int exitCode = EXIT_SUCCESS;
  try
  {
    rpcmesh::Orchestrator mesh(std::move(config));
    mesh.start();

    std::signal(SIGINT, [](int) { g_terminate.store(true); });
    std::signal(SIGTERM, [](int) { g_terminate.store(true); });

    if (options.callChain)
    {
      try
      {
        auto response =
            mesh.call(*options.callChain, options.callMethod, options.callParams, options.urgency);
        rpcmesh::core::Json out = {{"provider", response.providerId},
                                   {"attempts", response.attempts},
                                   {"latencyMs", rpcmesh::core::toMillis(response.latency)},
                                   {"fromCache", response.fromCache},
                                   {"result", response.result}};
        std::cout << out.dump(2) << std::endl;
      }
      catch (const rpcmesh::rpc::RpcError &e)
      {
        std::cerr << "Call failed: " << e.what() << std::endl;
        exitCode = kExitCallFailed;
      }
    }

    if (options.streamChain)
    {
      mesh.setStreamHandler([](const rpcmesh::rpc::StreamMessage &message) {
        std::cout << rpcmesh::core::Json{{"chain", message.chain},
                                         {"provider", message.providerId},
                                         {"message", message.message}}
                         .dump()
                  << std::endl;
      });
      bool connected = mesh.openStream(*options.streamChain);
      if (!mesh.streams().status(*options.streamChain))
      {
        std::cerr << "No provider with a WebSocket endpoint for " << *options.streamChain
                  << std::endl;
        exitCode = kExitCallFailed;
        options.daemon = false;
      }
      else
      {
        if (!connected)
        {
          std::cerr << "Stream for " << *options.streamChain
                    << " not connected yet; retrying in the background" << std::endl;
        }
        if (options.subscribeParams)
        {
          mesh.subscribe(*options.streamChain, "eth_subscribe", *options.subscribeParams);
        }
      }
    }

    if (options.daemon)
    {
      waitForTermination(options);
    }

    if (options.status)
    {
      rpcmesh::core::Json status = {{"metrics", rpcmesh::metricsToJson(mesh.getMetrics())},
                                    {"providers", rpcmesh::providerStatusToJson(
                                                      mesh.getProviderStatus())}};
      std::cout << status.dump(2) << std::endl;
    }

    mesh.drain(5000);
    mesh.stop();
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error running RpcMesh: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
  return exitCode;
}

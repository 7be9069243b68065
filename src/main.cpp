// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/network_client.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream> // CLI output and errors before the logger is up
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <action>\n"
      << "\n"
      << "Network:\n"
      << "  --network=<name>     Network preset: mainnet, devnet, testnet, unitnet\n"
      << "                       Default: devnet\n"
      << "  --peer=<host>        Always use this peer (skips discovery and probing)\n"
      << "  --peerport=<port>    API port of --peer (default: preset API port)\n"
      << "  --maxlatency=<ms>    Ignore discovered peers slower than this (default: 300)\n"
      << "\n"
      << "Actions:\n"
      << "  --get=<path>         GET /api/<path> and print the JSON response\n"
      << "  --query=<key=value>  Query parameter for --get (repeatable)\n"
      << "  --post=<path>        POST /api/<path>\n"
      << "  --body=<json>        Request body for --post (default: {})\n"
      << "  --height             Print the current chain height\n"
      << "  --watch              Follow milestones until AIP11 activates or Ctrl-C\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, config, app, all\n"
      << "                       Can be comma-separated: --debug=network,config\n"
      << "  --logfile=<path>     Write logs to a rotating file instead of stdout\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

enum class Action { None, Get, Post, Height, Watch };

struct CliConfig {
  courier::network::NetworkOptions options;
  Action action{Action::None};
  std::string path;
  nlohmann::json query = nlohmann::json::object();
  nlohmann::json body = nlohmann::json::object();
};

void print_result(const courier::network::DispatchResult &result) {
  if (result.ok()) {
    std::cout << result.data->dump(2) << std::endl;
    return;
  }
  LOG_APP_ERROR("Request failed after {} attempt(s): {} ({})", result.attempts,
                courier::network::DispatchErrorName(result.last_cause), result.message);
  std::cerr << "Request failed after " << result.attempts << " attempt(s): "
            << courier::network::DispatchErrorName(result.last_cause) << " ("
            << result.message << ")" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    CliConfig cli;
    std::string log_level = "warn";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << courier::GetFullVersionString() << std::endl;
        std::cout << courier::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--network=") == 0) {
        cli.options.network = arg.substr(10);
      } else if (arg.find("--peer=") == 0) {
        cli.options.peer = arg.substr(7);
      } else if (arg.find("--peerport=") == 0) {
        auto port_opt = courier::util::SafeParsePort(arg.substr(11));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(11) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        cli.options.peer_port = *port_opt;
      } else if (arg.find("--maxlatency=") == 0) {
        auto latency_opt = courier::util::SafeParseInt(arg.substr(13), 1, 60000);
        if (!latency_opt) {
          std::cerr << "Error: Invalid max latency: " << arg.substr(13) << std::endl;
          std::cerr << "Latency must be a number of milliseconds between 1 and 60000" << std::endl;
          return 1;
        }
        cli.options.max_latency_ms = *latency_opt;
      } else if (arg.find("--get=") == 0) {
        cli.action = Action::Get;
        cli.path = arg.substr(6);
      } else if (arg.find("--post=") == 0) {
        cli.action = Action::Post;
        cli.path = arg.substr(7);
      } else if (arg.find("--query=") == 0) {
        std::string kv = arg.substr(8);
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
          std::cerr << "Error: --query expects key=value, got: " << kv << std::endl;
          return 1;
        }
        cli.query[kv.substr(0, eq)] = kv.substr(eq + 1);
      } else if (arg.find("--body=") == 0) {
        try {
          cli.body = nlohmann::json::parse(arg.substr(7));
        } catch (const nlohmann::json::parse_error &e) {
          std::cerr << "Error: --body is not valid JSON: " << e.what() << std::endl;
          return 1;
        }
      } else if (arg == "--height") {
        cli.action = Action::Height;
      } else if (arg == "--watch") {
        cli.action = Action::Watch;
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=network,config
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (cli.action == Action::None) {
      std::cerr << "Error: no action given (--get, --post, --height or --watch)" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    courier::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
    for (const auto &component : debug_components) {
      if (component == "all") {
        courier::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        courier::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        courier::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // Nested scope: the client must be destroyed before the logger shuts down
    {
      boost::asio::io_context io_context;
      courier::network::NetworkClient client(io_context);

      boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
      signals.async_wait([&](const boost::system::error_code &ec, int signal) {
        if (ec) return;
        LOG_APP_INFO("Received signal {}, shutting down", signal);
        client.Shutdown();
        io_context.stop();
      });

      auto finish = [&](int code) {
        exit_code = code;
        client.Shutdown();
        io_context.stop();
      };

      if (cli.action == Action::Watch) {
        cli.options.watcher.on_feature_active = [&](int64_t) { finish(0); };
      }

      std::exception_ptr init_error;
      client.Init(cli.options, [&](std::exception_ptr error) {
        if (error) {
          init_error = error;
          io_context.stop();
          return;
        }

        switch (cli.action) {
        case Action::Get:
          client.SendGET(cli.path, [&](courier::network::DispatchResult result) {
            print_result(result);
            finish(result.ok() ? 0 : 1);
          }, cli.query);
          break;
        case Action::Post:
          client.SendPOST(cli.path, cli.body, [&](courier::network::DispatchResult result) {
            print_result(result);
            finish(result.ok() ? 0 : 1);
          });
          break;
        case Action::Height:
          client.GetHeight([&](std::optional<int64_t> height) {
            if (height) {
              std::cout << *height << std::endl;
              finish(0);
            } else {
              std::cerr << "Could not determine chain height" << std::endl;
              finish(1);
            }
          });
          break;
        case Action::Watch:
          // Runs until the watcher finishes by itself or a signal arrives
          break;
        case Action::None:
          break;
        }
      });

      io_context.run();

      if (init_error) {
        // Discovery failure aborts startup
        std::rethrow_exception(init_error);
      }

      if (cli.action == Action::Watch) {
        auto snapshot = client.config_manager().Snapshot();
        std::cout << "height " << snapshot.height << ", aip11 "
                  << (snapshot.milestone.aip11 ? "active" : "inactive") << std::endl;
      }
    }

    courier::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal error: " << e.what() << std::endl;
    courier::util::LogManager::Shutdown();
    return 1;
  }
}

#include "app/stream_runner.hpp"
#include "core/config.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

std::unique_ptr<tether::app::StreamRunner> g_runner;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_runner) {
            g_runner->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -u, --url <url>        WebSocket URL (ws:// or wss://)\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -s, --subscribe <ch>   Subscribe to a channel (repeatable)\n"
              << "  -l, --log-level <lvl>  trace, debug, info, warn, error\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  TETHER_URL                     WebSocket URL\n"
              << "  TETHER_SUBSCRIPTIONS           Comma separated channels\n"
              << "  TETHER_PING_INTERVAL_MS        Keepalive ping interval\n"
              << "  TETHER_PING_TIMEOUT_MS         Keepalive pong timeout\n"
              << "  TETHER_RECONNECT_DELAY_MS      Base reconnect delay\n"
              << "  TETHER_MAX_RECONNECT_ATTEMPTS  Retries before giving up\n"
              << "  TETHER_QUEUE_SIZE              Inbound queue capacity (0 = unbounded)\n"
              << "  TETHER_STATS_INTERVAL_MS       Stats output interval\n"
              << "  TETHER_LOG_LEVEL               Log level\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "tether v1.0.0\n"
              << "Resilient WebSocket stream client\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> url;
    std::optional<std::string> log_level;
    std::vector<std::string> subscriptions;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            args.url = argv[++i];
        } else if ((arg == "-s" || arg == "--subscribe") && i + 1 < argc) {
            args.subscriptions.emplace_back(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = tether::Config::load(args.config_path);

    if (args.url) {
        config.stream.url = *args.url;
    }
    if (!args.subscriptions.empty()) {
        config.stream.subscriptions = args.subscriptions;
    }
    if (args.log_level) {
        config.output.log_level = *args.log_level;
    }

    std::cout << "Configuration:\n"
              << "  URL: " << config.stream.url << "\n"
              << "  Subscriptions: " << config.stream.subscriptions.size() << "\n"
              << "  Auto-reconnect: " << (config.stream.auto_reconnect ? "on" : "off") << "\n"
              << "  Supervisor check: " << config.supervisor.check_interval.count() << "ms\n"
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        tether::app::StreamRunner::setup_logging(config.output.log_level);

        g_runner = std::make_unique<tether::app::StreamRunner>(config);
        g_runner->run();
        g_runner.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

/*
 * meshgate - presence-aware message gateway
 *
 * Nodes connect over WebSocket (or the HTTP long-poll bridge), register,
 * join named groups and exchange broadcast and direct messages.
 *
 * Usage:
 *   ./meshgate [options] [config.json]
 */

#include <meshgate/core/logger.hpp>
#include <meshgate/core/config.hpp>
#include <meshgate/core/json.hpp>
#include <meshgate/core/utils.hpp>
#include <meshgate/gateway/gateway_config.hpp>
#include <meshgate/gateway/server.hpp>
#include <meshgate/gateway/auth.hpp>
#include <meshgate/discovery/discovery.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <atomic>
#include <memory>
#include <curl/curl.h>

namespace meshgate {

// ============================================================================
// Application Configuration
// ============================================================================

static const char* APP_NAME = "meshgate";

static const int64_t DEFAULT_DISCOVER_TIMEOUT_MS = 3000;

static std::atomic<bool> g_running(true);

// Global signal handler
static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

static void print_usage(const char* prog) {
    std::cout << APP_NAME << " - presence-aware message gateway\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help                 Show this help message\n"
              << "  -v, --version              Show version\n"
              << "  --port N                   Listen port (default " << DEFAULT_GATEWAY_PORT << ")\n"
              << "  --host H                   Bind address (default 127.0.0.1)\n"
              << "  --require-auth             Require a token to register\n"
              << "  --token T                  Accept token T\n"
              << "  --max-nodes N              Registry capacity\n"
              << "  --log-level L              debug, info, warn, error or silent\n"
              << "  --discovery M              Announce via mdns or tailscale\n"
              << "  --name N                   Announced gateway name\n"
              << "  --generate-token           Print a new token and exit\n"
              << "  --discover M [--timeout ms]\n"
              << "                             Print gateways found via M as JSON and exit\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"gateway\": {\n"
              << "      \"port\": 18789,\n"
              << "      \"host\": \"127.0.0.1\",\n"
              << "      \"requireAuth\": true,\n"
              << "      \"authTokens\": [\"...\"],\n"
              << "      \"discovery\": { \"enabled\": true, \"method\": \"mdns\", \"name\": \"office\" }\n"
              << "    }\n"
              << "  }\n\n"
              << "The token may also be supplied through " << GATEWAY_TOKEN_ENV << ".\n";
}

static void print_version() {
    std::cout << APP_NAME << " v" << GATEWAY_VERSION << "\n";
}

static bool parse_number(const char* text, int64_t& out) {
    errno = 0;
    char* end = NULL;
    long long v = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

// ============================================================================
// Command Line
// ============================================================================

struct Options {
    const char* config_file;
    bool generate_token;
    std::string discover_method;
    int64_t discover_timeout_ms;
    Config overrides;

    Options()
        : config_file(NULL)
        , generate_token(false)
        , discover_timeout_ms(DEFAULT_DISCOVER_TIMEOUT_MS) {}
};

// 0 = continue, 1 = error, 2 = handled (help/version)
static int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 2;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            print_version();
            return 2;
        }
        if (strcmp(arg, "--require-auth") == 0) {
            opts.overrides.set("gateway.requireAuth", true);
            continue;
        }
        if (strcmp(arg, "--generate-token") == 0) {
            opts.generate_token = true;
            continue;
        }

        bool takes_value = strcmp(arg, "--port") == 0 || strcmp(arg, "--host") == 0 ||
                           strcmp(arg, "--token") == 0 || strcmp(arg, "--max-nodes") == 0 ||
                           strcmp(arg, "--log-level") == 0 || strcmp(arg, "--discovery") == 0 ||
                           strcmp(arg, "--name") == 0 || strcmp(arg, "--discover") == 0 ||
                           strcmp(arg, "--timeout") == 0;
        if (takes_value) {
            if (!has_value) {
                std::cerr << "Missing value for " << arg << "\n";
                return 1;
            }
            const char* value = argv[++i];
            int64_t n = 0;

            if (strcmp(arg, "--port") == 0 || strcmp(arg, "--max-nodes") == 0 ||
                strcmp(arg, "--timeout") == 0) {
                if (!parse_number(value, n)) {
                    std::cerr << "Invalid number for " << arg << ": " << value << "\n";
                    return 1;
                }
            }

            if (strcmp(arg, "--port") == 0) {
                opts.overrides.set("gateway.port", n);
            } else if (strcmp(arg, "--host") == 0) {
                opts.overrides.set("gateway.host", value);
            } else if (strcmp(arg, "--token") == 0) {
                opts.overrides.set("gateway.authToken", value);
            } else if (strcmp(arg, "--max-nodes") == 0) {
                opts.overrides.set("gateway.maxNodes", n);
            } else if (strcmp(arg, "--log-level") == 0) {
                opts.overrides.set("log_level", value);
            } else if (strcmp(arg, "--discovery") == 0) {
                opts.overrides.set("gateway.discovery.enabled", true);
                opts.overrides.set("gateway.discovery.method", value);
            } else if (strcmp(arg, "--name") == 0) {
                opts.overrides.set("gateway.discovery.name", value);
            } else if (strcmp(arg, "--discover") == 0) {
                opts.discover_method = value;
            } else {
                opts.discover_timeout_ms = n;
            }
            continue;
        }

        if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
        opts.config_file = arg;
    }
    return 0;
}

// Copy every leaf of `src` over `dst`
static void apply_overrides(const Json& src, const std::string& prefix, Config& dst) {
    for (Json::const_iterator it = src.begin(); it != src.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it.value().is_object()) {
            apply_overrides(it.value(), key, dst);
        } else {
            dst.set(key, it.value());
        }
    }
}

// ============================================================================
// Modes
// ============================================================================

static int run_discover(const std::string& method, int64_t timeout_ms) {
    DiscoveryOptions options;
    options.method = method;

    std::unique_ptr<DiscoveryService> service = create_discovery_service(options);
    if (!service) {
        return 1;
    }

    LOG_INFO("Looking for gateways via %s (%lld ms)...",
             service->method(), static_cast<long long>(timeout_ms));

    std::vector<DiscoveryRecord> found = service->discover(timeout_ms);

    Json out = Json::array();
    for (size_t i = 0; i < found.size(); ++i) {
        out.push_back(found[i].to_json());
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

static int run_gateway(const GatewayConfig& gw) {
    GatewayServer server(gw);
    if (!server.start()) {
        LOG_ERROR("Failed to start gateway");
        return 1;
    }

    LOG_INFO("Entering main loop");
    while (g_running) {
        sleep_ms(100);
    }

    LOG_INFO("Received shutdown signal");
    server.stop();
    return 0;
}

} // namespace meshgate

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    using namespace meshgate;

    Options opts;
    int parsed = parse_args(argc, argv, opts);
    if (parsed != 0) {
        return parsed == 2 ? 0 : 1;
    }

    if (opts.generate_token) {
        std::string token = AuthGuard::generate_token();
        if (token.empty()) {
            LOG_ERROR("Failed to generate a token: random source unavailable");
            return 1;
        }
        std::cout << token << std::endl;
        return 0;
    }

    Config config;
    if (opts.config_file) {
        if (!config.load_file(opts.config_file)) {
            LOG_ERROR("Failed to load config from %s", opts.config_file);
            return 1;
        }
        LOG_INFO("Loaded config from %s", opts.config_file);
    }
    apply_overrides(opts.overrides.data(), "", config);

    Logger::instance().set_level(parse_log_level(config.get_string("log_level", "info")));

    // Initialize libcurl globally (must be done before any threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    int result = 0;
    if (!opts.discover_method.empty()) {
        result = run_discover(opts.discover_method, opts.discover_timeout_ms);
    } else {
        GatewayConfig gw = GatewayConfig::from_config(config);
        std::string problem = gw.validate();
        if (!problem.empty()) {
            LOG_ERROR("Invalid configuration: %s", problem.c_str());
            result = 1;
        } else {
            signal(SIGINT, signal_handler);
            signal(SIGTERM, signal_handler);

            LOG_INFO("%s v%s starting (log level %s)...", APP_NAME, GATEWAY_VERSION,
                     log_level_name(Logger::instance().level()));
            result = run_gateway(gw);
        }
    }

    // Cleanup libcurl global state
    curl_global_cleanup();

    LOG_INFO("Goodbye!");
    return result;
}

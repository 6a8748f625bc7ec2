#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <csignal>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: modelgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.modelgate/config.json)\n"
              << "  --catalog PATH       Model catalog JSON file\n"
              << "  -m, --message MSG    Send a single chat request and exit\n"
              << "  --caller ID          Caller identity for rate limits (default: cli)\n"
              << "  --capability NAME    Required capability, repeatable (default: chat)\n"
              << "  --priority N         Queue priority, higher first (default: 0)\n"
              << "  --region NAME        Allowed hosting region, repeatable (default: any)\n"
              << "  --prefer PROVIDER    Preferred provider, repeatable\n"
              << "  --stats              Print gateway statistics and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /stats               Show cache, circuit, rate-limit and queue state\n"
              << "  /models              List catalog models\n"
              << "  /health              Check every provider\n"
              << "  /clear-cache         Drop all cached responses\n"
              << "  /reload              Re-read the model catalog\n"
              << "  /reset PROVIDER      Force a provider's circuit closed\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  ANTHROPIC_API_KEY    API key for Anthropic\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n"
              << "  MODELGATE_CATALOG    Model catalog JSON file\n"
              << "  MODELGATE_WORKERS    Worker thread count\n";
}

struct CliOptions {
    std::string caller = "cli";
    std::vector<std::string> capabilities;
    int priority = 0;
    std::vector<std::string> regions;
    std::vector<std::string> preferred;
};

static modelgate::InferenceRequest make_request(const std::string& text,
                                                const CliOptions& opts) {
    modelgate::InferenceRequest req;
    req.request_id = modelgate::generate_id();
    req.caller_id = opts.caller;
    req.required_capabilities = modelgate::make_capabilities(
        opts.capabilities.empty() ? std::vector<std::string>{"chat"} : opts.capabilities);
    req.priority = opts.priority;
    req.allowed_regions = opts.regions;
    req.preferred_providers = opts.preferred;

    modelgate::ChatPayload chat;
    chat.messages.push_back({modelgate::Role::User, text});
    req.payload = std::move(chat);
    return req;
}

// Returns false if the request failed
static bool run_request(modelgate::Gateway& gateway, const std::string& text,
                        const CliOptions& opts) {
    try {
        auto result = gateway.infer(make_request(text, opts));
        std::cout << modelgate::format_result(result) << "\n";
        return true;
    } catch (const modelgate::GatewayError& e) {
        std::cerr << "Error " << e.code() << " (" << modelgate::error_kind_to_string(e.kind())
                  << "): " << e.what();
        if (e.retry_after().count() > 0) {
            std::cerr << " [retry after " << e.retry_after().count() << "ms]";
        }
        std::cerr << "\n";
        return false;
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string config_path;
    std::string catalog_path;
    std::string message;
    bool show_stats = false;
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--catalog") == 0 && i + 1 < argc) {
            catalog_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--caller") == 0 && i + 1 < argc) {
            opts.caller = argv[++i];
        } else if (std::strcmp(argv[i], "--capability") == 0 && i + 1 < argc) {
            opts.capabilities.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--priority") == 0 && i + 1 < argc) {
            opts.priority = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--region") == 0 && i + 1 < argc) {
            opts.regions.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--prefer") == 0 && i + 1 < argc) {
            opts.preferred.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            show_stats = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    auto config = modelgate::GatewayConfig::load(config_path);
    if (!catalog_path.empty()) {
        config.catalog_path = catalog_path;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    modelgate::http_set_abort_flag(&g_shutdown);

    modelgate::SocketHttpClient http_client;
    std::unique_ptr<modelgate::Gateway> gateway;
    try {
        gateway = modelgate::Gateway::from_config(config, http_client);
    } catch (const modelgate::GatewayError& e) {
        std::cerr << "Error " << e.code() << ": " << e.what() << "\n";
        return 1;
    }
    gateway->start();

    if (show_stats) {
        std::cout << modelgate::cmd_stats(*gateway) << "\n";
        return 0;
    }

    // Single message mode
    if (!message.empty()) {
        bool ok = run_request(*gateway, message, opts);
        gateway->stop();
        return ok ? 0 : 1;
    }

    // Interactive REPL
    std::cout << "modelgate\n"
              << "Models: " << gateway->registry().size()
              << " | Caller: " << opts.caller << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "modelgate> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        // Skip empty lines
        if (line.empty()) continue;

        if (line[0] == '/') {
            bool quit = false;
            std::string out = modelgate::run_command(line, *gateway, quit);
            if (quit) break;
            std::cout << out << "\n";
            continue;
        }

        run_request(*gateway, line, opts);
        std::cout << "\n";
    }

    gateway->stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

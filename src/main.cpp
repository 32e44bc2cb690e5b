#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "server.hpp"
#include "stream_client.hpp"
#include "thread_store.hpp"
#include "uploads.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

static void print_usage() {
    auto& reg = chatmux::PluginRegistry::instance();
    std::cout << "Usage: chatmux [options]\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default 0.0.0.0:8080)\n"
              << "  --provider NAME      Stream client (" << join_names(reg.stream_client_names()) << ")\n"
              << "  --model NAME         Model name passed to the stream client\n"
              << "  --store PATH         Thread database path\n"
              << "  --config PATH        Config file (default ~/.chatmux/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Thread stores: " << join_names(reg.store_names()) << "\n"
              << "\n"
              << "Environment:\n"
              << "  GEMINI_API_KEY       Gemini API key\n"
              << "  CHATMUX_LISTEN       Listen address\n"
              << "  CHATMUX_STORE_PATH   Thread database path\n"
              << "  CHATMUX_UPLOAD_DIR   Directory for uploaded images\n"
              << "  CHATMUX_CANNED_PATH  JSON file of canned replies\n";
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string provider_name;
    std::string model_name;
    std::string store_path;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            store_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    chatmux::Config config;
    if (config_path.empty()) {
        config = chatmux::Config::load();
    } else {
        config = chatmux::Config::load_from(config_path);
        config.apply_env_overrides();
    }

    // CLI args override file and environment
    if (!listen.empty()) config.server.listen = listen;
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;
    if (!store_path.empty()) config.store.path = store_path;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    chatmux::http_set_abort_flag(&g_shutdown);

    chatmux::SocketHttpClient http_client;
    auto store = chatmux::create_thread_store(config);
    auto client = chatmux::create_stream_client(config, http_client);
    chatmux::UploadStore uploads(config.resolved_upload_dir());

    std::cerr << "[main] store=" << store->backend_name()
              << " client=" << client->client_name()
              << " model=" << config.model << "\n";

    chatmux::ChatServer server(config, *store, *client, uploads);
    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[main] Shutting down (" << server.connection_count()
              << " live connections)\n";
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

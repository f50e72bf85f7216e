#include "web_server.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string host;
    int port = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = summarizer::parse_port(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Error: --port: " << e.what() << "\n";
                return 1;
            }
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n\n"
                      << "Options:\n"
                      << "  --config PATH YAML config\n"
                      << "  --host HOST   Host (default: 0.0.0.0)\n"
                      << "  --port PORT   Port (default: 8080)\n";
            return 0;
        } else if (i == 1 && arg[0] != '-') {
            config_path = arg;
        }
    }

    try {
        summarizer::AppConfig config = config_path.empty()
            ? summarizer::AppConfig{} : summarizer::load_config(config_path);
        if (!host.empty()) config.server.host = host;
        if (port != 0) config.server.port = port;
        config.validate();

        summarizer::WebServer server(config);
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

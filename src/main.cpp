#include "config.hpp"
#include "backend.hpp"
#include "chat_sink.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "http_server.hpp"
#include "plugin.hpp"
#include "process.hpp"
#include "session.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: agentbridge [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --stream             Print tokens as the backend produces them\n"
              << "  --backend NAME       Use specific backend (claude, codex)\n"
              << "  --project KEY        Conversation key (default: cli)\n"
              << "  --agent-type NAME    Skill or instruction profile for each turn\n"
              << "  --serve [ADDR]       Run the HTTP gateway (default from config)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /new                 Start a new conversation\n"
              << "  /status              Show backend and session info\n"
              << "  /sessions            List known conversations\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  AGENT_BACKEND        Backend name (overrides config)\n"
              << "  CLAUDE_CLI_PATH      Path to the claude executable\n"
              << "  CODEX_CLI_PATH       Path to the codex executable\n"
              << "  AGENT_TIMEOUT        Turn deadline in seconds (alias: CLAUDE_TIMEOUT)\n"
              << "  AGENT_PROFILES_DIR   Instruction profile directory\n"
              << "  AGENT_DEFAULT_PROFILE  Fallback instruction profile\n"
              << "  CHAT_API_BASE_URL    Chat history service (--serve)\n"
              << "  CHAT_API_TOKEN       Bearer token for the chat history service\n"
              << "  HOST, PORT           Gateway listen address (--serve)\n";
}

// One turn from the command line or the REPL. Returns false on failure.
static bool run_turn(agentbridge::SessionManager& sessions,
                     const agentbridge::TurnRequest& request,
                     bool stream) {
    if (stream) {
        bool failed = false;
        sessions.ask_streaming(request, [&failed](const agentbridge::StreamEvent& ev) {
            switch (ev.kind) {
                case agentbridge::EventKind::Token:
                    std::cout << ev.text << std::flush;
                    break;
                case agentbridge::EventKind::Error:
                    failed = true;
                    std::cerr << "\nError: " << ev.text << "\n";
                    break;
                case agentbridge::EventKind::Done:
                    std::cout << "\n";
                    break;
            }
            return !g_shutdown.load();
        });
        return !failed;
    }

    try {
        auto result = sessions.ask(request);
        std::cout << result.text << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
}

static int run_gateway(agentbridge::SessionManager& sessions,
                       agentbridge::AuthContext& auth,
                       const agentbridge::Config& config,
                       const std::string& listen_addr) {
    agentbridge::Gateway gateway(sessions, config.chat_api.base_url, &auth);
    agentbridge::HttpServer server(listen_addr, config.gateway.max_body,
        [&gateway](const agentbridge::HttpRequest& req, agentbridge::ResponseWriter& out) {
            gateway.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    const auto& backend = sessions.backend();
    std::cerr << "[gateway] Listening on " << listen_addr << "\n"
              << "[gateway] Backend: " << backend.backend_name()
              << " (" << backend.settings().cli_path << ")\n"
              << "[gateway] Chat API: " << config.chat_api.base_url << "\n"
              << "[gateway] Timeout: " << config.timeout_seconds << "s\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down.\n";
    server.stop();
    return 0;
}

static void print_sessions(const agentbridge::SessionManager& sessions) {
    auto list = sessions.list_sessions();
    if (list.empty()) {
        std::cout << "No sessions.\n";
        return;
    }
    for (const auto& s : list) {
        std::cout << "  " << s.conversation_key << " -> " << s.session_id;
        if (s.native_resume_id) std::cout << " (thread " << *s.native_resume_id << ")";
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string backend_name;
    std::string project = "cli";
    std::string agent_type;
    std::string serve_addr;
    bool serve = false;
    bool stream = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--stream") == 0) {
            stream = true;
        } else if (std::strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
            backend_name = argv[++i];
        } else if (std::strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            project = argv[++i];
        } else if (std::strcmp(argv[i], "--agent-type") == 0 && i + 1 < argc) {
            agent_type = argv[++i];
        } else if (std::strcmp(argv[i], "--serve") == 0) {
            serve = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') serve_addr = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    agentbridge::CurlGlobal curl_global;
    auto config = agentbridge::Config::load();

    // Override config with CLI args
    if (!backend_name.empty()) {
        config.backend = backend_name;
    }

    std::unique_ptr<agentbridge::Backend> backend;
    try {
        backend = agentbridge::create_backend(config.backend,
                                              config.backend_settings(config.backend));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\nAvailable backends:";
        for (const auto& name : agentbridge::PluginRegistry::instance().backend_names()) {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    agentbridge::CurlOptions curl_options;
    curl_options.cancel = &g_shutdown;

    agentbridge::PosixProcessRunner runner;
    agentbridge::CurlHttpClient http_client(curl_options);
    agentbridge::AuthContext auth(config.chat_api.token);
    agentbridge::HttpChatSink chat_sink(http_client, config.chat_api.base_url, auth,
                                        static_cast<long>(config.chat_api.timeout_seconds));

    // Gateway mode
    if (serve) {
        agentbridge::SessionManager sessions(std::move(backend), runner,
                                             static_cast<int>(config.timeout_seconds),
                                             &chat_sink);
        return run_gateway(sessions, auth, config,
                           serve_addr.empty() ? config.gateway.listen : serve_addr);
    }

    agentbridge::SessionManager sessions(std::move(backend), runner,
                                         static_cast<int>(config.timeout_seconds));

    agentbridge::TurnRequest request;
    request.conversation_key = project;
    request.agent_type = agent_type;

    // Single message mode
    if (!message.empty()) {
        request.question = message;
        return run_turn(sessions, request, stream) ? 0 : 1;
    }

    // Interactive REPL
    const auto& active = sessions.backend();
    std::cout << "agentbridge\n"
              << "Backend: " << active.backend_name()
              << " | CLI: " << active.settings().cli_path << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "agentbridge> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        if (g_shutdown.load()) break;

        line = agentbridge::trim(line);
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/status") {
                auto current = sessions.registry().resolve(project);
                std::cout << "Backend: " << active.backend_name() << "\n"
                          << "CLI: " << active.settings().cli_path << "\n"
                          << "Profiles: " << sessions.resolver().strategy_name() << "\n"
                          << "Conversation: " << project << "\n"
                          << "Session: " << (current ? current->session_id : "(new)") << "\n";
            } else if (line == "/new") {
                sessions.remove_session(project);
                std::cout << "Started a new conversation.\n";
            } else if (line == "/sessions") {
                print_sessions(sessions);
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /new       Start a new conversation\n"
                          << "  /status    Show backend and session info\n"
                          << "  /sessions  List known conversations\n"
                          << "  /quit      Exit\n"
                          << "  /exit      Exit\n"
                          << "  /help      Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        request.question = line;
        std::cout << "\n";
        run_turn(sessions, request, stream);
        std::cout << "\n";
        g_shutdown.store(false); // Ctrl+C cancels the turn, not the REPL
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

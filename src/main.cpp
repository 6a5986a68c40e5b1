#include "config.h"
#include "interview_engine.h"
#include "llm_client.h"
#include "logger.h"
#include "scripted_provider.h"
#include "session_recorder.h"
#include "utils.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>

namespace interview_coach {

static std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
}

namespace {

struct CliOptions {
    CandidateMetadata candidate;
    bool debug = false;
    bool offline = false;
    bool help = false;
    std::string scenario;
    std::string config_path;
    std::optional<int> max_turns;
    std::optional<std::string> logs_dir;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -n, --name <name>          candidate name\n"
              << "  -r, --role <role>          target role\n"
              << "  -g, --grade <grade>        Junior, Middle or Senior\n"
              << "  -e, --experience <text>    experience description\n"
              << "  -d, --debug                print internal notes each turn\n"
              << "  -s, --scenario <id>        log file becomes interview_log_<id>.json\n"
              << "  -c, --config <path>        configuration file (default config/config.json)\n"
              << "      --max-turns <n>        maximum turns\n"
              << "      --logs-dir <dir>       session log directory\n"
              << "      --offline              use canned responses instead of a model\n"
              << "      --help                 show this help\n"
              << "\nWrite your answer over one or more lines; an empty line sends it.\n"
              << "Ctrl-D or Ctrl-C ends the interview and prints the report.\n";
}

// Returns false on a malformed command line
bool parse_args(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-n" || arg == "--name") {
            if (!value(options.candidate.name)) return false;
        } else if (arg == "-r" || arg == "--role") {
            if (!value(options.candidate.role)) return false;
        } else if (arg == "-g" || arg == "--grade") {
            if (!value(options.candidate.target_grade)) return false;
        } else if (arg == "-e" || arg == "--experience") {
            if (!value(options.candidate.experience)) return false;
        } else if (arg == "-s" || arg == "--scenario") {
            if (!value(options.scenario)) return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!value(options.config_path)) return false;
        } else if (arg == "--logs-dir") {
            std::string dir;
            if (!value(dir)) return false;
            options.logs_dir = dir;
        } else if (arg == "--max-turns") {
            std::string text;
            if (!value(text)) return false;
            try {
                options.max_turns = std::stoi(text);
            } catch (const std::exception&) {
                std::cerr << "Invalid --max-turns value: " << text << "\n";
                return false;
            }
        } else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "--offline") {
            options.offline = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Prompt on stdin for a field left empty on the command line
bool prompt_field(const std::string& label, std::string& field) {
    while (utils::is_empty_or_whitespace(field)) {
        std::cout << label << ": " << std::flush;
        if (!std::getline(std::cin, field)) {
            return false;
        }
    }
    utils::trim(field);
    return true;
}

// Multi-line message; an empty line submits. nullopt on EOF or interrupt.
std::optional<std::string> read_message() {
    std::string message;
    std::string line;
    std::cout << "\nYou: " << std::flush;
    while (true) {
        if (!std::getline(std::cin, line)) {
            if (!g_interrupted && !utils::is_empty_or_whitespace(message)) {
                return message;
            }
            return std::nullopt;
        }
        if (g_interrupted) {
            return std::nullopt;
        }
        if (utils::is_empty_or_whitespace(line)) {
            if (!utils::is_empty_or_whitespace(message)) {
                return message;
            }
            continue;
        }
        if (!message.empty()) message += "\n";
        message += line;
    }
}

void print_outcome(const TurnOutcome& outcome, bool debug) {
    if (debug) {
        for (const auto& note : outcome.notes) {
            std::cout << "  . " << note << "\n";
        }
    }
    std::cout << "\nInterviewer: " << outcome.agent_message << "\n";
}

} // namespace

} // namespace interview_coach

int main(int argc, char* argv[]) {
    using namespace interview_coach;

    CliOptions options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }
    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Console logging until the configured sink is known
    Logger::initialize(LogLevel::WARN);

    std::string config_path = options.config_path;
    if (config_path.empty()) {
        std::ifstream test("config/config.json");
        if (test.good()) {
            config_path = "config/config.json";
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load_from_file(config_path);
    }
    config.apply_env_overrides();
    if (options.max_turns) config.interview.max_turns = *options.max_turns;
    if (options.logs_dir) config.logs_dir = *options.logs_dir;
    config.validate();

    Logger::initialize(options.debug ? LogLevel::DEBUG : parse_log_level(config.log.level), config.log.file);

    // No SA_RESTART: a pending read returns so the interview can wrap up
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    CandidateMetadata candidate = options.candidate;
    if (!prompt_field("Candidate name", candidate.name) ||
        !prompt_field("Target role", candidate.role) ||
        !prompt_field("Target grade (Junior/Middle/Senior)", candidate.target_grade) ||
        !prompt_field("Experience", candidate.experience)) {
        std::cerr << "Candidate details incomplete, exiting.\n";
        Logger::shutdown();
        return 1;
    }
    if (!parse_level(candidate.target_grade)) {
        Logger::warn("Unrecognized grade '" + candidate.target_grade + "', passing it through as given");
    }

    std::shared_ptr<InferenceProvider> provider;
    if (options.offline) {
        provider = ScriptedProvider::with_offline_defaults();
    } else {
        if (config.llm.api_key.empty() && config.llm.endpoint.find("/api/chat") == std::string::npos) {
            Logger::warn("No API key configured (set OPENAI_API_KEY or llm.api_key)");
        }
        provider = std::make_shared<LLMClient>(config.llm);
    }

    SessionRecorder recorder(config.logs_dir);
    InterviewEngine engine(config, provider, &recorder);

    std::cout << "Interview with " << candidate.name << " for " << candidate.target_grade << " "
              << candidate.role << " (up to " << config.interview.max_turns << " turns)\n"
              << "Send an empty line to submit; say \"stop\" to finish early.\n";

    auto started = engine.start(candidate, options.scenario);
    if (started.is_error()) {
        std::cerr << "Could not start the interview: " << describe(started.error()) << "\n";
        Logger::shutdown();
        return 1;
    }
    print_outcome(started.value(), options.debug);

    while (engine.is_active()) {
        auto message = read_message();
        Result<TurnOutcome> outcome = message
            ? engine.process_message(*message)
            : engine.interrupt();
        if (outcome.is_error()) {
            std::cerr << "Error: " << describe(outcome.error()) << "\n";
            break;
        }
        print_outcome(outcome.value(), options.debug);
    }

    if (!engine.log_path().empty()) {
        std::cout << "\nSession log: " << engine.log_path() << "\n";
    }

    Logger::shutdown();
    return 0;
}

// metatot: run the planning engine on a problem statement.
//
// Usage: metatot "problem statement" [options]
// Prints the run result as JSON on stdout; logs go to stderr.
// Exit codes: 0 success, 2 no viable branches, 1 input error.

#include "engine/meta_tot_engine.hpp"
#include "generation/template_client.hpp"
#include "trace/memory_trace_store.hpp"
#include "trace/sqlite_trace_store.hpp"
#include "trace/trace_codec.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace metatot;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_INPUT_ERROR = 1;
constexpr int EXIT_NO_VIABLE = 2;

void printUsage() {
    std::cerr << "Usage: metatot \"problem statement\" [options]\n\n"
              << "Options:\n"
              << "  --depth N          Maximum tree depth (default: 4)\n"
              << "  --iterations N     Maximum search iterations (default: 32)\n"
              << "  --deadline-ms MS   Session deadline, 0 disables (default: 5000)\n"
              << "  --branches N       Branching factor (default: 3)\n"
              << "  --goal KEY=WEIGHT  Goal hypothesis, repeatable (default: viable=1)\n"
              << "  --context JSON     Context snapshot as a JSON object\n"
              << "  --trace-db PATH    SQLite trace database (default: in memory)\n"
              << "  --tc X             Complexity threshold T_c\n"
              << "  --tu X             Uncertainty threshold T_u\n"
              << "  --force            Skip the gate and always search\n"
              << "  --verbose          Debug logging and the full tree in the output\n"
              << "  -h, --help         Show this help\n";
}

void parseGoal(const std::string& arg, GoalVector& goal) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("--goal expects KEY=WEIGHT, got '" + arg + "'");
    }
    goal[arg.substr(0, eq)] = std::stod(arg.substr(eq + 1));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string problem;
    std::string trace_db;
    std::string context_text;
    GoalVector goal;
    bool force = false;
    bool verbose = false;

    EngineConfig config = EngineConfig::fromEnv();
    RunConfig run = config.defaultRun();

    try {
        for (int i = 1; i < argc; i++) {
            if (strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
                run.search.max_depth = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
                run.search.max_iterations = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "--deadline-ms") == 0 && i + 1 < argc) {
                run.search.deadline_ms = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "--branches") == 0 && i + 1 < argc) {
                config.generator.branching_factor = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "--goal") == 0 && i + 1 < argc) {
                parseGoal(argv[++i], goal);
            } else if (strcmp(argv[i], "--context") == 0 && i + 1 < argc) {
                context_text = argv[++i];
            } else if (strcmp(argv[i], "--trace-db") == 0 && i + 1 < argc) {
                trace_db = argv[++i];
            } else if (strcmp(argv[i], "--tc") == 0 && i + 1 < argc) {
                run.complexity_threshold = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--tu") == 0 && i + 1 < argc) {
                run.uncertainty_threshold = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--force") == 0) {
                force = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
                printUsage();
                return EXIT_OK;
            } else if (argv[i][0] == '-' && argv[i][1] == '-') {
                std::cerr << "Unknown or incomplete option: " << argv[i] << "\n\n";
                printUsage();
                return EXIT_INPUT_ERROR;
            } else if (problem.empty()) {
                problem = argv[i];
            } else {
                problem += " ";
                problem += argv[i];
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return EXIT_INPUT_ERROR;
    }

    if (problem.empty()) {
        printUsage();
        return EXIT_INPUT_ERROR;
    }

    if (verbose) Logger::setLevel(Logger::Level::Debug);
    if (goal.empty()) goal["viable"] = 1.0;

    nlohmann::json context = nlohmann::json::object();
    if (!context_text.empty()) {
        context = nlohmann::json::parse(context_text, nullptr, false);
        if (context.is_discarded() || !context.is_object()) {
            std::cerr << "--context must be a JSON object\n";
            return EXIT_INPUT_ERROR;
        }
    }
    if (force) context["force_meta_tot"] = true;

    try {
        std::shared_ptr<TraceStore> store;
        if (trace_db.empty()) {
            store = std::make_shared<MemoryTraceStore>();
        } else {
            store = std::make_shared<SqliteTraceStore>(trace_db);
        }

        MetaToTEngine engine(std::make_shared<TemplateInferenceClient>(), store, config);
        RunResult result = engine.run(problem, context, goal, run);

        nlohmann::json out = result.toJson();
        if (verbose && result.session) {
            nlohmann::json nodes = nlohmann::json::array();
            result.session->tree.forEachNode([&nodes](const ThoughtNode& node) {
                nodes.push_back(TraceCodec::encodeNode(node));
            });
            out["tree"] = nodes;
        }
        std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

        return result.ok() ? EXIT_OK : EXIT_NO_VIABLE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Input error: " << e.what() << "\n";
        return EXIT_INPUT_ERROR;
    } catch (const TraceStoreError& e) {
        std::cerr << "Trace store error: " << e.what() << "\n";
        return EXIT_INPUT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_INPUT_ERROR;
    }
}

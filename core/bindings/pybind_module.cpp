// PyBind11 bindings for the Meta-ToT planning engine.
// Exposes the configs, the decision gate and the engine, with a Python
// callable as the inference backend. Contexts and results cross the
// boundary as JSON strings.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "decision/decision_gate.hpp"
#include "engine/meta_tot_engine.hpp"
#include "generation/template_client.hpp"
#include "search/search_state.hpp"
#include "trace/memory_trace_store.hpp"
#include "trace/sqlite_trace_store.hpp"

namespace py = pybind11;

namespace {

nlohmann::json parseContext(const std::string& text) {
    if (text.empty()) return nlohmann::json::object();
    auto ctx = nlohmann::json::parse(text, nullptr, false);
    if (ctx.is_discarded()) throw std::invalid_argument("context is not valid JSON");
    return ctx;
}

metatot::Proposal toProposal(const py::handle& item) {
    metatot::Proposal p;
    if (py::isinstance<py::str>(item)) {
        p.content = item.cast<std::string>();
        return p;
    }
    py::dict d = item.cast<py::dict>();
    if (d.contains("content")) p.content = d["content"].cast<std::string>();
    if (d.contains("belief_hypotheses")) {
        p.belief_hypotheses = d["belief_hypotheses"].cast<std::map<std::string, double>>();
    }
    return p;
}

// Owns a Python callable that may be released from a worker thread.
// The reference count is only touched with the GIL held.
struct GilHeldFunction {
    py::function fn;

    explicit GilHeldFunction(py::function f) : fn(std::move(f)) {}
    ~GilHeldFunction() {
        py::gil_scoped_acquire gil;
        fn = py::function();
    }

    GilHeldFunction(const GilHeldFunction&) = delete;
    GilHeldFunction& operator=(const GilHeldFunction&) = delete;
};

// Python callable (prompt, context_json) -> list of str or
// {"content", "belief_hypotheses"} dicts. Called from worker threads.
std::shared_ptr<metatot::InferenceClient> pythonClient(py::function fn) {
    auto holder = std::make_shared<GilHeldFunction>(std::move(fn));

    auto generate = [holder](const std::string& prompt, const nlohmann::json& context) {
        py::gil_scoped_acquire gil;
        try {
            py::object out = holder->fn(prompt, context.dump());
            metatot::GenerationResponse response;
            for (const auto& item : out) response.proposals.push_back(toProposal(item));
            return response;
        } catch (const py::error_already_set& e) {
            throw metatot::InferenceError(std::string("Python generator failed: ") + e.what());
        } catch (const py::cast_error& e) {
            throw metatot::InferenceError(std::string("Python generator returned bad data: ") + e.what());
        }
    };
    return std::make_shared<metatot::CallbackInferenceClient>(generate, "python");
}

} // namespace

PYBIND11_MODULE(metatot_bindings, m) {
    m.doc() = "Meta-ToT planning engine bindings";

    // ── GateThresholds ──
    py::class_<metatot::GateThresholds>(m, "GateThresholds")
        .def(py::init<>())
        .def_readwrite("complexity", &metatot::GateThresholds::complexity)
        .def_readwrite("uncertainty", &metatot::GateThresholds::uncertainty);

    // ── GateConfig ──
    py::class_<metatot::GateConfig>(m, "GateConfig")
        .def(py::init<>())
        .def_readwrite("thresholds", &metatot::GateConfig::thresholds)
        .def_readwrite("min_token_threshold", &metatot::GateConfig::min_token_threshold)
        .def_readwrite("always_on", &metatot::GateConfig::always_on);

    // ── Decision ──
    py::class_<metatot::Decision>(m, "Decision")
        .def_readonly("task", &metatot::Decision::task)
        .def_readonly("complexity_score", &metatot::Decision::complexity_score)
        .def_readonly("uncertainty_score", &metatot::Decision::uncertainty_score)
        .def_readonly("thresholds", &metatot::Decision::thresholds)
        .def_readonly("rationale", &metatot::Decision::rationale)
        .def_property_readonly("selected_mode", [](const metatot::Decision& d) {
            return metatot::toString(d.selected_mode);
        })
        .def("to_json", [](const metatot::Decision& d) { return d.toJson().dump(); });

    // ── DecisionGate ──
    py::class_<metatot::DecisionGate>(m, "DecisionGate")
        .def(py::init<metatot::GateConfig>(), py::arg("config") = metatot::GateConfig{})
        .def("decide", [](const metatot::DecisionGate& self, const std::string& task,
                          const std::string& context_json) {
            return self.decide(task, parseContext(context_json));
        }, py::arg("task"), py::arg("context_json") = "");

    // ── SearchConfig ──
    py::class_<metatot::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &metatot::SearchConfig::max_iterations)
        .def_readwrite("max_depth", &metatot::SearchConfig::max_depth)
        .def_readwrite("deadline_ms", &metatot::SearchConfig::deadline_ms)
        .def_readwrite("exploration_constant", &metatot::SearchConfig::exploration_constant)
        .def_readwrite("integrate_depth", &metatot::SearchConfig::integrate_depth)
        .def_readwrite("parallel_expansions", &metatot::SearchConfig::parallel_expansions)
        .def_readwrite("unexplored_malus", &metatot::SearchConfig::unexplored_malus);

    // ── GeneratorConfig ──
    py::class_<metatot::GeneratorConfig>(m, "GeneratorConfig")
        .def(py::init<>())
        .def_readwrite("branching_factor", &metatot::GeneratorConfig::branching_factor)
        .def_readwrite("call_timeout_ms", &metatot::GeneratorConfig::call_timeout_ms)
        .def_readwrite("worker_count", &metatot::GeneratorConfig::worker_count);

    // ── EngineConfig ──
    py::class_<metatot::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("gate", &metatot::EngineConfig::gate)
        .def_readwrite("search", &metatot::EngineConfig::search)
        .def_readwrite("generator", &metatot::EngineConfig::generator)
        .def_readwrite("adaptive_thresholds", &metatot::EngineConfig::adaptive_thresholds)
        .def_static("from_env", []() { return metatot::EngineConfig::fromEnv(); });

    // ── Engine ──
    // generate=None uses the offline template backend; trace_db="" keeps
    // traces in memory.
    py::class_<metatot::MetaToTEngine>(m, "Engine")
        .def(py::init([](py::object generate, const std::string& trace_db,
                         const metatot::EngineConfig& config) {
            std::shared_ptr<metatot::InferenceClient> client;
            if (generate.is_none()) {
                client = std::make_shared<metatot::TemplateInferenceClient>();
            } else {
                client = pythonClient(generate.cast<py::function>());
            }
            std::shared_ptr<metatot::TraceStore> store;
            if (trace_db.empty()) {
                store = std::make_shared<metatot::MemoryTraceStore>();
            } else {
                store = std::make_shared<metatot::SqliteTraceStore>(trace_db);
            }
            return std::make_unique<metatot::MetaToTEngine>(client, store, config);
        }), py::arg("generate") = py::none(), py::arg("trace_db") = "",
            py::arg("config") = metatot::EngineConfig{})
        .def("run", [](metatot::MetaToTEngine& self, const std::string& task,
                       const std::string& context_json,
                       const std::map<std::string, double>& goal) {
            nlohmann::json ctx = parseContext(context_json);
            metatot::RunResult result;
            {
                py::gil_scoped_release release;
                result = self.run(task, ctx, goal);
            }
            return result.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }, py::arg("task"), py::arg("context_json"), py::arg("goal"))
        .def("retrieve_trace", [](metatot::MetaToTEngine& self, const std::string& trace_id) {
            auto payload = self.retrieveTrace(trace_id);
            if (!payload) return py::object(py::none());
            return py::object(py::str(
                payload->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
        }, py::arg("trace_id"));

    py::register_exception<metatot::InferenceError>(m, "InferenceError");
    py::register_exception<metatot::TraceStoreError>(m, "TraceStoreError");
}

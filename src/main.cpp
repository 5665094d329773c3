#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "knowledge_graph.hpp"
#include "seed_data.hpp"
#include "pipeline.hpp"
#include "generation_service.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"

namespace {

struct CliOptions {
    std::string data_path;
    graph_rag::PipelineConfig pipeline;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--data seeds.json] [--depth N] [--timeout-ms N] [--quiet|--verbose]\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--data") {
            opts.data_path = next();
        } else if (arg == "--depth") {
            opts.pipeline.traversal_depth = std::stoi(next());
        } else if (arg == "--timeout-ms") {
            opts.pipeline.generation_timeout = std::chrono::milliseconds(std::stol(next()));
        } else if (arg == "--quiet") {
            opts.log_level = spdlog::level::err;
        } else if (arg == "--verbose") {
            opts.log_level = spdlog::level::debug;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return true;
}

void print_banner() {
    std::cout << "\n"
              << "==============================================================\n"
              << "                  Graph RAG Question Answering                \n"
              << "==============================================================\n\n";
}

void print_graph_info(const graph_rag::KnowledgeGraph& graph) {
    auto stats = graph.stats();
    std::cout << "Knowledge Graph Statistics:\n"
              << "  * Total nodes: " << stats.total_nodes << "\n"
              << "  * Total edges: " << stats.total_edges << "\n"
              << "  * People: " << stats.people << "\n"
              << "  * Organizations: " << stats.organizations << "\n\n";
}

void print_sample_questions() {
    std::cout << "Sample questions you can ask:\n"
              << "  * What companies did Elon Musk found?\n"
              << "  * Who leads OpenAI?\n"
              << "  * What is the relationship between Microsoft and OpenAI?\n"
              << "  * Tell me about NVIDIA\n"
              << "  * Who founded DeepMind?\n\n";
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void print_result(const graph_rag::PipelineState& state) {
    const std::string rule(60, '=');
    const std::string thin(60, '-');

    std::cout << "\n" << rule << "\nGRAPH RAG PIPELINE EXECUTION\n" << rule << "\n";
    auto current = graph_rag::PipelineStage::Done;
    for (const auto& entry : state.trace) {
        if (entry.stage != current) {
            std::cout << "\n";
            current = entry.stage;
        }
        std::cout << "   " << entry.message << "\n";
    }
    std::cout << "\n" << rule << "\n";

    std::cout << "\n" << thin << "\nFINAL ANSWER:\n" << thin << "\n"
              << state.answer << "\n" << thin << "\n\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliOptions opts;
    try {
        if (!parse_args(argc, argv, opts)) return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    spdlog::set_level(opts.log_level);

    std::shared_ptr<const graph_rag::KnowledgeGraph> graph;
    try {
        auto seeds = opts.data_path.empty() ? graph_rag::default_seed_data()
                                            : graph_rag::load_seed_file(opts.data_path);
        graph = std::make_shared<const graph_rag::KnowledgeGraph>(graph_rag::KnowledgeGraph::build(seeds));
    } catch (const graph_rag::GraphConstructionError& e) {
        spdlog::critical("Cannot build knowledge graph: {}", e.what());
        return 1;
    }

    auto key_manager = std::make_shared<graph_rag::KeyManager>();
    std::shared_ptr<graph_rag::TextGenerator> generator;
    if (key_manager->has_key()) {
        generator = std::make_shared<graph_rag::GroqGenerationService>(key_manager);
    }

    std::unique_ptr<graph_rag::GraphRagPipeline> pipeline;
    try {
        pipeline = std::make_unique<graph_rag::GraphRagPipeline>(graph, generator, opts.pipeline);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    print_banner();
    print_graph_info(*graph);
    print_sample_questions();
    if (!pipeline->generation_available()) {
        std::cout << "Note: LLM generation disabled (set " << graph_rag::KeyManager::kEnvKey
                  << " to enable). Answers will show the raw graph context.\n\n";
    }
    std::cout << "Type 'quit' or 'exit' to stop. Type 'help' for sample questions.\n\n";

    std::string line;
    while (true) {
        std::cout << "Ask a question: " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\nGoodbye!\n";
            break;
        }

        std::string question = trim(line);
        if (question.empty()) continue;

        std::string command = lowercase(question);
        if (command == "quit" || command == "exit" || command == "q") {
            std::cout << "\nGoodbye!\n";
            break;
        }
        if (command == "help") {
            print_sample_questions();
            continue;
        }
        if (command == "stats") {
            print_graph_info(*graph);
            continue;
        }
        if (command == "history") {
            std::cout << graph_rag::LogManager::instance().get_logs_json().dump(2) << "\n\n";
            continue;
        }

        try {
            print_result(pipeline->run(question));
        } catch (const std::exception& e) {
            spdlog::error("Pipeline failed: {}", e.what());
            std::cout << "\nError: " << e.what() << "\n\n";
        }
    }
    return 0;
}

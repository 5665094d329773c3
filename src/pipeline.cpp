#include "pipeline.hpp"
#include "LogManager.hpp"
#include <algorithm>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace graph_rag {

std::string to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Detect:       return "detect";
        case PipelineStage::Retrieve:     return "retrieve";
        case PipelineStage::Traverse:     return "traverse";
        case PipelineStage::BuildContext: return "build_context";
        case PipelineStage::Generate:     return "generate";
        case PipelineStage::Done:         return "done";
    }
    return "unknown";
}

std::vector<std::string> PipelineState::trace_for(PipelineStage stage) const {
    std::vector<std::string> lines;
    for (const auto& entry : trace) {
        if (entry.stage == stage) lines.push_back(entry.message);
    }
    return lines;
}

GraphRagPipeline::GraphRagPipeline(std::shared_ptr<const KnowledgeGraph> graph,
                                   std::shared_ptr<TextGenerator> generator,
                                   PipelineConfig config)
    : graph_(std::move(graph)),
      traversal_(graph_),
      generator_(std::move(generator)),
      config_(config)
{
    if (!graph_) {
        throw std::invalid_argument("GraphRagPipeline requires a knowledge graph");
    }
    if (config_.traversal_depth < 0) {
        throw std::invalid_argument("Traversal depth must be >= 0");
    }
}

// --- STATE MACHINE ---

PipelineStage GraphRagPipeline::next_stage(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Detect:       return PipelineStage::Retrieve;
        case PipelineStage::Retrieve:     return PipelineStage::Traverse;
        case PipelineStage::Traverse:     return PipelineStage::BuildContext;
        case PipelineStage::BuildContext: return PipelineStage::Generate;
        case PipelineStage::Generate:     return PipelineStage::Done;
        case PipelineStage::Done:         return PipelineStage::Done;
    }
    return PipelineStage::Done;
}

void GraphRagPipeline::merge(PipelineState& state, PipelineStage stage, StageUpdate update) {
    if (update.detected_entities) state.detected_entities = std::move(*update.detected_entities);
    if (update.relationship_intents) state.relationship_intents = std::move(*update.relationship_intents);
    if (update.matched_nodes) state.matched_nodes = std::move(*update.matched_nodes);
    if (update.traversal_results) state.traversal_results = std::move(*update.traversal_results);
    if (update.facts) state.facts = std::move(*update.facts);
    if (update.context) state.context = std::move(*update.context);
    if (update.prompt) state.prompt = std::move(*update.prompt);
    if (update.answer) state.answer = std::move(*update.answer);
    if (update.generated) state.generated = *update.generated;

    for (auto& line : update.trace) {
        state.trace.push_back({stage, std::move(line)});
    }
}

StageUpdate GraphRagPipeline::execute(PipelineStage stage, const PipelineState& state) const {
    switch (stage) {
        case PipelineStage::Detect:       return detect_entities(state);
        case PipelineStage::Retrieve:     return retrieve_nodes(state);
        case PipelineStage::Traverse:     return traverse_relationships(state);
        case PipelineStage::BuildContext: return build_context(state);
        case PipelineStage::Generate:     return generate_answer(state);
        case PipelineStage::Done:         break;
    }
    return {};
}

PipelineState GraphRagPipeline::run(const std::string& question) const {
    auto start = std::chrono::high_resolution_clock::now();

    PipelineState state;
    state.question = question;

    for (auto stage = PipelineStage::Detect; stage != PipelineStage::Done; stage = next_stage(stage)) {
        merge(state, stage, execute(stage, state));
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("Pipeline finished in {:.2f} ms ({} entities, {} facts)",
                 duration, state.detected_entities.size(), state.facts.size());

    if (config_.record_history) {
        std::vector<std::string> entity_names;
        for (const auto& e : state.detected_entities) entity_names.push_back(e.name);

        LogManager::instance().add_log({
            static_cast<long long>(std::time(nullptr)), question, entity_names, state.facts.size(),
            state.prompt, state.answer, state.generated, duration
        });
    }
    return state;
}

// --- STAGES ---

StageUpdate GraphRagPipeline::detect_entities(const PipelineState& state) const {
    StageUpdate update;
    auto entities = recognizer_.detect(state.question);
    auto intents = EntityRecognizer::extract_relationship_intents(state.question);

    update.trace.push_back("STEP 1: Entity Detection");
    update.trace.push_back("Question: " + state.question);
    update.trace.push_back("Detected " + std::to_string(entities.size()) + " entities:");
    for (const auto& e : entities) {
        update.trace.push_back("- " + e.name + " (" + to_string(e.kind) + ")");
    }
    if (entities.empty()) {
        update.trace.push_back("No entities detected");
    }

    if (!intents.empty()) {
        std::string joined;
        for (size_t i = 0; i < intents.size(); ++i) {
            if (i > 0) joined += ", ";
            joined += to_string(intents[i]);
        }
        update.trace.push_back("Relationship intents: " + joined);
    }

    update.detected_entities = std::move(entities);
    update.relationship_intents = std::move(intents);
    return update;
}

StageUpdate GraphRagPipeline::retrieve_nodes(const PipelineState& state) const {
    StageUpdate update;
    std::vector<MatchedNode> matched;

    update.trace.push_back("STEP 2: Node Retrieval");

    for (const auto& entity : state.detected_entities) {
        for (const auto& [node_id, node] : graph_->find_nodes_by_name(entity.name)) {
            matched.push_back({node_id, *node, entity.name});
            update.trace.push_back("Found: " + node->name + " (ID: " + node_id + ")");
        }
    }

    if (matched.empty()) {
        update.trace.push_back("No matching nodes found in graph");
    } else {
        update.trace.push_back("Total nodes matched: " + std::to_string(matched.size()));
    }

    update.matched_nodes = std::move(matched);
    return update;
}

StageUpdate GraphRagPipeline::traverse_relationships(const PipelineState& state) const {
    StageUpdate update;
    std::vector<TraversalResult> traversals;

    update.trace.push_back("STEP 3: Graph Traversal");

    for (const auto& match : state.matched_nodes) {
        auto traversal = traversal_.traverse(match.node_id, config_.traversal_depth);

        update.trace.push_back("Traversing from: " + match.node.name);
        update.trace.push_back("- Visited " + std::to_string(traversal.visited_nodes.size()) + " nodes");
        update.trace.push_back("- Found " + std::to_string(traversal.facts.size()) + " relationships");

        size_t shown = std::min(traversal.facts.size(), config_.trace_fact_preview);
        for (size_t i = 0; i < shown; ++i) {
            const auto& fact = traversal.facts[i];
            update.trace.push_back("  -> " + fact.source_name + " --[" + fact.label + "]--> " + fact.target_name);
        }

        traversals.push_back(std::move(traversal));
    }

    update.traversal_results = std::move(traversals);
    return update;
}

StageUpdate GraphRagPipeline::build_context(const PipelineState& state) const {
    StageUpdate update;

    // Different start nodes can rediscover the same edge.
    std::vector<Fact> all_facts;
    for (const auto& traversal : state.traversal_results) {
        all_facts.insert(all_facts.end(), traversal.facts.begin(), traversal.facts.end());
    }
    auto facts = dedupe_facts(all_facts);
    auto context = ContextBuilder::render(facts, state.detected_entities);

    update.trace.push_back("STEP 4: Context Building");
    update.trace.push_back("Unique facts collected: " + std::to_string(facts.size()));
    update.trace.push_back("Context preview:");

    std::istringstream lines(context);
    std::string line;
    for (size_t i = 0; i < config_.trace_context_lines && std::getline(lines, line); ++i) {
        update.trace.push_back("| " + line);
    }

    update.facts = std::move(facts);
    update.context = std::move(context);
    return update;
}

StageUpdate GraphRagPipeline::generate_answer(const PipelineState& state) const {
    StageUpdate update;
    update.trace.push_back("STEP 5: Answer Generation");

    if (state.context == kNoContextSentinel) {
        update.answer = kNoInformationAnswer;
        update.trace.push_back("No context available, skipping LLM");
        return update;
    }

    if (!generator_) {
        update.answer = "[LLM not available - showing raw context]\n\n" + state.context +
                        "\n\nSet " + std::string(KeyManager::kEnvKey) +
                        " environment variable to enable LLM responses.";
        update.trace.push_back("LLM not available (missing API key)");
        return update;
    }

    std::string prompt = build_prompt(state.context, state.question);
    update.prompt = prompt;
    try {
        update.answer = generator_->generate_text(prompt, config_.generation_timeout);
        update.generated = true;
        update.trace.push_back("LLM response generated successfully");
    } catch (const std::exception& e) {
        spdlog::error("Answer generation failed: {}", e.what());
        update.answer = std::string("Error generating response: ") + e.what() +
                        "\n\nRaw context:\n" + state.context;
        update.trace.push_back(std::string("LLM error: ") + e.what());
    } catch (...) {
        // TextGenerator is user-supplied; a non-std exception still degrades.
        spdlog::error("Answer generation failed with a non-standard exception");
        update.answer = "Error generating response: unknown error\n\nRaw context:\n" + state.context;
        update.trace.push_back("LLM error: unknown error");
    }
    return update;
}

std::string GraphRagPipeline::build_prompt(const std::string& context, const std::string& question) {
    return
        "You are a helpful assistant answering questions based on a knowledge graph.\n"
        "Use ONLY the provided context to answer. Be concise and direct.\n"
        "If the context doesn't contain enough information, say so.\n\n"
        "Context from knowledge graph:\n" + context + "\n\n"
        "Question: " + question + "\n\n"
        "Answer:";
}

} // namespace graph_rag

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "knowledge_graph.hpp"
#include "entity_recognizer.hpp"
#include "traversal_engine.hpp"
#include "context_builder.hpp"
#include "generation_service.hpp"

namespace graph_rag {

enum class PipelineStage { Detect, Retrieve, Traverse, BuildContext, Generate, Done };

std::string to_string(PipelineStage stage);

inline const std::string kNoInformationAnswer =
    "I couldn't find any relevant information in the knowledge graph to answer your question.";

struct PipelineConfig {
    int traversal_depth = 1;
    std::chrono::milliseconds generation_timeout{30000};
    size_t trace_fact_preview = 5;
    size_t trace_context_lines = 8;
    bool record_history = true;
};

struct MatchedNode {
    std::string node_id;
    Node node;
    std::string matched_entity;
};

struct TraceEntry {
    PipelineStage stage;
    std::string message;
};

struct PipelineState {
    std::string question;
    std::vector<EntityMention> detected_entities;
    std::vector<Relation> relationship_intents;
    std::vector<MatchedNode> matched_nodes;
    std::vector<TraversalResult> traversal_results;
    std::vector<Fact> facts;
    std::string context;
    std::string prompt;      // sent to the generator; empty when generation was skipped
    std::string answer;
    bool generated = false;  // answer came from the generator
    std::vector<TraceEntry> trace;  // append-only, stage order

    std::vector<std::string> trace_for(PipelineStage stage) const;
};

// Partial result of one stage. Unset fields leave the state untouched.
struct StageUpdate {
    std::optional<std::vector<EntityMention>> detected_entities;
    std::optional<std::vector<Relation>> relationship_intents;
    std::optional<std::vector<MatchedNode>> matched_nodes;
    std::optional<std::vector<TraversalResult>> traversal_results;
    std::optional<std::vector<Fact>> facts;
    std::optional<std::string> context;
    std::optional<std::string> prompt;
    std::optional<std::string> answer;
    std::optional<bool> generated;
    std::vector<std::string> trace;
};

// Detect -> Retrieve -> Traverse -> BuildContext -> Generate -> Done.
// run() is const and starts from a fresh state, so one instance can serve
// concurrent questions against the shared read-only graph.
class GraphRagPipeline {
public:
    GraphRagPipeline(std::shared_ptr<const KnowledgeGraph> graph,
                     std::shared_ptr<TextGenerator> generator = nullptr,
                     PipelineConfig config = {});

    PipelineState run(const std::string& question) const;

    StageUpdate execute(PipelineStage stage, const PipelineState& state) const;
    static void merge(PipelineState& state, PipelineStage stage, StageUpdate update);
    static PipelineStage next_stage(PipelineStage stage);

    static std::string build_prompt(const std::string& context, const std::string& question);

    bool generation_available() const { return generator_ != nullptr; }
    const PipelineConfig& config() const { return config_; }
    const KnowledgeGraph& graph() const { return *graph_; }

private:
    StageUpdate detect_entities(const PipelineState& state) const;
    StageUpdate retrieve_nodes(const PipelineState& state) const;
    StageUpdate traverse_relationships(const PipelineState& state) const;
    StageUpdate build_context(const PipelineState& state) const;
    StageUpdate generate_answer(const PipelineState& state) const;

    std::shared_ptr<const KnowledgeGraph> graph_;
    EntityRecognizer recognizer_;
    TraversalEngine traversal_;
    std::shared_ptr<TextGenerator> generator_;
    PipelineConfig config_;
};

} // namespace graph_rag

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "application/DocumentOrchestrator.hpp"
#include "domain/Errors.hpp"

using docgen::application::DocumentOrchestrator;
using docgen::domain::ChatRequest;
using docgen::domain::ChatResponse;
using docgen::domain::DocGenRequest;
using docgen::domain::FullRequest;
using docgen::domain::UpstreamError;

// Mock upstream: answers JSON-mode calls with m_structured and plain calls with a diagram body.
class MockChatService : public docgen::domain::ChatCompletionService {
public:
    explicit MockChatService(std::string structured) : m_structured(std::move(structured)) {}

    ChatResponse createChatCompletion(const ChatRequest& request,
                                      const docgen::infrastructure::CancellationToken*) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back(request);
        }

        ChatResponse response;
        response.id = "mock";
        if (m_emptyChoices) {
            return response;
        }
        docgen::domain::ChatChoice choice;
        choice.message.role = docgen::domain::ChatMessage::Role::Assistant;
        choice.message.content = request.responseFormat ? m_structured : "graph TD; A-->B";
        response.choices.push_back(choice);
        return response;
    }

    std::vector<ChatRequest> calls() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    int jsonCalls() {
        int n = 0;
        for (const auto& call : calls()) {
            if (call.responseFormat && *call.responseFormat == "json_object") ++n;
        }
        return n;
    }

    void setEmptyChoices(bool value) { m_emptyChoices = value; }

private:
    std::string m_structured;
    std::atomic<bool> m_emptyChoices{false};
    std::mutex m_mutex;
    std::vector<ChatRequest> m_calls;
};

namespace {

DocGenRequest SampleRequest() {
    DocGenRequest request;
    request.title = "Checkout latency";
    request.description = "p99 of checkout is above 2s";
    request.constraints = {"no new vendors", "ship in Q3"};
    return request;
}

DocumentOrchestrator MakeOrchestrator(const std::shared_ptr<MockChatService>& llm) {
    DocumentOrchestrator::Options options;
    options.defaultModel = "test/model";
    return DocumentOrchestrator(llm, options);
}

void TestFullBatchesStructuredAndFansOutDiagrams() {
    std::cout << "[Test] full request: one JSON call plus one call per diagram..." << std::endl;
    auto llm = std::make_shared<MockChatService>(R"({"summary_md":"# Summary","plan_md":"# Plan","diagrams":[{"code":"x"}]})");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    request.sections = {"exec_summary", "solution_plan", "mermaid_component"};
    auto document = orchestrator.generateFull(request);

    auto calls = llm->calls();
    assert(calls.size() == 2);
    assert(llm->jsonCalls() == 1);

    assert(document.section("summary_md") == std::optional<std::string>("# Summary"));
    assert(document.section("plan_md") == std::optional<std::string>("# Plan"));
    assert(document.sections.size() == 2);

    // Diagrams embedded in the batched answer are ignored in full mode.
    assert(document.diagrams.size() == 1);
    const auto& diagram = document.diagrams[0];
    assert(diagram.code == "graph TD; A-->B");
    assert(diagram.type == "component");
    assert(diagram.language == "mermaid");
    assert(diagram.section == "mermaid_component");
    assert(diagram.id.size() == 36);

    for (const auto& call : calls) {
        assert(call.model == "test/model");
        assert(call.messages.size() == 2);
        assert(call.messages[0].role == docgen::domain::ChatMessage::Role::System);
        const auto& user = call.messages[1].content;
        assert(user.find("Checkout latency") != std::string::npos);
        assert(user.find("p99 of checkout is above 2s") != std::string::npos);
        assert(user.find("ship in Q3") != std::string::npos);
    }
}

void TestMissingSectionsStayAbsent() {
    std::cout << "[Test] sections the upstream omits are absent..." << std::endl;
    auto llm = std::make_shared<MockChatService>(R"({"summary_md":"only this","risks_md":42})");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    request.base.model = std::string("override/model");
    request.sections = {"exec_summary", "solution_plan", "risks", "exec_summary"};
    auto document = orchestrator.generateFull(request);

    assert(llm->calls().size() == 1);
    assert(llm->calls()[0].model == "override/model");
    assert(document.section("summary_md").has_value());
    assert(!document.section("plan_md").has_value());
    assert(!document.section("risks_md").has_value());
    assert(document.diagrams.empty());
}

void TestDefaultSectionSet() {
    std::cout << "[Test] empty section list selects the default set..." << std::endl;
    auto llm = std::make_shared<MockChatService>(R"({"summary_md":"s"})");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    auto document = orchestrator.generateFull(request);

    assert(llm->jsonCalls() == 1);
    assert(llm->calls().size() == 2);
    assert(document.diagrams.size() == 1);
    assert(document.diagrams[0].section == "mermaid_component");

    auto resolved = DocumentOrchestrator::ResolveSections({});
    assert(resolved.size() == 6);
}

void TestDiagramOnlyRequestMakesNoJsonCall() {
    std::cout << "[Test] diagram-only request skips the structured call..." << std::endl;
    auto llm = std::make_shared<MockChatService>("{}");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    request.sections = {"mermaid_sequence", "mermaid_deployment"};
    auto document = orchestrator.generateFull(request);

    assert(llm->jsonCalls() == 0);
    assert(llm->calls().size() == 2);
    assert(document.diagrams.size() == 2);
    assert(document.diagrams[0].type == "sequence");
    assert(document.diagrams[1].type == "deployment");
    assert(document.diagrams[0].id != document.diagrams[1].id);
    assert(document.sections.empty());
}

void TestUnknownSectionRejectedBeforeAnyCall() {
    std::cout << "[Test] unknown section id is an invalid request..." << std::endl;
    auto llm = std::make_shared<MockChatService>("{}");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    request.sections = {"exec_summary", "haiku"};
    bool threw = false;
    try {
        orchestrator.generateFull(request);
    } catch (const docgen::domain::InvalidRequest&) {
        threw = true;
    }
    assert(threw);
    assert(llm->calls().empty());

    threw = false;
    try {
        orchestrator.generateSection(SampleRequest(), "haiku");
    } catch (const docgen::domain::InvalidRequest&) {
        threw = true;
    }
    assert(threw);
}

void TestNonJsonContentIsParseError() {
    std::cout << "[Test] non-JSON structured content is an upstream parse error..." << std::endl;
    auto llm = std::make_shared<MockChatService>("Sure! Here is your summary.");
    auto orchestrator = MakeOrchestrator(llm);

    try {
        orchestrator.generateSection(SampleRequest(), "exec_summary");
        assert(false && "expected UpstreamError");
    } catch (const UpstreamError& e) {
        assert(e.kind() == UpstreamError::Kind::Parse);
        assert(e.rawBody() == "Sure! Here is your summary.");
    }
}

void TestFencedJsonAccepted() {
    std::cout << "[Test] fenced JSON content is accepted..." << std::endl;
    auto llm = std::make_shared<MockChatService>("```json\n{\"plan_md\":\"# Plan\"}\n```");
    auto orchestrator = MakeOrchestrator(llm);
    auto document = orchestrator.generateSection(SampleRequest(), "solution_plan");
    assert(document.section("plan_md") == std::optional<std::string>("# Plan"));
}

void TestCodeFencesInsideValues() {
    std::cout << "[Test] code fences inside section values survive parsing..." << std::endl;
    auto llm = std::make_shared<MockChatService>(
        "{\n"
        "  \"data_model_md\": \"Schema:\\n```sql\\nCREATE TABLE items (id INT);\\n```\",\n"
        "  \"api_md\": \"Call:\\n```http\\nGET /v1/items\\n```\"\n"
        "}");
    auto orchestrator = MakeOrchestrator(llm);

    FullRequest request;
    request.base = SampleRequest();
    request.sections = {"data_model", "api_design"};
    auto document = orchestrator.generateFull(request);

    assert(llm->jsonCalls() == 1);
    assert(document.section("data_model_md") ==
           std::optional<std::string>("Schema:\n```sql\nCREATE TABLE items (id INT);\n```"));
    assert(document.section("api_md") == std::optional<std::string>("Call:\n```http\nGET /v1/items\n```"));
}

void TestDesignKeepsEmbeddedDiagrams() {
    std::cout << "[Test] design section returns its embedded diagrams..." << std::endl;
    auto llm = std::make_shared<MockChatService>(
        R"({"design_md":"# Design","diagrams":[{"id":"d1","type":"component","language":"mermaid","title":"Overview","code":"graph LR; A-->B"}]})");
    auto orchestrator = MakeOrchestrator(llm);

    auto document = orchestrator.generateSection(SampleRequest(), "architecture_overview");
    assert(llm->calls().size() == 1);
    assert(llm->jsonCalls() == 1);
    assert(document.section("design_md") == std::optional<std::string>("# Design"));
    assert(document.diagrams.size() == 1);
    assert(document.diagrams[0].id == "d1");
    assert(document.diagrams[0].title == std::optional<std::string>("Overview"));
    assert(document.diagrams[0].code == "graph LR; A-->B");
}

void TestEmptyChoices() {
    std::cout << "[Test] response without choices is reported..." << std::endl;
    auto llm = std::make_shared<MockChatService>("{}");
    llm->setEmptyChoices(true);
    auto orchestrator = MakeOrchestrator(llm);
    try {
        orchestrator.generateSection(SampleRequest(), "exec_summary");
        assert(false && "expected UpstreamError");
    } catch (const UpstreamError& e) {
        assert(e.kind() == UpstreamError::Kind::EmptyResponse);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentOrchestrator tests..." << std::endl;

    TestFullBatchesStructuredAndFansOutDiagrams();
    TestMissingSectionsStayAbsent();
    TestDefaultSectionSet();
    TestDiagramOnlyRequestMakesNoJsonCall();
    TestUnknownSectionRejectedBeforeAnyCall();
    TestNonJsonContentIsParseError();
    TestFencedJsonAccepted();
    TestCodeFencesInsideValues();
    TestDesignKeepsEmbeddedDiagrams();
    TestEmptyChoices();

    std::cout << "[PASS] DocumentOrchestrator tests passed." << std::endl;
    return 0;
}

#include <catch2/catch_test_macros.hpp>
#include "audit/security_event_emitter.hpp"
#include "context/context_assembler.hpp"
#include "core/error.hpp"
#include "mocks/mock_document_resolver.hpp"
#include "mocks/mock_event_sink.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <vector>

using namespace docgate;
using namespace docgate::testing;

namespace {

std::string doc_with(const std::string& sensitivity,
                     const std::vector<std::string>& context = {},
                     const std::string& body = "Body") {
    std::string out = "---\n";
    if (!sensitivity.empty()) {
        out += std::format("sensitivity: {}\n", sensitivity);
    }
    if (!context.empty()) {
        out += "context_documents:\n";
        for (const auto& c : context) {
            out += std::format("  - {}\n", c);
        }
    }
    out += "---\n" + body + "\n";
    return out;
}

std::vector<std::string> admitted_paths(const ContextAssemblyResult& r) {
    std::vector<std::string> out;
    for (const auto& d : r.admitted_context_documents) out.push_back(d.path);
    return out;
}

bool has_warning(const ContextAssemblyResult& r, const std::string& needle) {
    return std::any_of(r.warnings.begin(), r.warnings.end(),
        [&needle](const std::string& w) { return w.find(needle) != std::string::npos; });
}

constexpr SensitivityLevel kLevels[] = {
    SensitivityLevel::PUBLIC, SensitivityLevel::INTERNAL,
    SensitivityLevel::CONFIDENTIAL, SensitivityLevel::RESTRICTED,
};

} // anonymous namespace

// ============================================================================
// Admission
// ============================================================================

TEST_CASE("ContextAssembler: admits lower or equal sensitivity in declared order", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("plan.md", doc_with("confidential", {"public.md", "internal.md", "peer.md"}));
    resolver->add("public.md", doc_with("public"));
    resolver->add("internal.md", doc_with("internal"));
    resolver->add("peer.md", doc_with("confidential"));

    ContextAssembler assembler(resolver);
    const auto r = assembler.assemble("plan.md");

    CHECK(r.primary_document.metadata.sensitivity == SensitivityLevel::CONFIDENTIAL);
    CHECK(admitted_paths(r) == std::vector<std::string>{"public.md", "internal.md", "peer.md"});
    CHECK(r.rejected_contexts.empty());
    CHECK(r.warnings.empty());
}

TEST_CASE("ContextAssembler: results follow declaration order, not completion order", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("plan.md", doc_with("confidential", {"slow.md", "secret.md", "medium.md", "fast.md"}));
    resolver->add("slow.md", doc_with("public"));
    resolver->add("secret.md", doc_with("restricted"));
    resolver->add("medium.md", doc_with("internal"));
    resolver->add("fast.md", doc_with("confidential"));
    resolver->set_delay("slow.md", std::chrono::milliseconds(150));
    resolver->set_delay("secret.md", std::chrono::milliseconds(100));
    resolver->set_delay("medium.md", std::chrono::milliseconds(50));

    ContextAssembler assembler(resolver);
    const auto r = assembler.assemble("plan.md");

    // Context reads ran concurrently: the undelayed one finished first
    const auto order = resolver->read_order();
    REQUIRE(order.size() == 5);
    CHECK(order.front() == "plan.md");
    CHECK(order[1] == "fast.md");
    CHECK(order.back() == "slow.md");

    CHECK(admitted_paths(r) == std::vector<std::string>{"slow.md", "medium.md", "fast.md"});
    REQUIRE(r.rejected_contexts.size() == 1);
    CHECK(r.rejected_contexts[0].path == "secret.md");
}

TEST_CASE("ContextAssembler: higher sensitivity context is rejected", "[context][security]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("memo.md", doc_with("internal", {"salaries.md", "faq.md"}));
    resolver->add("salaries.md", doc_with("restricted"));
    resolver->add("faq.md", doc_with("public"));

    ContextAssembler assembler(resolver);
    const auto r = assembler.assemble("memo.md");

    CHECK(admitted_paths(r) == std::vector<std::string>{"faq.md"});
    REQUIRE(r.rejected_contexts.size() == 1);
    CHECK(r.rejected_contexts[0].path == "salaries.md");
    CHECK(r.rejected_contexts[0].reason ==
          "Sensitivity violation: internal primary document cannot access restricted context document");
    CHECK(has_warning(r, "SECURITY: Sensitivity violation"));
}

TEST_CASE("ContextAssembler: every level pair follows rank order", "[context][security]") {
    for (const auto primary : kLevels) {
        for (const auto context : kLevels) {
            auto resolver = std::make_shared<MockDocumentResolver>();
            resolver->add("p.md", doc_with(sensitivity_to_string(primary), {"c.md"}));
            resolver->add("c.md", doc_with(sensitivity_to_string(context)));

            const auto r = ContextAssembler(resolver).assemble("p.md");
            const bool expected = sensitivity_rank(context) <= sensitivity_rank(primary);

            INFO(std::format("{} -> {}", sensitivity_to_string(primary), sensitivity_to_string(context)));
            CHECK((r.admitted_context_documents.size() == 1) == expected);
            CHECK((r.rejected_contexts.size() == 1) == !expected);
            CHECK(ContextAssembler::can_access(primary, context) == expected);
        }
    }
}

TEST_CASE("ContextAssembler: sensitivity helpers", "[context]") {
    CHECK(ContextAssembler::sensitivity_level(SensitivityLevel::PUBLIC) == 0);
    CHECK(ContextAssembler::sensitivity_level(SensitivityLevel::RESTRICTED) == 3);
    CHECK(ContextAssembler::is_higher_sensitivity(SensitivityLevel::CONFIDENTIAL,
                                                  SensitivityLevel::INTERNAL));
    CHECK_FALSE(ContextAssembler::is_higher_sensitivity(SensitivityLevel::PUBLIC,
                                                        SensitivityLevel::PUBLIC));
}

TEST_CASE("ContextAssembler: missing sensitivity defaults to internal", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("confidential", {"c.md"}));
    resolver->add("c.md", "No metadata at all\n");

    const auto r = ContextAssembler(resolver).assemble("p.md");
    REQUIRE(r.admitted_context_documents.size() == 1);
    CHECK(r.admitted_context_documents[0].metadata.sensitivity == SensitivityLevel::INTERNAL);
}

// ============================================================================
// Failures and rejections
// ============================================================================

TEST_CASE("ContextAssembler: missing primary throws DocumentNotFound", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    ContextAssembler assembler(resolver);

    CHECK_THROWS_AS(assembler.assemble("ghost.md"), DocumentNotFound);
}

TEST_CASE("ContextAssembler: unreadable primary throws DocumentNotFound", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add_unreadable("locked.md");

    CHECK_THROWS_AS(ContextAssembler(resolver).assemble("locked.md"), DocumentNotFound);
}

TEST_CASE("ContextAssembler: missing context document is a soft rejection", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("internal", {"gone.md", "here.md"}));
    resolver->add("here.md", doc_with("internal"));

    const auto r = ContextAssembler(resolver).assemble("p.md");
    CHECK(admitted_paths(r) == std::vector<std::string>{"here.md"});
    REQUIRE(r.rejected_contexts.size() == 1);
    CHECK(r.rejected_contexts[0].path == "gone.md");
    CHECK(r.rejected_contexts[0].reason == "Document not found or invalid");
    CHECK(has_warning(r, "Context document not found: gone.md"));
}

TEST_CASE("ContextAssembler: circular references are rejected", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("a.md", doc_with("internal", {"b.md", "./a.md", "b.md"}));
    resolver->add("b.md", doc_with("internal", {"a.md"}));

    const auto r = ContextAssembler(resolver).assemble("a.md");
    CHECK(admitted_paths(r) == std::vector<std::string>{"b.md"});
    REQUIRE(r.rejected_contexts.size() == 2);
    CHECK(r.rejected_contexts[0].path == "./a.md");
    CHECK(r.rejected_contexts[0].reason == "Circular reference");
    CHECK(r.rejected_contexts[1].path == "b.md");
    CHECK(has_warning(r, "Circular reference detected: ./a.md"));
}

TEST_CASE("ContextAssembler: circular references allowed when configured", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("a.md", doc_with("internal", {"b.md", "a.md"}));
    resolver->add("b.md", doc_with("internal"));

    AssemblyOptions opts;
    opts.allow_circular_references = true;
    const auto r = ContextAssembler(resolver).assemble("a.md", opts);

    CHECK(admitted_paths(r) == std::vector<std::string>{"b.md", "a.md"});
    CHECK(r.rejected_contexts.empty());
}

TEST_CASE("ContextAssembler: context list is truncated to the cap", "[context]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    std::vector<std::string> declared;
    for (int i = 0; i < 12; ++i) {
        const std::string name = std::format("c{}.md", i);
        declared.push_back(name);
        resolver->add(name, doc_with("public"));
    }
    resolver->add("p.md", doc_with("internal", declared));

    const auto r = ContextAssembler(resolver).assemble("p.md");
    CHECK(r.admitted_context_documents.size() == 10);
    CHECK(has_warning(r, "Context documents limited to 10 (12 specified)"));
    CHECK(r.admitted_context_documents.back().path == "c9.md");

    AssemblyOptions opts;
    opts.max_context_documents = 3;
    CHECK(ContextAssembler(resolver).assemble("p.md", opts).admitted_context_documents.size() == 3);
}

// ============================================================================
// Metadata validation
// ============================================================================

TEST_CASE("ContextAssembler: invalid context sensitivity fails closed", "[context][validation]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("confidential", {"bad.md"}));
    resolver->add("bad.md", doc_with("secretish"));

    const auto r = ContextAssembler(resolver).assemble("p.md");
    CHECK(r.admitted_context_documents.empty());
    REQUIRE(r.rejected_contexts.size() == 1);
    CHECK(r.rejected_contexts[0].reason.starts_with("Sensitivity violation"));
    CHECK(has_warning(r, "Context document has invalid frontmatter: bad.md - Invalid sensitivity level"));
}

TEST_CASE("ContextAssembler: invalid context rejected under fail_on_validation_error", "[context][validation]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("restricted", {"bad.md"}));
    resolver->add("bad.md", doc_with("secretish"));

    AssemblyOptions opts;
    opts.fail_on_validation_error = true;
    const auto r = ContextAssembler(resolver).assemble("p.md", opts);

    REQUIRE(r.rejected_contexts.size() == 1);
    CHECK(r.rejected_contexts[0].reason.starts_with("Invalid frontmatter: Invalid sensitivity level"));
}

TEST_CASE("ContextAssembler: invalid primary metadata", "[context][validation]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("everyone", {"c.md"}));
    resolver->add("c.md", doc_with("internal"));

    SECTION("warns and treats the primary as public") {
        const auto r = ContextAssembler(resolver).assemble("p.md");
        CHECK(has_warning(r, "Primary document has invalid frontmatter: Invalid sensitivity level"));
        CHECK(r.admitted_context_documents.empty());
        REQUIRE(r.rejected_contexts.size() == 1);
        CHECK(r.rejected_contexts[0].reason ==
              "Sensitivity violation: public primary document cannot access internal context document");
    }

    SECTION("throws with fail_on_validation_error") {
        AssemblyOptions opts;
        opts.fail_on_validation_error = true;
        CHECK_THROWS_AS(ContextAssembler(resolver).assemble("p.md", opts), MetadataValidationError);
    }
}

TEST_CASE("ContextAssembler: strict sensitivity requires the field", "[context][validation]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("p.md", doc_with("confidential", {"c.md"}));
    resolver->add("c.md", "---\ntitle: Untagged\n---\nBody\n");

    AssemblyOptions opts;
    opts.strict_sensitivity = true;
    const auto r = ContextAssembler(resolver).assemble("p.md", opts);

    CHECK(r.admitted_context_documents.empty());
    CHECK(has_warning(r, "Missing required field: sensitivity"));

    Document doc;
    CHECK(ContextAssembler::validate_metadata(doc, true) ==
          std::vector<std::string>{"Missing required field: sensitivity"});
    CHECK(ContextAssembler::validate_metadata(doc, false).empty());
}

// ============================================================================
// Events
// ============================================================================

TEST_CASE("ContextAssembler: emits access-denied and assembled events", "[context][events]") {
    auto resolver = std::make_shared<MockDocumentResolver>();
    resolver->add("memo.md", doc_with("public", {"hr.md"}));
    resolver->add("hr.md", doc_with("restricted"));

    auto recording = std::make_shared<MockEventSink::Recording>();
    auto events = std::make_shared<SecurityEventEmitter>();
    events->add_sink(std::make_unique<MockEventSink>(recording));

    AssemblyOptions opts;
    opts.requested_by = "alice";
    const auto r = ContextAssembler(resolver, events).assemble("memo.md", opts);
    REQUIRE(r.rejected_contexts.size() == 1);

    REQUIRE(recording->events.size() == 2);
    const auto& denied = recording->events[0];
    CHECK(denied.event_type == SecurityEventType::CONTEXT_ACCESS_DENIED);
    CHECK(denied.severity == EventSeverity::WARNING);
    CHECK(denied.requesting_identity == "alice");
    CHECK(denied.resource == "hr.md");
    CHECK(recording->events[1].event_type == SecurityEventType::CONTEXT_ASSEMBLED);
}

TEST_CASE("ContextAssembler: null resolver is rejected", "[context]") {
    CHECK_THROWS_AS(ContextAssembler(nullptr), DocgateError);
}

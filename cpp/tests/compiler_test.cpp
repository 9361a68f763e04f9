#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "vb9/compiler/incremental.hpp"
#include "vb9/compiler/kernel.hpp"
#include "vb9/compiler/manifest.hpp"
#include "vb9/compiler/proof.hpp"
#include "vb9/core/hashing.hpp"
#include "vb9/logic/kb.hpp"
#include "vb9/ns/namespace.hpp"
#include "vb9/sexp/parser.hpp"

namespace {
    constexpr const char* kWidget = "(widget (button ok) (textbox name))";

    vb9::sexp::ExprPtr parse_ok(const char* src) {
        vb9::sexp::ExprPtr out;
        EXPECT_TRUE(vb9::core::is_ok(vb9::sexp::parse(src, &out))) << src;
        return out;
    }

    size_t count_events(const vb9::ns::Namespace& ns, std::string_view kind, size_t since = 0) {
        const auto events = ns.events_since(since);
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                                 [kind](const vb9::ns::Event& e) { return e.kind == kind; }));
    }

    std::vector<std::string> symbols_of(const std::vector<vb9::compiler::KernelMeta>& kernels) {
        std::vector<std::string> out;
        for (const auto& k : kernels) {
            out.push_back(k.symbol);
        }
        return out;
    }

    class CompilerFixture : public ::testing::Test {
    protected:
        vb9::ns::Namespace ns;
        vb9::logic::KnowledgeBase kb = vb9::logic::example_build_kb();
        vb9::compiler::IncrementalCompiler compiler{ns, kb};

        std::vector<vb9::compiler::KernelMeta> compile(const char* src) {
            std::vector<vb9::compiler::KernelMeta> out;
            const vb9::core::Status s = compiler.compile(*parse_ok(src), &out);
            EXPECT_TRUE(vb9::core::is_ok(s));
            return out;
        }
    };
} // namespace

TEST(CompilerKernel, ExtractSymbolsInOrder) {
    const std::vector<std::string> expected = {"widget", "button", "ok", "textbox", "name"};
    EXPECT_EQ(vb9::compiler::extract_symbols(*parse_ok(kWidget)), expected);
}

TEST(CompilerKernel, ExtractSkipsNumbersAndDuplicates) {
    const std::vector<std::string> expected = {"scale", "x", "label"};
    EXPECT_EQ(vb9::compiler::extract_symbols(*parse_ok("(scale 2 1.5 x (x \"label\" scale))")), expected);
}

TEST(CompilerKernel, KernelForSymbolIsPure) {
    vb9::compiler::KernelMeta a;
    vb9::compiler::KernelMeta b;
    ASSERT_TRUE(vb9::core::is_ok(vb9::compiler::kernel_for_symbol("button", &a)));
    ASSERT_TRUE(vb9::core::is_ok(vb9::compiler::kernel_for_symbol("button", &b)));
    EXPECT_EQ(a.hash, b.hash);
    EXPECT_EQ(a.bytecode, b.bytecode);
    EXPECT_EQ(a.kernel, "button");
    EXPECT_TRUE(a.changed);

    vb9::core::Hash128 expected{};
    ASSERT_TRUE(vb9::core::is_ok(vb9::core::hash_text("button", &expected)));
    EXPECT_EQ(a.hash, expected);

    const std::string code(a.bytecode.begin(), a.bytecode.end());
    EXPECT_EQ(code, "BYTECODE(button:" + vb9::core::hash_to_hex(expected) + ")");

    EXPECT_EQ(vb9::compiler::kernel_for_symbol("x", nullptr).code, vb9::core::StatusCode::Invalid);
}

TEST(CompilerKernel, KernelPath) {
    EXPECT_EQ(vb9::compiler::kernel_path("/form", "button"), "/form/button.kernel");
    EXPECT_EQ(vb9::compiler::kernel_path("/form/", "ok"), "/form/ok.kernel");
}

TEST(CompilerProof, WidgetEdges) {
    const auto tree = vb9::compiler::derive_proof_tree(*parse_ok(kWidget));
    ASSERT_EQ(tree.size(), 3u);
    EXPECT_TRUE(tree[0].node->is_symbol("widget"));
    ASSERT_EQ(tree[0].deps.size(), 2u);
    EXPECT_TRUE(tree[0].deps[0]->is_symbol("button"));
    EXPECT_TRUE(tree[0].deps[1]->is_symbol("textbox"));
    EXPECT_TRUE(tree[1].node->is_symbol("button"));
    EXPECT_TRUE(tree[2].node->is_symbol("textbox"));

    const nlohmann::json j = nlohmann::json::parse(vb9::compiler::proof_tree_json(tree));
    EXPECT_EQ(j[0], nlohmann::json::parse(R"({"node":"widget","deps":["button","textbox"]})"));
    EXPECT_EQ(j[1]["deps"], nlohmann::json::parse(R"(["ok"])"));
}

TEST(CompilerProof, DuplicateEdgesCollapse) {
    const auto tree = vb9::compiler::derive_proof_tree(*parse_ok("(a (b c) (b c) (d (b c)))"));
    ASSERT_EQ(tree.size(), 3u);
    EXPECT_TRUE(tree[0].node->is_symbol("a"));
    EXPECT_TRUE(tree[1].node->is_symbol("b"));
    EXPECT_TRUE(tree[2].node->is_symbol("d"));
}

TEST(CompilerProof, NumbersStayNumbersInJson) {
    const auto tree = vb9::compiler::derive_proof_tree(*parse_ok("(pad 4 2.5 \"x\")"));
    const nlohmann::json j = nlohmann::json::parse(vb9::compiler::proof_tree_json(tree));
    ASSERT_EQ(j[0]["deps"].size(), 3u);
    EXPECT_TRUE(j[0]["deps"][0].is_number_integer());
    EXPECT_EQ(j[0]["deps"][0].get<int>(), 4);
    EXPECT_TRUE(j[0]["deps"][1].is_number_float());
    EXPECT_EQ(j[0]["deps"][2].get<std::string>(), "x");
}

TEST(CompilerProof, AtomHasNoEdges) {
    EXPECT_TRUE(vb9::compiler::derive_proof_tree(*parse_ok("solo")).empty());
    EXPECT_TRUE(vb9::compiler::derive_proof_tree(*parse_ok("()")).empty());
}

TEST(CompilerManifest, PreviousHashesTolerateBadInput) {
    EXPECT_TRUE(vb9::compiler::manifest_previous_hashes("").empty());
    EXPECT_TRUE(vb9::compiler::manifest_previous_hashes("{not json").empty());
    EXPECT_TRUE(vb9::compiler::manifest_previous_hashes("[1,2,3]").empty());
    EXPECT_TRUE(vb9::compiler::manifest_previous_hashes(R"({"kernels": 5})").empty());

    const auto partial = vb9::compiler::manifest_previous_hashes(R"({"kernels": [
        {"symbol": "good", "hash": "af1349b9f5f9a1a6a0404dea36dcc949"},
        {"symbol": "short", "hash": "af13"},
        {"symbol": 7, "hash": "af1349b9f5f9a1a6a0404dea36dcc949"},
        "junk"
    ]})");
    ASSERT_EQ(partial.size(), 1u);
    EXPECT_EQ(vb9::core::hash_to_hex(partial.at("good")), "af1349b9f5f9a1a6a0404dea36dcc949");
}

TEST(CompilerManifest, SealCoversProofTree) {
    vb9::compiler::Manifest m;
    m.proof_tree = vb9::compiler::derive_proof_tree(*parse_ok(kWidget));
    ASSERT_TRUE(vb9::core::is_ok(vb9::compiler::manifest_seal(&m)));

    vb9::core::Hash128 expected{};
    ASSERT_TRUE(vb9::core::is_ok(vb9::core::hash_text(vb9::compiler::proof_tree_json(m.proof_tree), &expected)));
    EXPECT_EQ(m.proof_hash, expected);
    EXPECT_EQ(vb9::compiler::manifest_seal(nullptr).code, vb9::core::StatusCode::Invalid);
}

TEST_F(CompilerFixture, WidgetEndToEnd) {
    const auto kernels = compile(kWidget);
    const std::vector<std::string> expected = {"widget", "button", "ok", "textbox", "name"};
    EXPECT_EQ(symbols_of(kernels), expected);
    for (const auto& k : kernels) {
        EXPECT_TRUE(k.changed) << k.symbol;
        const auto stored = ns.read(vb9::compiler::kernel_path("/form", k.kernel));
        ASSERT_TRUE(stored.has_value()) << k.symbol;
        EXPECT_EQ(std::get<vb9::ns::Blob>(*stored), k.bytecode);
    }
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventEmit), 5u);
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventSkip), 0u);
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventManifest), 1u);
    EXPECT_EQ(compiler.cache_size(), 5u);

    const auto text = ns.read_text("/form/manifest.json");
    ASSERT_TRUE(text.has_value());
    const nlohmann::json m = nlohmann::json::parse(*text);
    ASSERT_EQ(m["kernels"].size(), 5u);
    EXPECT_EQ(m["kernels"][0]["symbol"].get<std::string>(), "widget");
    EXPECT_EQ(m["kernels"][0]["kernel"].get<std::string>(), "widget");
    EXPECT_TRUE(m["kernels"][0]["changed"].get<bool>());
    EXPECT_EQ(m["kernels"][0]["hash"].get<std::string>().size(), 32u);
    EXPECT_EQ(m["proof_tree"][0], nlohmann::json::parse(R"({"node":"widget","deps":["button","textbox"]})"));
    EXPECT_EQ(m["proof_hash"].get<std::string>(), vb9::core::hash_to_hex(compiler.last_manifest().proof_hash));

    // Keys are written in a fixed order.
    EXPECT_LT(text->find("\"kernels\""), text->find("\"proof_tree\""));
    EXPECT_LT(text->find("\"proof_tree\""), text->find("\"proof_hash\""));
}

TEST_F(CompilerFixture, RecompileIsCachedAndUnchanged) {
    (void)compile(kWidget);
    const size_t mark = ns.event_count();
    const std::string first_manifest = *ns.read_text("/form/manifest.json");

    const auto again = compile(kWidget);
    ASSERT_EQ(again.size(), 5u);
    for (const auto& k : again) {
        EXPECT_FALSE(k.changed) << k.symbol;
    }
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventEmit, mark), 0u);
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventSkip, mark), 5u);

    const nlohmann::json a = nlohmann::json::parse(first_manifest);
    const nlohmann::json b = nlohmann::json::parse(*ns.read_text("/form/manifest.json"));
    EXPECT_EQ(a["proof_hash"].get<std::string>(), b["proof_hash"].get<std::string>());
}

TEST_F(CompilerFixture, OnlyNewSymbolsChange) {
    (void)compile(kWidget);
    const size_t mark = ns.event_count();
    const auto kernels = compile("(widget (button ok) (slider level))");
    for (const auto& k : kernels) {
        const bool fresh = k.symbol == "slider" || k.symbol == "level";
        EXPECT_EQ(k.changed, fresh) << k.symbol;
    }
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventEmit, mark), 2u);
}

TEST_F(CompilerFixture, SelfHealsOverwrittenKernel) {
    (void)compile(kWidget);
    ns.write("/form/button.kernel", std::string("clobbered"));
    const size_t mark = ns.event_count();

    (void)compile(kWidget);
    const auto events = ns.events_since(mark);
    std::vector<std::string> emitted;
    for (const auto& e : events) {
        if (e.kind == vb9::compiler::kEventEmit) {
            emitted.push_back(e.detail);
        }
    }
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0], "button");

    const auto stored = ns.read("/form/button.kernel");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(std::holds_alternative<vb9::ns::Blob>(*stored));
}

TEST_F(CompilerFixture, ChangeLabelIgnoresReemission) {
    const auto first = compile(kWidget);
    EXPECT_STREQ(vb9::compiler::change_label(first.front()), "changed");

    ns.write("/form/button.kernel", std::string("clobbered"));
    const auto healed = compile(kWidget);
    const auto button = std::find_if(healed.begin(), healed.end(),
                                     [](const vb9::compiler::KernelMeta& k) { return k.symbol == "button"; });
    ASSERT_NE(button, healed.end());
    EXPECT_FALSE(button->changed);
    EXPECT_STREQ(vb9::compiler::change_label(*button), "unchanged");
}

TEST_F(CompilerFixture, SelfHealsDeletedCacheEntry) {
    (void)compile(kWidget);
    compiler.clear_cache();
    const size_t mark = ns.event_count();
    const auto kernels = compile(kWidget);
    EXPECT_EQ(count_events(ns, vb9::compiler::kEventEmit, mark), 5u);
    // The manifest still matches, so nothing counts as changed.
    for (const auto& k : kernels) {
        EXPECT_FALSE(k.changed);
    }
}

TEST_F(CompilerFixture, FreshCompilerUsesPersistedManifest) {
    (void)compile(kWidget);
    vb9::compiler::IncrementalCompiler other(ns, kb);
    std::vector<vb9::compiler::KernelMeta> out;
    ASSERT_TRUE(vb9::core::is_ok(other.compile(*parse_ok(kWidget), &out)));
    for (const auto& k : out) {
        EXPECT_FALSE(k.changed) << k.symbol;
    }
}

TEST_F(CompilerFixture, MalformedManifestTreatedAsAbsent) {
    ns.write("/form/manifest.json", std::string("{this is not json"));
    const auto kernels = compile(kWidget);
    ASSERT_EQ(kernels.size(), 5u);
    for (const auto& k : kernels) {
        EXPECT_TRUE(k.changed);
    }
    EXPECT_NO_THROW((void)nlohmann::json::parse(*ns.read_text("/form/manifest.json")));
}

TEST_F(CompilerFixture, ProofGoalsReachResolver) {
    (void)compile(kWidget);
    // One goal per edge, memoized as failed: none of these has a build rule.
    EXPECT_GE(kb.memo_size(), 3u);
    EXPECT_FALSE(kb.prove({"build", "widget"}));
}

TEST_F(CompilerFixture, InvalidWhenOutNull) {
    EXPECT_EQ(compiler.compile(*parse_ok(kWidget), nullptr).code, vb9::core::StatusCode::Invalid);
}

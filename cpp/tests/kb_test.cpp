#include <gtest/gtest.h>

#include "vb9/logic/kb.hpp"

TEST(KnowledgeBase, FactsProve) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"bootstrap", "gcc"});
    EXPECT_TRUE(kb.is_fact({"bootstrap", "gcc"}));
    EXPECT_TRUE(kb.prove({"bootstrap", "gcc"}));
    EXPECT_FALSE(kb.prove({"bootstrap", "clang"}));
}

TEST(KnowledgeBase, RuleChainsToFact) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"bootstrap", "gcc"});
    kb.add_rule("build", [](const vb9::logic::Goal& g) -> vb9::logic::Alternatives {
        if (g.size() == 2 && g[1] == "libc") {
            return {vb9::logic::Conjunction{vb9::logic::Goal{"bootstrap", "gcc"}}};
        }
        return {};
    });
    EXPECT_TRUE(kb.prove({"build", "libc"}));
    EXPECT_FALSE(kb.prove({"build", "unknown"}));
}

TEST(KnowledgeBase, FailureIsMemoized) {
    vb9::logic::KnowledgeBase kb;
    int calls = 0;
    kb.add_rule("build", [&calls](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        ++calls;
        return {};
    });

    EXPECT_FALSE(kb.prove({"build", "unknown"}));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(kb.prove({"build", "unknown"}));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(kb.memo_size(), 1u);

    kb.clear_memo();
    EXPECT_FALSE(kb.prove({"build", "unknown"}));
    EXPECT_EQ(calls, 2);
}

TEST(KnowledgeBase, AlternativesAreOred) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"have", "b"});
    kb.add_rule("need", [](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        return {
            vb9::logic::Conjunction{vb9::logic::Goal{"have", "a"}},
            vb9::logic::Conjunction{vb9::logic::Goal{"have", "b"}},
        };
    });
    EXPECT_TRUE(kb.prove({"need", "x"}));
}

TEST(KnowledgeBase, ConjunctionNeedsAll) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"have", "a"});
    kb.add_rule("need", [](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        return {vb9::logic::Conjunction{vb9::logic::Goal{"have", "a"}, vb9::logic::Goal{"have", "b"}}};
    });
    EXPECT_FALSE(kb.prove({"need", "x"}));
}

TEST(KnowledgeBase, EmptyConjunctionHolds) {
    vb9::logic::KnowledgeBase kb;
    kb.add_rule("always", [](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        return {vb9::logic::Conjunction{}};
    });
    EXPECT_TRUE(kb.prove({"always"}));
}

TEST(KnowledgeBase, CyclicRulesTerminate) {
    vb9::logic::KnowledgeBase kb;
    kb.add_rule("dep", [](const vb9::logic::Goal& g) -> vb9::logic::Alternatives {
        if (g.size() != 2) {
            return {};
        }
        const std::string next = g[1] == "a" ? "b" : "a";
        return {vb9::logic::Conjunction{vb9::logic::Goal{"dep", next}}};
    });
    EXPECT_FALSE(kb.prove({"dep", "a"}));
    EXPECT_FALSE(kb.prove({"dep", "b"}));
}

TEST(KnowledgeBase, CycleWithEscapeStillProves) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"base", "x"});
    kb.add_rule("reach", [](const vb9::logic::Goal& g) -> vb9::logic::Alternatives {
        return {
            vb9::logic::Conjunction{vb9::logic::Goal{"reach", g[1]}},
            vb9::logic::Conjunction{vb9::logic::Goal{"base", g[1]}},
        };
    });
    EXPECT_TRUE(kb.prove({"reach", "x"}));
}

TEST(KnowledgeBase, CycleCutFailureNotMemoized) {
    vb9::logic::KnowledgeBase kb;
    kb.add_fact({"c"});
    kb.add_rule("a", [](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        return {
            vb9::logic::Conjunction{vb9::logic::Goal{"b"}},
            vb9::logic::Conjunction{vb9::logic::Goal{"c"}},
        };
    });
    kb.add_rule("b", [](const vb9::logic::Goal&) -> vb9::logic::Alternatives {
        return {vb9::logic::Conjunction{vb9::logic::Goal{"a"}}};
    });

    vb9::logic::KnowledgeBase fresh = kb;
    EXPECT_TRUE(fresh.prove({"b"}));

    EXPECT_TRUE(kb.prove({"a"}));
    EXPECT_TRUE(kb.prove({"b"}));
}

TEST(KnowledgeBase, CycleRootMemoizesFailure) {
    vb9::logic::KnowledgeBase kb;
    int calls = 0;
    kb.add_rule("dep", [&calls](const vb9::logic::Goal& g) -> vb9::logic::Alternatives {
        ++calls;
        const std::string next = g[1] == "a" ? "b" : "a";
        return {vb9::logic::Conjunction{vb9::logic::Goal{"dep", next}}};
    });
    EXPECT_FALSE(kb.prove({"dep", "a"}));
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(kb.prove({"dep", "a"}));
    EXPECT_EQ(calls, 2);
}

TEST(KnowledgeBase, ExampleBuildKb) {
    vb9::logic::KnowledgeBase kb = vb9::logic::example_build_kb();
    EXPECT_TRUE(kb.prove({"build", "libc"}));
    EXPECT_TRUE(kb.prove({"build", "glib"}));
    // cairo and elisp have no rule or fact.
    EXPECT_FALSE(kb.prove({"build", "gtk"}));
    EXPECT_FALSE(kb.prove({"build", "emacs"}));
    EXPECT_FALSE(kb.prove({"build", "widget"}));
}

TEST(KnowledgeBase, GoalToString) {
    EXPECT_EQ(vb9::logic::goal_to_string({"build", "libc"}), "(build libc)");
    EXPECT_EQ(vb9::logic::goal_to_string({}), "()");
}

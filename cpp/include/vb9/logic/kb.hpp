#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace vb9::logic {

    // Ground goal: (predicate, args...). No variables.
    using Goal = std::vector<std::string>;
    using Conjunction = std::vector<Goal>;
    // Each element is one OR-alternative; all goals inside it must hold.
    using Alternatives = std::vector<Conjunction>;
    using RuleFn = std::function<Alternatives(const Goal&)>;

    [[nodiscard]] std::string goal_to_string(const Goal& goal);

    // Backward chaining over ground Horn clauses with memoized outcomes.
    // Not thread-safe; owned by one caller.
    class KnowledgeBase {
    public:
        void add_fact(Goal goal);
        void add_rule(std::string predicate, RuleFn fn);

        // Memo, then facts, then rules in registration order. Failures are memoized too.
        // A goal met again while its own proof is still in progress fails that inner
        // attempt, so cyclic rules terminate. A failure caused by such a cut is memoized
        // only by the outermost goal of the cycle.
        [[nodiscard]] bool prove(const Goal& goal);

        [[nodiscard]] bool is_fact(const Goal& goal) const;
        [[nodiscard]] std::size_t memo_size() const noexcept { return memo_.size(); }
        // Forgets outcomes; facts and rules stay.
        void clear_memo() noexcept { memo_.clear(); }

    private:
        static constexpr std::size_t kNoCut = static_cast<std::size_t>(-1);

        // cut receives the smallest in-progress depth this attempt ran into.
        bool prove_at(const Goal& goal, std::size_t* cut);

        std::set<Goal> facts_;
        std::map<std::string, std::vector<RuleFn>, std::less<>> rules_;
        std::map<Goal, bool> memo_;
        std::map<Goal, std::size_t> in_progress_;  // goal -> resolution depth
    };

    // bootstrap(gcc) plus a build/1 rule chain emacs -> {gtk, elisp}, gtk -> {glib, cairo},
    // glib -> libc, libc -> bootstrap(gcc).
    [[nodiscard]] KnowledgeBase example_build_kb();

} // namespace vb9::logic

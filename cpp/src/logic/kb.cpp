#include "vb9/logic/kb.hpp"

#include <algorithm>
#include <utility>

namespace vb9::logic {

    std::string goal_to_string(const Goal& goal) {
        std::string out = "(";
        for (size_t i = 0; i < goal.size(); ++i) {
            if (i > 0) out.push_back(' ');
            out.append(goal[i]);
        }
        out.push_back(')');
        return out;
    }

    void KnowledgeBase::add_fact(Goal goal) {
        facts_.insert(std::move(goal));
    }

    void KnowledgeBase::add_rule(std::string predicate, RuleFn fn) {
        rules_[std::move(predicate)].push_back(std::move(fn));
    }

    bool KnowledgeBase::is_fact(const Goal& goal) const {
        return facts_.find(goal) != facts_.end();
    }

    bool KnowledgeBase::prove(const Goal& goal) {
        std::size_t cut = kNoCut;
        return prove_at(goal, &cut);
    }

    bool KnowledgeBase::prove_at(const Goal& goal, std::size_t* cut) {
        if (auto it = memo_.find(goal); it != memo_.end()) {
            return it->second;
        }
        if (facts_.find(goal) != facts_.end()) {
            memo_[goal] = true;
            return true;
        }
        if (goal.empty()) {
            memo_[goal] = false;
            return false;
        }
        if (auto it = in_progress_.find(goal); it != in_progress_.end()) {
            // Cycle: this attempt fails and reports the depth of the goal it ran into.
            *cut = std::min(*cut, it->second);
            return false;
        }

        const std::size_t depth = in_progress_.size();
        in_progress_.emplace(goal, depth);
        std::size_t sub_cut = kNoCut;
        bool proved = false;

        if (auto rules = rules_.find(goal.front()); rules != rules_.end()) {
            for (const RuleFn& rule : rules->second) {
                for (const Conjunction& conj : rule(goal)) {
                    bool all = true;
                    for (const Goal& sub : conj) {
                        if (!prove_at(sub, &sub_cut)) {
                            all = false;
                            break;
                        }
                    }
                    if (all) {
                        proved = true;
                        break;
                    }
                }
                if (proved) {
                    break;
                }
            }
        }

        in_progress_.erase(goal);
        if (proved || sub_cut >= depth) {
            memo_[goal] = proved;
        } else {
            // Failed only because an enclosing goal was cut; that goal's resolution decides.
            *cut = std::min(*cut, sub_cut);
        }
        return proved;
    }

    KnowledgeBase example_build_kb() {
        KnowledgeBase kb;
        kb.add_fact(Goal{"bootstrap", "gcc"});
        kb.add_rule("build", [](const Goal& goal) -> Alternatives {
            if (goal.size() != 2) {
                return {};
            }
            const std::string& pkg = goal[1];
            if (pkg == "emacs") {
                return {Conjunction{Goal{"build", "gtk"}, Goal{"build", "elisp"}}};
            }
            if (pkg == "gtk") {
                return {Conjunction{Goal{"build", "glib"}, Goal{"build", "cairo"}}};
            }
            if (pkg == "glib") {
                return {Conjunction{Goal{"build", "libc"}}};
            }
            if (pkg == "libc") {
                return {Conjunction{Goal{"bootstrap", "gcc"}}};
            }
            return {};
        });
        return kb;
    }

} // namespace vb9::logic

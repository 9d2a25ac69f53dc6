#include "sbp/RecursiveSolver.h"
#include "sbp/Factory.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace sbp {

std::vector<Problem*> collectProblems(Problem& root) {
    std::vector<Problem*> out;
    std::vector<Problem*> stack{&root};
    while (!stack.empty()) {
        Problem* p = stack.back();
        stack.pop_back();
        out.push_back(p);
        const auto& nested = p->nested();
        for (auto it = nested.rbegin(); it != nested.rend(); ++it) stack.push_back(it->get());
    }
    return out;
}

RecursiveSolver::RecursiveSolver(int max_depth, bool verbose)
    : max_depth_(max_depth), verbose_(verbose) {}

void RecursiveSolver::solve(const SolvingStrategy& strategy, Problem& root) {
    if (!strategy) {
        throw std::runtime_error("RecursiveSolver::solve: empty solving strategy");
    }
    expand_(root);
    generateFactors_(root);
    solveTree_(strategy, root);
}

// ==== expansion ====

void RecursiveSolver::expand_(Problem& root) {
    bool pending = true;
    while (pending) {
        pending = false;
        for (Problem* p : collectProblems(root)) {
            // components may grow while we walk them
            for (size_t i = 0; i < p->components().size(); ++i) {
                ProblemComponent* c = p->components()[i];
                if (c->variable) continue;
                ensureVariable_(*c);
                pending = true;
            }
        }
    }
    if (verbose_) {
        std::cout << "[RecursiveSolver] expanded " << collectProblems(root).size() << " problems, "
                  << root.collection().size() << " components\n";
    }
}

void RecursiveSolver::ensureVariable_(ProblemComponent& start) {
    ComponentCollection& cc = start.problem->collection();

    std::vector<ProblemComponent*> stack{&start};
    std::unordered_set<const model::ElementBase*> on_stack{start.element};

    while (!stack.empty()) {
        ProblemComponent& c = *stack.back();
        if (c.variable) {
            on_stack.erase(c.element);
            stack.pop_back();
            continue;
        }

        // 1) parents
        ProblemComponent* next = nullptr;
        for (auto* a : c.element->args()) {
            if (!cc.contains(a)) c.problem->add(a);
            ProblemComponent& ac = cc(a);
            if (!ac.variable) {
                next = &ac;
                break;
            }
        }

        // 2) chain results, registered in nested problems when new
        if (!next && !c.expanded) {
            c.results = c.element->chainResults(cc);
            for (auto* r : c.results) {
                if (cc.contains(r)) continue;
                if (c.problem->depth() + 1 > max_depth_) {
                    throw std::runtime_error("RecursiveSolver: nesting below " + c.element->name() +
                                             " exceeds max depth " + std::to_string(max_depth_));
                }
                c.problem->addNested({r});
            }
            c.expanded = true;
        }
        if (!next) {
            for (auto* r : c.results) {
                ProblemComponent& rc = cc(r);
                if (!rc.variable) {
                    next = &rc;
                    break;
                }
            }
        }

        if (next) {
            if (!on_stack.insert(next->element).second) {
                throw std::runtime_error("RecursiveSolver: cyclic dependency through " + next->element->name());
            }
            stack.push_back(next);
            continue;
        }

        // 3) own variable
        cc.setVariable(c, c.element->makeVariable(cc));
        on_stack.erase(c.element);
        stack.pop_back();
    }
}

// ==== factors ====

void RecursiveSolver::generateFactors_(Problem& root) {
    for (Problem* p : collectProblems(root)) {
        const ComponentCollection& cc = p->collection();
        for (ProblemComponent* c : p->components()) {
            c->factors = Factory::makeFactors(cc, *c->element);
            c->evidence = Factory::makeEvidenceFactors(cc, *c->element);
        }
    }

    // record which problems mention each variable
    ComponentCollection& cc = root.collection();
    for (Problem* p : collectProblems(root)) {
        for (const ProblemComponent* c : p->components()) {
            for (const auto& f : c->factors) {
                for (const auto& v : f.variables()) cc.addUse(*v, p);
            }
            for (const auto& f : c->evidence) {
                for (const auto& v : f.variables()) cc.addUse(*v, p);
            }
        }
    }
}

// ==== solve, children before parents ====

void RecursiveSolver::solveTree_(const SolvingStrategy& strategy, Problem& root) {
    std::vector<std::pair<Problem*, bool>> stack{{&root, false}};
    while (!stack.empty()) {
        auto [p, visited] = stack.back();
        stack.pop_back();

        if (!visited) {
            stack.push_back({p, true});
            for (const auto& n : p->nested()) stack.push_back({n.get(), false});
            continue;
        }

        const std::vector<utils::Factor> factors = p->allFactors();
        const std::vector<utils::VariablePtr> preserve = p->globals();

        std::unordered_set<int> kept;
        for (const auto& v : preserve) kept.insert(v->id());
        std::vector<utils::VariablePtr> eliminate;
        for (const auto& f : factors) {
            for (const auto& v : f.variables()) {
                if (kept.insert(v->id()).second) eliminate.push_back(v);
            }
        }

        p->solution = strategy(*p, eliminate, preserve, factors);
        p->solved = true;

        if (verbose_) {
            std::cout << "[RecursiveSolver] solved problem at depth " << p->depth() << ": "
                      << factors.size() << " factors, " << preserve.size() << " preserved, "
                      << eliminate.size() << " eliminated -> " << p->solution.size() << " solution factors\n";
        }
    }
}

} // namespace sbp

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/Atomic.h"
#include "model/Compound.h"
#include "model/Universe.h"
#include "sbp/Problem.h"
#include "sbp/RecursiveSolver.h"

using namespace sbp;

static int g_failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "  [ok]   " : "  [FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

static bool hasVar(const std::vector<utils::VariablePtr>& vs, const utils::VariablePtr& v) {
    return std::find(vs.begin(), vs.end(), v) != vs.end();
}

int main() {
    std::cout << "=== Problem construction ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.3);
        auto* b = u.make<model::Apply<bool, bool>>("b", a, [](const bool& x) { return !x; });
        auto* c = u.make<model::Flip>("c", 0.5);

        ComponentCollection cc;
        Problem root(cc, {b});
        check(cc.contains(b) && cc.contains(a), "targets and their parents are registered");
        check(!cc.contains(c), "unrelated elements are not");
        check(root.components().size() == 2 && cc(a).problem == &root, "components owned by the root");

        root.add(c);
        root.add(a);
        check(cc.size() == 3 && root.components().size() == 3, "add skips registered elements");

        bool threw = false;
        try { cc.variable(a); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "variable lookup before expansion throws");
    }

    std::cout << "\n=== Expansion of chains into nested problems ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.3);
        auto* x = u.make<model::Apply<bool, bool>>("x", a, [](const bool& v) { return v; });
        auto* y = u.make<model::Flip>("y", 0.2);
        auto* test = u.make<model::Flip>("test", 0.6);
        auto* d = u.make<model::If<bool>>("d", test, x, y);

        ComponentCollection cc;
        Problem root(cc, {d});
        root.add(a);

        std::vector<const Problem*> order;
        std::vector<std::vector<utils::VariablePtr>> preserved;
        SolvingStrategy record = [&](const Problem& p, const std::vector<utils::VariablePtr>&,
                                     const std::vector<utils::VariablePtr>& toPreserve,
                                     const std::vector<utils::Factor>&) {
            order.push_back(&p);
            preserved.push_back(toPreserve);
            return std::vector<utils::Factor>{};
        };

        RecursiveSolver solver;
        solver.solve(record, root);

        // branches are expanded in the test's range order: false -> y, true -> x
        check(root.nested().size() == 2, "one nested problem per unregistered branch");
        const Problem* py = root.nested()[0].get();
        const Problem* px = root.nested()[1].get();
        check(px->targets().size() == 1 && px->targets()[0] == x, "branch solved as its own problem");
        check(py->targets()[0] == y && py->depth() == 1, "nested depth is one below the root");
        check(cc(x).problem == px && cc(a).problem == &root, "already registered parents stay in the root");

        check(order.size() == 3 && order.back() == &root, "children are solved before the root");
        check(root.solved && px->solved && py->solved, "every problem is marked solved");

        // x depends on a, which lives outside x's problem
        const auto gx = px->globals();
        check(gx.size() == 2 && gx[0] == cc.variable(x) && hasVar(gx, cc.variable(a)),
              "globals: targets first, then variables owned outside the subtree");
        const auto groot = root.globals();
        check(groot.size() == 1 && groot[0] == cc.variable(d), "root preserves only its targets");

        auto dv = std::dynamic_pointer_cast<const utils::RangeVariable<bool>>(cc.variable(d));
        check(dv && dv->size() == 2 && !dv->hasStar(), "chain range is the union of its results");
        check(cc(d).factors.size() == 1 && cc(d).factors[0].numVars() == 4,
              "one selector factor over test, d and both branches");
        check(cc(test).factors.size() == 1 && cc(test).evidence.empty(), "no evidence factors without evidence");
    }

    std::cout << "\n=== Parent shared by two branches ===\n";
    {
        model::Universe u;
        auto* y = u.make<model::Flip>("y", 0.9);
        auto* r1 = u.make<model::Apply<bool, bool>>("r1", y, [](const bool& v) { return v; });
        auto* r2 = u.make<model::Apply<bool, bool>>("r2", y, [](const bool& v) { return !v; });
        auto* t = u.make<model::Flip>("t", 0.3);
        auto* c = u.make<model::If<bool>>("c", t, r1, r2);

        ComponentCollection cc;
        Problem root(cc, {c});
        SolvingStrategy nothing = [](const Problem&, const std::vector<utils::VariablePtr>&,
                                     const std::vector<utils::VariablePtr>&, const std::vector<utils::Factor>&) {
            return std::vector<utils::Factor>{};
        };
        RecursiveSolver().solve(nothing, root);

        const Problem* owner = cc(y).problem;
        check(owner != &root, "y is registered with the first branch that reaches it");
        for (const auto& n : root.nested()) {
            check(hasVar(n->globals(), cc.variable(y)), "y stays a global of " + n->targets()[0]->name());
        }
        check(!hasVar(root.globals(), cc.variable(y)), "y is summed out where both branches meet");
    }

    std::cout << "\n=== Cyclic dependency ===\n";
    {
        model::Universe u;
        auto* p = u.make<model::Flip>("p", 0.5);
        model::Chain<bool, bool>* chain = nullptr;
        model::Element<bool>* loop = nullptr;
        chain = u.make<model::Chain<bool, bool>>("chain", p, [&](const bool&) -> model::Element<bool>* {
            if (!loop) loop = u.make<model::Apply<bool, bool>>("loop", chain, [](const bool& v) { return v; });
            return loop;
        });

        ComponentCollection cc;
        Problem root(cc, {chain});
        SolvingStrategy nothing = [](const Problem&, const std::vector<utils::VariablePtr>&,
                                     const std::vector<utils::VariablePtr>&, const std::vector<utils::Factor>&) {
            return std::vector<utils::Factor>{};
        };
        bool threw = false;
        try {
            RecursiveSolver().solve(nothing, root);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("cyclic") != std::string::npos;
        }
        check(threw, "a chain whose result depends on the chain is rejected");
    }

    std::cout << "\n" << (g_failures == 0 ? "All problem tests passed" : "Problem tests FAILED") << "\n";
    return g_failures == 0 ? 0 : 1;
}

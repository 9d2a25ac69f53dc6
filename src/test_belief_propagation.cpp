#include <cmath>
#include <iostream>
#include <memory>

#include "Factor.h"
#include "sbp/BeliefPropagation.h"
#include "sbp/FactorGraph.h"

using namespace sbp;
using utils::Factor;
using utils::RangeVariable;

static int g_failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "  [ok]   " : "  [FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

static bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

static void printVec(const Eigen::VectorXd& v, const std::string& name) {
    std::cout << name << " = ";
    for (int i = 0; i < v.size(); ++i) std::cout << v[i] << (i+1==v.size()? "" : " ");
    std::cout << "\n";
}

static std::shared_ptr<RangeVariable<int>> binary(const std::string& name) {
    return std::make_shared<RangeVariable<int>>(name, utils::makeRange<int>({0, 1}, false));
}

int main() {
    const auto& sr = utils::SumProductSemiring::instance();

    // Chain x0 - x1 - x2 with a prior on x0 and pairwise couplings: a tree,
    // so BP marginals are exact after enough sweeps.
    auto x0 = binary("x0");
    auto x1 = binary("x1");
    auto x2 = binary("x2");

    Factor prior({x0}, 0.0);
    prior.set({0}, 0.2);
    prior.set({1}, 0.8);

    Factor f01({x0, x1}, 0.0);
    f01.set({0, 0}, 0.9); f01.set({0, 1}, 0.1);
    f01.set({1, 0}, 0.3); f01.set({1, 1}, 0.7);

    Factor f12({x1, x2}, 0.0);
    f12.set({0, 0}, 0.6); f12.set({0, 1}, 0.4);
    f12.set({1, 0}, 0.05); f12.set({1, 1}, 0.95);

    Factor evidence({x2}, 0.0);
    evidence.set({0}, 1.0);
    evidence.set({1}, 3.0);

    // exact reference
    Factor joint = prior.product(f01, sr).product(f12, sr).product(evidence, sr);
    Factor exact0 = joint.marginalizeTo(sr, *x0).normalized();
    Factor exact1 = joint.marginalizeTo(sr, *x1).normalized();
    Factor exact2 = joint.marginalizeTo(sr, *x2).normalized();

    std::cout << "=== Synchronous BP on a chain ===\n";
    {
        FactorGraph g;
        g.addFactor(prior);
        g.addFactor(f01);
        g.addFactor(f12);
        g.addFactor(evidence);
        check(g.numVariables() == 3 && g.numFactors() == 4, "graph has 3 variables and 4 factors");
        check(g.findVariable(*x1)->adj_factors.size() == 2, "x1 connects to both pairwise factors");

        g.initialize();
        const int sweeps = g.run(10);
        check(sweeps == 10, "fixed iteration count without tolerance");

        printVec(g.findVariable(*x0)->belief, "  x0.belief");
        printVec(g.findVariable(*x2)->belief, "  x2.belief");

        check(near(g.findVariable(*x0)->belief[1], exact0.get({1})), "x0 belief exact on a tree");
        check(near(g.findVariable(*x1)->belief[1], exact1.get({1})), "x1 belief exact on a tree");
        check(near(g.findVariable(*x2)->belief[1], exact2.get({1})), "x2 belief exact on a tree");
    }

    std::cout << "\n=== Tolerance and damping ===\n";
    {
        FactorGraph g;
        g.damping = 0.5;
        g.addFactor(prior);
        g.addFactor(f01);
        g.addFactor(f12);
        g.addFactor(evidence);
        g.initialize();
        const int sweeps = g.run(500, 1e-12);
        check(sweeps < 500, "tolerance stops early once messages settle");
        check(near(g.findVariable(*x0)->belief[1], exact0.get({1}), 1e-8), "damped BP reaches the same fixed point");
    }

    std::cout << "\n=== Contradictory evidence ===\n";
    {
        Factor none({x0}, 0.0);
        FactorGraph g;
        g.addFactor(prior);
        g.addFactor(none);
        g.initialize();
        g.run(5);
        check(g.findVariable(*x0)->belief.sum() == 0.0, "all-zero messages stay zero");
    }

    std::cout << "\n=== Return rule ===\n";
    {
        BPConfig config;
        config.iterations = 20;
        BeliefPropagation bp(config);
        sbp::ComponentCollection cc;
        Problem p(cc, {});

        std::vector<Factor> factors{prior, f01, f12, evidence};

        auto single = bp(p, {x0, x2}, {x1}, factors);
        check(single.size() == 1 && single[0].numVars() == 1 && near(single[0].get({1}), exact1.get({1})),
              "one preserved variable: its belief");

        auto covered = bp(p, {x2}, {x1, x0}, factors);
        Factor exact10 = joint.marginalizeTo(sr, std::vector<utils::VariablePtr>{x1, x0}).normalized();
        check(covered.size() == 1 && covered[0].numVars() == 2 && covered[0].variables()[0] == x1,
              "covering factor: one factor over the preserved variables");
        check(near(covered[0].get({1, 0}), exact10.get({1, 0})), "covering factor belief is the pairwise marginal");

        auto split = bp(p, {x1}, {x0, x2}, factors);
        Factor exact02 = joint.marginalizeTo(sr, std::vector<utils::VariablePtr>{x0, x2}).normalized();
        check(split.size() == 1 && split[0].numVars() == 2 && split[0].variables()[0] == x0,
              "no covering factor: one joint over the preserved variables");
        bool same = true;
        for (const auto& idx : exact02.getIndices()) same = same && near(split[0].get(idx), exact02.get(idx));
        check(same, "joint keeps the correlation between x0 and x2");

        check(bp(p, {x0, x1, x2}, {}, factors).empty(), "nothing preserved: empty result");
    }

    std::cout << "\n" << (g_failures == 0 ? "All BP tests passed" : "BP tests FAILED") << "\n";
    return g_failures == 0 ? 0 : 1;
}

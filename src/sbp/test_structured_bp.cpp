#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "model/Atomic.h"
#include "model/Compound.h"
#include "model/Universe.h"
#include "sbp/StructuredBP.h"

using namespace sbp;

static int g_failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "  [ok]   " : "  [FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

static bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

int main() {
    std::cout << "=== Copy of a flip ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.3);
        auto* b = u.make<model::Apply<bool, bool>>("b", a, [](const bool& x) { return x; });

        auto res = StructuredBP::create(10, {b});
        check(res.ok() && !res.error, "create succeeds");
        StructuredBP& alg = *res.algorithm;
        alg.start();
        check(alg.isActive() && alg.ready(), "run completed");

        auto dist = alg.computeDistribution(b);
        for (const auto& pv : dist) std::cout << "    (" << pv.first << ", " << pv.second << ")\n";
        check(dist.size() == 2, "two regular values");
        check(!dist[0].second && near(dist[0].first, 0.7), "(0.7, false)");
        check(dist[1].second && near(dist[1].first, 0.3), "(0.3, true)");

        auto again = alg.computeDistribution(b);
        check(again == dist, "computeDistribution is idempotent");
        check(near(alg.computeExpectation(b, [](const bool&) { return 1.0; }), 1.0), "expectation of 1 is 1");
        check(near(alg.probability(b, [](const bool& x) { return x; }), 0.3), "member probability");

        // evidence added after the run must not leak into this run's answer
        a->observe(true);
        check(near(alg.probability(b, true), 0.3), "member probability by value reads stored marginals");
        a->unobserve();

        alg.kill();
        check(!alg.isActive(), "kill deactivates");
        check(near(alg.computeDistribution(b)[1].first, 0.3), "marginals survive kill");

        bool threw = false;
        try { alg.start(); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "start twice throws");

        threw = false;
        try { alg.computeDistribution(a); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "querying a non-target throws");

        check(near(sbp::probability(b, true, 10), 0.3), "probability(b, true, 10) == 0.3");
        check(near(sbp::probability(b, false), 0.7), "probability with default iterations");
        check(near(sbp::probability(b, [](const bool& x) { return !x; }, 5), 0.7), "probability of a predicate");
    }

    std::cout << "\n=== Querying before start ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.5);
        auto res = StructuredBP::create(3, {a});
        bool threw = false;
        try { res.algorithm->computeDistribution(a); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "no marginals before start");
    }

    std::cout << "\n=== Configuration errors ===\n";
    {
        model::Universe u1, u2;
        auto* a = u1.make<model::Flip>("a", 0.5);
        auto* b = u2.make<model::Flip>("b", 0.5);

        for (int k : {1, 10, 100}) {
            auto res = StructuredBP::create(k, {});
            check(!res && res.error && res.error->code() == ConfigurationError::Code::EmptyTargets,
                  "no targets fails for k = " + std::to_string(k));
        }

        auto mixed = StructuredBP::create(10, {a, b});
        check(!mixed && mixed.error->code() == ConfigurationError::Code::MultipleUniverses,
              "targets in two universes fail");
        check(std::string(mixed.error->what()).find("different universes") != std::string::npos,
              "message names the universe mismatch");

        auto zero = StructuredBP::create(0, {a});
        check(!zero && zero.error->code() == ConfigurationError::Code::InvalidIterations, "zero iterations fail");

        BPConfig config;
        config.damping = 1.0;
        auto damped = StructuredBP::create(config, {a});
        check(!damped && damped.error->code() == ConfigurationError::Code::InvalidSetting, "damping of 1 fails");

        bool threw = false;
        try { sbp::probability(b, true, 0); } catch (const ConfigurationError&) { threw = true; }
        check(threw, "one-shot probability throws the configuration error");
    }

    std::cout << "\n=== Two parents ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.3);
        auto* b = u.make<model::Flip>("b", 0.6);
        auto* both = u.make<model::Apply2<bool, bool, bool>>("both", a, b,
                                                               [](const bool& x, const bool& y) { return x && y; });
        check(near(sbp::probability(both, true, 10), 0.18), "P(a and b) = 0.18");
    }

    std::cout << "\n=== Branch correlated with the test ===\n";
    {
        // the then-branch depends on the test through a two-step path, so its
        // nested problem keeps (r, a) jointly
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.3);
        auto* m = u.make<model::Apply<bool, bool>>("m", a, [](const bool& v) { return v; });
        auto* r = u.make<model::Apply<bool, bool>>("r", m, [](const bool& v) { return v; });
        auto* off = u.make<model::Constant<bool>>("off", false);
        auto* d = u.make<model::If<bool>>("d", a, r, off);

        const double p = sbp::probability(d, true, 50);
        std::cout << "    P(d) = " << p << "\n";
        check(near(p, 0.3), "P(d) = P(a) when d copies a through the branch");
    }

    std::cout << "\n=== Branches sharing a parent ===\n";
    {
        model::Universe u;
        auto* y = u.make<model::Flip>("y", 0.9);
        auto* r1 = u.make<model::Apply<bool, bool>>("r1", y, [](const bool& v) { return v; });
        auto* r2 = u.make<model::Apply<bool, bool>>("r2", y, [](const bool& v) { return !v; });
        auto* t = u.make<model::Flip>("t", 0.3);
        auto* c = u.make<model::If<bool>>("c", t, r1, r2);

        // 0.3 * P(y) + 0.7 * P(not y)
        const double p = sbp::probability(c, true, 50);
        std::cout << "    P(c) = " << p << "\n";
        check(near(p, 0.3 * 0.9 + 0.7 * 0.1), "shared parent keeps its prior on both branches");
    }

    std::cout << "\n=== Unobserved test of an If ===\n";
    {
        model::Universe u;
        auto* test = u.make<model::Flip>("test", 0.6);
        auto* x = u.make<model::Flip>("x", 0.9);
        auto* y = u.make<model::Flip>("y", 0.2);
        auto* d = u.make<model::If<bool>>("d", test, x, y);
        check(near(sbp::probability(d, true, 10), 0.6 * 0.9 + 0.4 * 0.2), "mixture of the branches");
    }

    std::cout << "\n=== Mean and variance ===\n";
    {
        model::Universe u;
        auto* s = u.make<model::Select<int>>("s", std::vector<model::Select<int>::Clause>{{1.0, 1}, {1.0, 3}});
        auto* t = u.make<model::Apply<int, int>>("t", s, [](const int& v) { return 2 * v; });
        auto res = StructuredBP::create(10, {s, t});
        res.algorithm->start();
        check(near(res.algorithm->mean(s), 2.0) && near(res.algorithm->variance(s), 1.0), "mean 2, variance 1");
        check(near(res.algorithm->mean(t), 4.0), "second target marginalized from the same joint");
    }

    std::cout << "\n=== Determinism ===\n";
    {
        model::Universe u;
        auto* a = u.make<model::Flip>("a", 0.35);
        auto* b = u.make<model::Flip>("b", 0.8);
        auto* c = u.make<model::Apply2<bool, bool, int>>("c", a, b,
                                                         [](const bool& x, const bool& y) { return (int)x + (int)y; });
        auto r1 = StructuredBP::create(7, {c});
        auto r2 = StructuredBP::create(7, {c});
        r1.algorithm->start();
        r2.algorithm->start();
        check(r1.algorithm->targetFactor(c).table() == r2.algorithm->targetFactor(c).table(),
              "identical inputs give identical factors");
    }

    std::cout << "\n=== Irregular mass ===\n";
    {
        model::Universe u;
        auto* n = u.make<model::Poisson>("n", 2.0, 4);
        auto res = StructuredBP::create(5, {n});
        res.algorithm->start();

        auto dist = res.algorithm->computeDistribution(n);
        double total = 0.0, head = 0.0;
        for (const auto& pv : dist) total += pv.first;
        for (int k = 0; k <= 4; ++k) head += std::exp(k * std::log(2.0) - 2.0 - std::lgamma(k + 1.0));
        check(dist.size() == 5, "irregular entry is left out");
        check(near(total, head), "distribution sums to 1 - mass(*)");
        check(near(res.algorithm->targetFactor(n).sum(), 1.0), "stored factor is normalized over every entry");
    }

    std::cout << "\n=== Runaway recursion ===\n";
    {
        // geometric count built lazily: each level nests one deeper
        model::Universe u;
        std::function<model::Element<int>*(int)> level = [&](int depth) -> model::Element<int>* {
            auto* stop = u.make<model::Flip>("stop" + std::to_string(depth), 0.5);
            auto* here = u.make<model::Constant<int>>("n" + std::to_string(depth), depth);
            return u.make<model::Chain<bool, int>>("g" + std::to_string(depth), stop,
                                                   [&level, here, depth](const bool& s) -> model::Element<int>* {
                                                       return s ? here : level(depth + 1);
                                                   });
        };
        model::Element<int>* g = level(0);

        BPConfig config;
        config.iterations = 5;
        config.max_depth = 3;
        auto res = StructuredBP::create(config, {g});
        bool threw = false;
        try {
            res.algorithm->start();
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("max depth") != std::string::npos;
        }
        check(threw, "nesting past max_depth is reported");
        check(!res.algorithm->ready(), "no marginals after a failed run");
    }

    printStructuredBPProfile();
    resetStructuredBPProfile();

    std::cout << "\n" << (g_failures == 0 ? "All StructuredBP tests passed" : "StructuredBP tests FAILED") << "\n";
    return g_failures == 0 ? 0 : 1;
}

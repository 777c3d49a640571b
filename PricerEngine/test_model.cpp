#include <gtest/gtest.h>
#include <cmath>
#include "BlackScholesModel.hpp"
#include "PricingErrors.hpp"
#include "pricer.hpp"

TEST(BlackScholesModelTest, PathsArePositiveAndFinite)
{
    SimulationParameters params(100.0, 105.0, 1.0, 0.05, 0.2, 500, 50, 42);
    BlackScholesPricer pricer(params);
    const PnlMat *paths = pricer.simulate();

    ASSERT_EQ(paths->m, 500);
    ASSERT_EQ(paths->n, 50);
    for (int k = 0; k < paths->mn; k++) {
        EXPECT_TRUE(std::isfinite(paths->array[k]));
        EXPECT_GT(paths->array[k], 0.0);
    }
}

TEST(BlackScholesModelTest, ZeroVolatilityIsDeterministicGrowth)
{
    SimulationParameters params(100.0, 105.0, 2.0, 0.03, 0.0, 10, 8, 1);
    BlackScholesPricer first(params);
    SimulationParameters other(100.0, 105.0, 2.0, 0.03, 0.0, 10, 8, 999);
    BlackScholesPricer second(other);
    const PnlMat *a = first.simulate();
    const PnlMat *b = second.simulate();

    const double dt = params.timeStep();
    for (int i = 0; i < a->m; i++) {
        for (int j = 0; j < a->n; j++) {
            const double expected = 100.0 * std::exp(0.03 * (j + 1) * dt);
            EXPECT_NEAR(MGET(a, i, j), expected, 1e-12 * expected);
            // sans alea, la graine ne change rien
            EXPECT_EQ(MGET(b, i, j), MGET(a, i, j));
        }
    }
}

TEST(BlackScholesModelTest, SingleStepMatchesTerminalLognormal)
{
    SimulationParameters params(100.0, 100.0, 1.0, 0.05, 0.2, 50000, 1, 2024);
    BlackScholesPricer pricer(params);
    const PnlMat *paths = pricer.simulate();

    ASSERT_EQ(paths->n, 1);
    double sum = 0.0;
    for (int i = 0; i < paths->m; i++) {
        sum += MGET(paths, i, 0);
    }
    // E[S_T] = S0 exp(rT), ecart-type de S_T ~ 21
    EXPECT_NEAR(sum / paths->m, 100.0 * std::exp(0.05), 4.0 * 21.0 / std::sqrt(50000.0));
}

TEST(BlackScholesModelTest, SameSeedGivesIdenticalPaths)
{
    SimulationParameters params(100.0, 105.0, 1.0, 0.05, 0.2, 200, 20, 7);
    BlackScholesPricer first(params);
    BlackScholesPricer second(params);
    const PnlMat *a = first.simulate();
    const PnlMat *b = second.simulate();

    ASSERT_EQ(a->mn, b->mn);
    for (int k = 0; k < a->mn; k++) {
        EXPECT_EQ(a->array[k], b->array[k]);
    }
}

TEST(BlackScholesModelTest, DifferentSeedsGiveDifferentPaths)
{
    SimulationParameters params(100.0, 105.0, 1.0, 0.05, 0.2, 10, 5, 7);
    SimulationParameters other(100.0, 105.0, 1.0, 0.05, 0.2, 10, 5, 8);
    BlackScholesPricer first(params);
    BlackScholesPricer second(other);

    EXPECT_NE(MGET(first.simulate(), 0, 0), MGET(second.simulate(), 0, 0));
}

TEST(BlackScholesModelTest, InvalidParametersAreRejected)
{
    EXPECT_THROW(SimulationParameters(0.0, 105.0, 1.0, 0.05, 0.2, 10, 5), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, -1.0, 1.0, 0.05, 0.2, 10, 5), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, 105.0, 0.0, 0.05, 0.2, 10, 5), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, 105.0, 1.0, 0.05, -0.2, 10, 5), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, 105.0, 1.0, 0.05, 0.2, 0, 5), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, 105.0, 1.0, 0.05, 0.2, 10, 0), ValidationError);
    EXPECT_THROW(SimulationParameters(100.0, 105.0, 1.0, std::nan(""), 0.2, 10, 5), ValidationError);
}

TEST(BlackScholesModelTest, UnderflowingPathIsReported)
{
    // exp(-0.5 sigma^2 T) sort du domaine des doubles quel que soit le tirage
    SimulationParameters params(100.0, 105.0, 100.0, 0.0, 50.0, 10, 1, 3);
    BlackScholesPricer pricer(params);
    EXPECT_THROW(pricer.simulate(), NumericOverflowError);
}

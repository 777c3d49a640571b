#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "PricingErrors.hpp"
#include "PricingReport.hpp"

namespace {

nlohmann::json smallParams()
{
    return nlohmann::json::parse(R"({
        "Spot": 100.0, "Strike": 105.0, "Maturity": 1.0,
        "InterestRate": 0.05, "Volatility": 0.2,
        "SampleNb": 500, "TimeStepNb": 10, "Seed": 23
    })");
}

PricingResult priced(double price)
{
    PricingResult res = {price, 0.0, 0.0, price, price, 10};
    return res;
}

} // namespace

TEST(PricingReportTest, BarrierOnlyPricedWithBarrierBlock)
{
    nlohmann::json jsonParams = smallParams();
    BlackScholesPricer pricer(jsonParams);
    std::map<std::string, PricingResult> results = priceAll(pricer, jsonParams);
    EXPECT_EQ(results.count("Barrier"), 0u);
    EXPECT_EQ(results.count("Asian"), 1u);
    EXPECT_TRUE(basketComponents(jsonParams, results).empty());

    jsonParams["Barrier"] = nlohmann::json::parse(R"({ "Level": 90.0 })");
    BlackScholesPricer withBarrier(jsonParams);
    results = priceAll(withBarrier, jsonParams);
    EXPECT_EQ(results.size(), payoffTypes().size());
}

TEST(PricingReportTest, DefaultBasketIsEqualWeightAsianBarrier)
{
    nlohmann::json jsonParams = smallParams();
    std::map<std::string, PricingResult> results;
    results["Asian"] = priced(3.0);
    results["Barrier"] = priced(8.0);

    std::vector<std::string> components = basketComponents(jsonParams, results);
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], "Asian");
    EXPECT_EQ(components[1], "Barrier");
    EXPECT_DOUBLE_EQ(priceBasket(jsonParams, components, results), 5.5);

    jsonParams["BasketWeights"] = nlohmann::json::parse("[0.25, 0.75]");
    EXPECT_DOUBLE_EQ(priceBasket(jsonParams, components, results), 6.75);
}

TEST(PricingReportTest, BasketErrorsAreReported)
{
    nlohmann::json jsonParams = smallParams();
    std::map<std::string, PricingResult> results;
    results["Asian"] = priced(3.0);
    results["Barrier"] = priced(8.0);

    jsonParams["BasketComponents"] = nlohmann::json::parse(R"(["Asian", "Chooser"])");
    std::vector<std::string> components = basketComponents(jsonParams, results);
    EXPECT_THROW(priceBasket(jsonParams, components, results), ValidationError);

    jsonParams["BasketComponents"] = nlohmann::json::parse(R"(["Asian", "Barrier"])");
    jsonParams["BasketWeights"] = nlohmann::json::parse("[0.2, 0.3, 0.5]");
    components = basketComponents(jsonParams, results);
    EXPECT_THROW(priceBasket(jsonParams, components, results), ValidationError);

    // un seul poids : rejete par le constructeur du panier
    jsonParams["BasketComponents"] = nlohmann::json::parse(R"(["Asian"])");
    jsonParams["BasketWeights"] = nlohmann::json::parse("[1.0]");
    components = basketComponents(jsonParams, results);
    EXPECT_THROW(priceBasket(jsonParams, components, results), ValidationError);
}

TEST(PricingReportTest, RangeBoundsDefaultAroundSpot)
{
    nlohmann::json jsonParams = smallParams();
    SimulationParameters params(jsonParams);
    double low, high;
    rangeBounds(jsonParams, params, low, high);
    EXPECT_DOUBLE_EQ(low, 95.0);
    EXPECT_DOUBLE_EQ(high, 115.0);

    jsonParams["RangeBounds"] = nlohmann::json::parse("[80.0, 120.0]");
    rangeBounds(jsonParams, params, low, high);
    EXPECT_EQ(low, 80.0);
    EXPECT_EQ(high, 120.0);

    jsonParams["RangeBounds"] = nlohmann::json::parse("[80.0]");
    EXPECT_THROW(rangeBounds(jsonParams, params, low, high), ValidationError);
}

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "pricer.hpp"
#include "PricingReport.hpp"
#include "RangeStatistics.hpp"
#include "BlackScholesFormula.hpp"

using namespace std;

int main(int argc, char **argv)
{
    if (argc < 2) {
        cout << "Usage: " << argv[0] << " <params.json>" << endl;
        return 1;
    }

    ifstream paramFile(argv[1]);
    if (!paramFile.is_open()) {
        cerr << "Cannot open " << argv[1] << endl;
        return 1;
    }

    try {
        nlohmann::json jsonParams = nlohmann::json::parse(paramFile);
        paramFile.close();

        BlackScholesPricer pricer(jsonParams);
        pricer.print();
        pricer.simulate();

        cout << "\n=== Prices ===" << endl;
        map<string, PricingResult> results = priceAll(pricer, jsonParams);
        for (map<string, PricingResult>::const_iterator it = results.begin(); it != results.end(); ++it) {
            cout << it->first << ": " << it->second << endl;
        }

        cout << "\n=== Black-Scholes benchmark ===" << endl;
        cout << "Call: " << bsCall(pricer.params) << endl;
        cout << "Put: " << bsPut(pricer.params) << endl;

        // Panier : 0.5 Asian + 0.5 Barrier par defaut
        vector<string> components = basketComponents(jsonParams, results);
        if (!components.empty()) {
            cout << "\n=== Basket ===" << endl;
            cout << "Price: " << priceBasket(jsonParams, components, results) << endl;
        }

        cout << "\n=== Range ===" << endl;
        RangeStatistics range(pricer.paths);
        double low, high;
        rangeBounds(jsonParams, pricer.params, low, high);
        cout << "P(" << low << " <= S <= " << high << "): " << range.probabilityInRange(low, high) << endl;
        cout << "Percentile rank of " << low << ": " << range.percentileOfScore(low) << endl;
        cout << "Percentile rank of " << high << ": " << range.percentileOfScore(high) << endl;
        cout << "5th / 50th / 95th percentiles: " << range.scoreAtPercentile(5.0) << " / "
             << range.scoreAtPercentile(50.0) << " / " << range.scoreAtPercentile(95.0) << endl;
    } catch (const std::exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}

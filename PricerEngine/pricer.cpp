#include <iostream>
#include <cmath>
#include <ctime>
#include <sstream>
#include "pricer.hpp"
#include "PricingErrors.hpp"

BlackScholesPricer::BlackScholesPricer(const SimulationParameters &params_)
    : params(params_)
{
    init();
}

BlackScholesPricer::BlackScholesPricer(const nlohmann::json &jsonParams)
    : params(jsonParams)
{
    init();
}

void BlackScholesPricer::init()
{
    params.validate();
    model = new BlackScholesModel(params);
    paths = pnl_mat_create(0, 0);
    simulated = false;

    rng = pnl_rng_create(PNL_RNG_MERSENNE);
    unsigned long seed = params.seed;
    if (seed == 0) {
        seed = static_cast<unsigned long>(time(NULL));
    }
    pnl_rng_sseed(rng, seed);
}

BlackScholesPricer::~BlackScholesPricer()
{
    pnl_mat_free(&paths);
    pnl_rng_free(&rng);
    delete model;
}

void BlackScholesPricer::print() const
{
    std::cout << "spot: " << params.spot << std::endl;
    std::cout << "strike: " << params.strike << std::endl;
    std::cout << "maturity: " << params.maturity << std::endl;
    std::cout << "interestRate: " << params.interestRate << std::endl;
    std::cout << "volatility: " << params.volatility << std::endl;
    std::cout << "nSamples: " << params.nSamples << std::endl;
    std::cout << "nbTimeSteps: " << params.nbTimeSteps << std::endl;
    std::cout << "seed: " << params.seed << std::endl;
    std::cout << "varianceConvention: " << toString(params.varianceConvention) << std::endl;
}

const PnlMat *BlackScholesPricer::simulate()
{
    model->asset(paths, params.nSamples, rng);
    simulated = true;
    return paths;
}

PricingResult BlackScholesPricer::price(const Option &opt)
{
    if (opt.T != params.maturity) {
        std::ostringstream err;
        err << opt.name() << ": option maturity " << opt.T
            << " differs from the simulated maturity " << params.maturity;
        throw ValidationError(err.str());
    }
    if (!simulated) {
        simulate();
    }

    PnlVect *payoffs = pnl_vect_create(0);
    PricingResult res;
    try {
        opt.payoff(paths, payoffs);
        res = aggregate(payoffs);
    } catch (...) {
        pnl_vect_free(&payoffs);
        throw;
    }
    pnl_vect_free(&payoffs);
    return res;
}

PricingResult BlackScholesPricer::aggregate(const PnlVect *payoffs) const
{
    const int N = payoffs->size;
    if (N < 2) {
        std::ostringstream err;
        err << "At least 2 samples are needed to estimate the variance (got " << N << ")";
        throw DegenerateSampleError(err.str());
    }

    double sum = 0.0;
    for (int i = 0; i < N; ++i) {
        const double x = GET(payoffs, i);
        if (!std::isfinite(x)) {
            std::ostringstream err;
            err << "Non finite payoff at sample " << i;
            throw NumericOverflowError(err.str());
        }
        sum += x;
    }

    const double discount = params.discountFactor();
    PricingResult res;
    res.nSamples = N;
    res.price = discount * (sum / N);

    // Convention historique : payoffs non actualises centres sur le prix actualise
    const double scale = (params.varianceConvention == VarianceConvention::Discounted) ? discount : 1.0;
    double sumSq = 0.0;
    for (int i = 0; i < N; ++i) {
        const double dev = scale * GET(payoffs, i) - res.price;
        sumSq += dev * dev;
    }
    res.variance = sumSq / (N - 1);
    res.standardError = std::sqrt(res.variance / N);

    const double z95 = 1.959963984540054;
    res.ciLow = res.price - z95 * res.standardError;
    res.ciHigh = res.price + z95 * res.standardError;
    return res;
}

std::ostream &operator<<(std::ostream &os, const PricingResult &res)
{
    os << "Price: " << res.price << " (+/- " << res.standardError << ")"
       << " Variance: " << res.variance
       << " CI95: [" << res.ciLow << ", " << res.ciHigh << "]"
       << " N: " << res.nSamples;
    return os;
}

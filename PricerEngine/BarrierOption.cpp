#include "BarrierOption.hpp"
#include "PricingErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

void from_json(const nlohmann::json &j, BarrierSpec &spec)
{
    j.at("Level").get_to(spec.level);

    spec.direction = BarrierDirection::Down;
    if (j.contains("Direction")) {
        std::string direction = j.at("Direction").get<std::string>();
        if (direction == "Down") {
            spec.direction = BarrierDirection::Down;
        } else if (direction == "Up") {
            spec.direction = BarrierDirection::Up;
        } else {
            throw ValidationError("Unknown barrier Direction (expected Down or Up): " + direction);
        }
    }

    spec.type = BarrierType::Out;
    if (j.contains("Type")) {
        std::string type = j.at("Type").get<std::string>();
        if (type == "Out") {
            spec.type = BarrierType::Out;
        } else if (type == "In") {
            spec.type = BarrierType::In;
        } else {
            throw ValidationError("Unknown barrier Type (expected Out or In): " + type);
        }
    }
}

BarrierOption::BarrierOption(double T_, int nbTimeSteps_, double strike_, const BarrierSpec &barrier_)
    : Option(T_, nbTimeSteps_, strike_), barrier(barrier_)
{
    if (!(std::isfinite(barrier.level) && barrier.level > 0.0)) {
        std::ostringstream err;
        err << "Barrier level must be > 0 (got " << barrier.level << ")";
        throw ValidationError(err.str());
    }
}

BarrierOption::~BarrierOption()
{
}

void BarrierOption::touched(const PnlMat *path, PnlVect *flags) const
{
    checkPath(path);

    // Le flux max(S - B, 0) s'annule sur la ligne ssi min(ligne) <= B (symetrique pour Up)
    if (barrier.direction == BarrierDirection::Down)
    {
        pnl_mat_min(flags, path, 'c');
        for (int i = 0; i < flags->size; i++)
        {
            LET(flags, i) = (GET(flags, i) <= barrier.level) ? 1.0 : 0.0;
        }
    }
    else
    {
        pnl_mat_max(flags, path, 'c');
        for (int i = 0; i < flags->size; i++)
        {
            LET(flags, i) = (GET(flags, i) >= barrier.level) ? 1.0 : 0.0;
        }
    }
}

void BarrierOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    touched(path, payoffs);

    const int last = path->n - 1;
    const bool knockIn = (barrier.type == BarrierType::In);
    for (int i = 0; i < payoffs->size; i++)
    {
        const bool hit = GET(payoffs, i) > 0.5;
        if (hit != knockIn)
        {
            LET(payoffs, i) = 0.0;
            continue;
        }
        const double ST = MGET(path, i, last);
        LET(payoffs, i) = (barrier.direction == BarrierDirection::Down)
                              ? std::max(ST - barrier.level, 0.0)
                              : std::max(barrier.level - ST, 0.0);
    }
}

std::string BarrierOption::name() const
{
    std::string res = (barrier.direction == BarrierDirection::Down) ? "Down" : "Up";
    res += (barrier.type == BarrierType::Out) ? "AndOutBarrier" : "AndInBarrier";
    return res;
}

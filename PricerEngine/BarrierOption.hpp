#pragma once

#include <nlohmann/json.hpp>
#include "Option.hpp"

enum class BarrierDirection
{
    Down, /// barriere plancher : touchee des que S <= niveau
    Up    /// barriere plafond : touchee des que S >= niveau
};

enum class BarrierType
{
    Out, /// desactivee si la barriere est touchee
    In   /// activee seulement si la barriere est touchee
};

struct BarrierSpec
{
    double level;
    BarrierDirection direction;
    BarrierType type;
};

void from_json(const nlohmann::json &j, BarrierSpec &spec);

// Option barriere surveillee a chaque pas de temps.
// Le flux intermediaire est mesure par rapport au niveau de la barriere :
//   Down : max(S_t - niveau, 0),  Up : max(niveau - S_t, 0)
// Une trajectoire est touchee des que ce flux s'annule a une date quelconque.
// Out : flux final des trajectoires non touchees ; In : flux final des trajectoires touchees.
class BarrierOption : public Option
{
public:
    BarrierSpec barrier;

    BarrierOption(double T_, int nbTimeSteps_, double strike_, const BarrierSpec &barrier_);
    ~BarrierOption();
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;

    // Marque (1.0 / 0.0) les trajectoires ayant touche la barriere
    void touched(const PnlMat *path, PnlVect *flags) const;
};

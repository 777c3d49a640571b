#pragma once

#include "Option.hpp"
#include "EuropeanOption.hpp"

// Option au choix : le detenteur choisit call ou put une seule fois pour tout le lot,
// en retenant la jambe dont la somme des flux simules est la plus grande.
// Le prix non actualise vaut max(somme(call), somme(put)) / N.
class ChooserOption : public Option
{
public:
    EuropeanOption call;
    EuropeanOption put;

    ChooserOption(double T_, int nbTimeSteps_, double strike_);
    ~ChooserOption();

    // Recopie dans payoffs les flux de la jambe retenue
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;

    CallPut chosenLeg(const PnlMat *path) const;
    double undiscountedPrice(const PnlMat *path) const;

private:
    // Calcule les deux jambes et renvoie la jambe retenue
    CallPut evaluateLegs(const PnlMat *path, PnlVect *callPayoffs, PnlVect *putPayoffs) const;
};

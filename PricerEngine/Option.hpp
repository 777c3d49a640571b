#pragma once

#include <string>
#include "pnl/pnl_vector.h"
#include "pnl/pnl_matrix.h"

enum class CallPut
{
    Call,
    Put
};

class Option
{
public:
    double T;
    int nbTimeSteps;
    double strike;

    Option(double T_, int nbTimeSteps_, double strike_);
    virtual ~Option();

    // Remplit payoffs (redimensionne a path->m) avec un flux non actualise par trajectoire.
    // path n'est jamais modifie.
    virtual void payoff(const PnlMat *path, PnlVect *payoffs) const = 0;
    virtual std::string name() const = 0;

protected:
    // Verifie que path a bien nbTimeSteps colonnes et au moins une ligne
    void checkPath(const PnlMat *path) const;
};

#pragma once

#include "pnl/pnl_vector.h"
#include "pnl/pnl_matrix.h"

// Distribution empirique des prix simules : rang centile et centiles.
// Par defaut toutes les dates de toutes les trajectoires sont utilisees.
class RangeStatistics
{
public:
    PnlVect *sorted; /// Echantillon trie par ordre croissant

    explicit RangeStatistics(const PnlMat *path, bool terminalOnly = false);
    ~RangeStatistics();
    RangeStatistics(const RangeStatistics &) = delete;
    RangeStatistics &operator=(const RangeStatistics &) = delete;

    int size() const;

    // Rang centile (0..100) : moyenne des rangs strict (< level) et large (<= level)
    double percentileOfScore(double level) const;

    // Prix au centile q (0..100), interpolation lineaire entre statistiques d'ordre
    double scoreAtPercentile(double q) const;

    // Proportion des prix dans [low, high]
    double probabilityInRange(double low, double high) const;

private:
    int countBelow(double level) const;
    int countAtOrBelow(double level) const;
};

#include "RangeStatistics.hpp"
#include "PricingErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

RangeStatistics::RangeStatistics(const PnlMat *path, bool terminalOnly)
{
    if (path == NULL || path->m < 1 || path->n < 1) {
        throw ValidationError("RangeStatistics needs a non empty path matrix");
    }
    if (terminalOnly) {
        sorted = pnl_vect_create(0);
        pnl_mat_get_col(sorted, path, path->n - 1);
    } else {
        sorted = pnl_vect_create_from_ptr(path->mn, path->array);
    }
    pnl_vect_qsort(sorted, 'i');
}

RangeStatistics::~RangeStatistics()
{
    pnl_vect_free(&sorted);
}

int RangeStatistics::size() const
{
    return sorted->size;
}

int RangeStatistics::countBelow(double level) const
{
    return static_cast<int>(std::lower_bound(sorted->array, sorted->array + sorted->size, level) - sorted->array);
}

int RangeStatistics::countAtOrBelow(double level) const
{
    return static_cast<int>(std::upper_bound(sorted->array, sorted->array + sorted->size, level) - sorted->array);
}

double RangeStatistics::percentileOfScore(double level) const
{
    if (std::isnan(level)) {
        throw ValidationError("Percentile rank of NaN is undefined");
    }
    const double strict = countBelow(level);
    const double weak = countAtOrBelow(level);
    return 50.0 * (strict + weak) / sorted->size;
}

double RangeStatistics::scoreAtPercentile(double q) const
{
    if (!(q >= 0.0 && q <= 100.0)) {
        std::ostringstream err;
        err << "Percentile must be in [0, 100] (got " << q << ")";
        throw ValidationError(err.str());
    }
    const double pos = q / 100.0 * (sorted->size - 1);
    const int lo = static_cast<int>(std::floor(pos));
    const int hi = std::min(lo + 1, sorted->size - 1);
    const double frac = pos - lo;
    return GET(sorted, lo) + frac * (GET(sorted, hi) - GET(sorted, lo));
}

double RangeStatistics::probabilityInRange(double low, double high) const
{
    if (!(low <= high)) {
        std::ostringstream err;
        err << "Empty range [" << low << ", " << high << "]";
        throw ValidationError(err.str());
    }
    return static_cast<double>(countAtOrBelow(high) - countBelow(low)) / sorted->size;
}

#include "json_reader.hpp"
#include <vector>

void from_json(const nlohmann::json &j, PnlVect *&vect)
{
    std::vector<double> stl = j.get<std::vector<double>>();
    vect = pnl_vect_create_from_zero(static_cast<int>(stl.size()));
    for (int i = 0; i < vect->size; i++)
    {
        LET(vect, i) = stl[i];
    }
}

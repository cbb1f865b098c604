#include "tracers.hpp"

namespace itide {

void initialize_tracers(CellColumn& col, const TracerParams& tracers,
                        const LinearEos& eos)
{
    const int n = static_cast<int>(col.zMid.size());
    for (int k = 0; k < n; ++k) {
        if (!col.is_active(k))
            continue;
        const auto i = static_cast<std::size_t>(k);
        col.salinity[i]    = tracers.S0;
        col.density[i]     = tracers.rho0 + tracers.rhoz * col.zMid[i];
        col.temperature[i] = eos.temperature(col.density[i], col.salinity[i]);
    }
}

} // namespace itide

#pragma once

#include "geotech/warnings.hpp"
#include <string>

namespace geotech {

/**
 * @brief Append a warning if value lies outside [low, high]
 *
 * @param list Warning list to append to
 * @param code Warning code identifying the quantity
 * @param quantity Quantity name with unit
 * @param value Checked value
 * @param low Lower end of the typical range
 * @param high Upper end of the typical range
 * @return true if a warning was added
 */
bool check_range(WarningList& list, WarningCode code, const std::string& quantity,
                 double value, double low, double high);

/**
 * @brief Check footing or wall geometry against typical ranges
 *
 * Depth or height 0-50 m, width 0.1-20 m.
 *
 * @param depth Depth or wall height [m]
 * @param width Footing width [m]
 */
WarningList check_geometry(double depth, double width);

/**
 * @brief Warn when a bearing capacity safety factor is below a minimum
 *
 * @param Fs Factor of safety
 * @param minimum Customary minimum (default 2.0)
 */
WarningList check_safety_factor(double Fs, double minimum = 2.0);

/**
 * @brief Warn when the exit gradient is within a margin of the critical gradient
 *
 * Warns when i / icr exceeds ratio but piping has not yet occurred
 * (is_piping() reports that case).
 *
 * @param i Exit gradient
 * @param icr Critical gradient (> 0)
 * @param ratio Warning threshold for i / icr (default 0.8)
 */
WarningList check_piping_margin(double i, double icr, double ratio = 0.8);

} // namespace geotech

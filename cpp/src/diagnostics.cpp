#include "geotech/diagnostics.hpp"
#include "geotech/seepage.hpp"
#include "geotech/validation.hpp"

namespace geotech {

using namespace validation;

bool check_range(WarningList& list, WarningCode code, const std::string& quantity,
                 double value, double low, double high) {
    if (value >= low && value <= high) {
        return false;
    }
    list.add(GeotechWarning::atypical_value(code, quantity, value, low, high));
    return true;
}

WarningList check_geometry(double depth, double width) {
    WarningList list;
    check_range(list, WarningCode::ATYPICAL_DEPTH, "depth [m]", depth, 0.0, 50.0);
    check_range(list, WarningCode::ATYPICAL_WIDTH, "width [m]", width, 0.1, 20.0);
    return list;
}

WarningList check_safety_factor(double Fs, double minimum) {
    require_positive("check_safety_factor", "Fs", Fs);
    require_positive("check_safety_factor", "minimum", minimum);
    WarningList list;
    if (Fs < minimum) {
        list.add(GeotechWarning::low_safety_factor(Fs, minimum));
    }
    return list;
}

WarningList check_piping_margin(double i, double icr, double ratio) {
    require_half_open("check_piping_margin", "ratio", ratio, 0.0, 1.0);
    WarningList list;
    if (!is_piping(i, icr) && i / icr > ratio) {
        list.add(GeotechWarning::near_piping(i, icr));
    }
    return list;
}

} // namespace geotech

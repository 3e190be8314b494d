//
// Class OnAxisHistory
//   Records the on-axis Ez and reports its peaks.
//
#include "Diagnostics/OnAxisHistory.h"

#include <iomanip>
#include <sstream>

#include "Utility/QswException.h"

namespace qsw {

    double OnAxisHistory::last() const {
        if (values_m.empty()) {
            throw QswException("OnAxisHistory::last()", "No value has been recorded yet.");
        }
        return values_m.back();
    }

    std::vector<std::size_t> OnAxisHistory::peakIndices() const {
        std::vector<std::size_t> peaks;
        for (std::size_t i = 1; i + 1 < values_m.size(); ++i) {
            if (values_m[i] > values_m[i - 1] && values_m[i] > values_m[i + 1]) {
                peaks.push_back(i);
            }
        }
        return peaks;
    }

    std::string OnAxisHistory::peakReport() const {
        const auto peaks = peakIndices();
        if (peaks.empty()) {
            return "...";
        }

        const double first     = values_m[peaks.front()];
        const double lastPeak  = values_m[peaks.back()];
        const double deviation = 100 * (lastPeak / first - 1);

        std::ostringstream report;
        report << std::scientific << std::setprecision(4) << lastPeak << " " << std::fixed
               << std::showpos << std::setprecision(2) << deviation << "%";
        return report.str();
    }
}  // namespace qsw

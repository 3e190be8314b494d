//
// Class OnAxisHistory
//   Records the longitudinal field on the axis, one value per slice, and
//   reports the most recent peak of the wake together with its deviation
//   from the first peak. Peaks are strict local maxima of the history.
//
#ifndef QSW_ON_AXIS_HISTORY_H
#define QSW_ON_AXIS_HISTORY_H

#include <string>
#include <vector>

namespace qsw {

    class OnAxisHistory {
    public:
        void record(double value) { values_m.push_back(value); }

        const std::vector<double>& values() const { return values_m; }

        bool empty() const { return values_m.empty(); }

        double last() const;

        // indices of the strict local maxima, in increasing order
        std::vector<std::size_t> peakIndices() const;

        /*!
         * "<last peak> <deviation>%" with the value in scientific notation
         * (4 digits) and the signed deviation in percent (2 digits), or
         * "..." if there is no peak yet
         */
        std::string peakReport() const;

    private:
        std::vector<double> values_m;
    };
}  // namespace qsw

#endif

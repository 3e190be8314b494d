//
// Class SliceManager
//   Run loop over the xi slices behind the driver. Keeps the index of the
//   next slice and calls the hooks of a derived manager for every slice:
//      pre_step(k), advance(k), post_step(k)
//   and diagnose(k) every diagnosticsEachNSteps slices (k = 0, n, 2n, ...)
//   and on the last slice of the run.
//
#ifndef QSW_SLICE_MANAGER_H
#define QSW_SLICE_MANAGER_H

#include <algorithm>

#include "Utility/QswException.h"
#include "Utility/QswTimings.h"

namespace qsw {

    class SliceManager {
    public:
        /*!
         * @param xiSteps number of slices of a run
         * @param diagnosticsEachNSteps diagnostics cadence in slices
         */
        SliceManager(int xiSteps, int diagnosticsEachNSteps)
            : xiSteps_m(xiSteps)
            , diagnosticsEachNSteps_m(diagnosticsEachNSteps)
            , xiIndex_m(0) {
            if (xiSteps_m < 0) {
                throw QswException("SliceManager::SliceManager()",
                                   "The number of slices must not be negative.");
            }
            if (diagnosticsEachNSteps_m <= 0) {
                throw QswException("SliceManager::SliceManager()",
                                   "The diagnostics cadence must be positive.");
            }
        }

        virtual ~SliceManager() = default;

        // builds whatever the slices need; called once before run()
        virtual void pre_run() {}

        virtual void pre_step(int /*xiIndex*/) {}

        // computes slice xiIndex
        virtual void advance(int xiIndex) = 0;

        virtual void post_step(int /*xiIndex*/) {}

        virtual void diagnose(int /*xiIndex*/) {}

        bool isDiagnosticsSlice(int xiIndex) const {
            return xiIndex % diagnosticsEachNSteps_m == 0 || xiIndex == xiSteps_m - 1;
        }

        /*!
         * Computes up to nxi further slices, never past the end of the run
         * @return the number of slices computed
         */
        int run(int nxi) {
            static QswTimings::TimerRef sliceTimer = QswTimings::getTimer("slice");

            const int last = std::min(xiSteps_m, xiIndex_m + std::max(nxi, 0));
            const int done = last - xiIndex_m;
            for (; xiIndex_m < last; ++xiIndex_m) {
                QswTimings::startTimer(sliceTimer);
                this->pre_step(xiIndex_m);
                this->advance(xiIndex_m);
                this->post_step(xiIndex_m);
                QswTimings::stopTimer(sliceTimer);

                if (isDiagnosticsSlice(xiIndex_m)) {
                    this->diagnose(xiIndex_m);
                }
            }
            return done;
        }

        // computes all remaining slices
        int run() { return run(xiSteps_m - xiIndex_m); }

        int xiIndex() const { return xiIndex_m; }
        int xiSteps() const { return xiSteps_m; }
        int diagnosticsEachNSteps() const { return diagnosticsEachNSteps_m; }
        bool finished() const { return xiIndex_m >= xiSteps_m; }

    private:
        int xiSteps_m;
        int diagnosticsEachNSteps_m;

        // index of the next slice
        int xiIndex_m;
    };
}  // namespace qsw

#endif

// Wakefield Slices
//   Usage:
//     srun ./WakefieldSlices [<N> [<Nxi>]] [key=value ...] --info 5
//     N   = number of transverse grid nodes per axis (odd)
//     Nxi = number of xi slices
//     key=value overrides any other run parameter, e.g. xi_step_size=0.01
//   Parameters that are not given take the values of the reference run:
//   grid step 0.025, xi step 0.005, plasma coarseness 3 and fineness 2,
//   walls 5 and plasma 10 cells inside the grid edge.
//
//     Example:
//     srun ./WakefieldSlices 641 1200 check_residual=true --info 5
//
#include <string>

#include "QswCore.h"

#include "WakefieldManager.h"

int main(int argc, char* argv[]) {
    qsw::initialize(argc, argv);
    int status = 0;
    {
        Inform msg("WakefieldSlices");

        static QswTimings::TimerRef mainTimer = QswTimings::getTimer("total");
        QswTimings::startTimer(mainTimer);

        try {
            qsw::ParameterList params = qsw::SimulationParameters::defaults();
            int positional            = 0;
            for (int arg = 1; arg < argc; ++arg) {
                const std::string text = argv[arg];
                if (text.rfind("-", 0) == 0) {
                    // qsw::initialize() and Kokkos have consumed their options;
                    // only unrecognized Kokkos flags are left for Kokkos to warn about
                    if (text.rfind("--kokkos", 0) == 0) {
                        continue;
                    }
                    throw QswException("WakefieldSlices", "Unknown option '" + text + "'.");
                } else if (text.find('=') != std::string::npos) {
                    params.assign(text);
                } else if (positional == 0) {
                    params.assign("grid_steps=" + text);
                    ++positional;
                } else if (positional == 1) {
                    params.assign("xi_steps=" + text);
                    ++positional;
                } else {
                    throw QswException("WakefieldSlices", "Unexpected argument '" + text + "'.");
                }
            }

            const auto sp = qsw::SimulationParameters::fromParameterList(params);
            msg << "Parameters:" << endl;
            msg << sp.toParameterList() << endl;

            qsw::GaussianBeam beam;
            beam.xiStepSize = sp.xiStepSize;

            WakefieldManager<double> manager(sp, beam);
            manager.pre_run();

            msg << "Starting slices ..." << endl;

            manager.run();

            msg << "WakefieldSlices: End." << endl;
        } catch (const QswException& e) {
            *qsw::Error << e.where() << ": " << e.what() << endl;
            status = 1;
        }

        QswTimings::stopTimer(mainTimer);
        QswTimings::print();
    }
    qsw::finalize();

    return status;
}

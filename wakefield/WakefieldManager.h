//
// Class WakefieldManager
//   Drives a run of a Gaussian beam slice by slice and records Ez on the
//   axis. On every diagnostics slice it prints a line
//      xi=<xi> <Ez(0, 0)>|<last peak> <deviation from the first peak>%|
//
#ifndef QSW_WAKEFIELD_MANAGER_H
#define QSW_WAKEFIELD_MANAGER_H

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

#include "QswCore.h"

template <typename T>
class WakefieldManager : public qsw::SliceManager {
protected:
    qsw::SimulationParameters params_m;
    qsw::GaussianBeam beam_m;
    std::unique_ptr<qsw::Simulation<T>> simulation_m;
    qsw::OnAxisHistory history_m;

public:
    WakefieldManager(const qsw::SimulationParameters& params, const qsw::GaussianBeam& beam)
        : qsw::SliceManager(params.xiSteps, params.diagnosticsEachNSteps)
        , params_m(params)
        , beam_m(beam) {}

    const qsw::OnAxisHistory& getHistory() const { return history_m; }

    const qsw::Simulation<T>& getSimulation() const { return *simulation_m; }

    void pre_run() override {
        Inform m("Pre Run");

        static QswTimings::TimerRef initTimer = QswTimings::getTimer("initialize");
        QswTimings::startTimer(initTimer);
        simulation_m = std::make_unique<qsw::Simulation<T>>(params_m);
        QswTimings::stopTimer(initTimer);

        const auto& grid = simulation_m->grid();
        m << "grid: " << grid.size() << " x " << grid.size() << " nodes, h = " << grid.stepSize()
          << ", walls at +-" << grid.reflectBoundary() << endl;
        m << "plasma: " << simulation_m->driver().particles().count() << "^2 coarse, "
          << simulation_m->driver().virtualization().fineCount() << "^2 virtual particles"
          << endl;
    }

    void advance(int xiIndex) override {
        if (simulation_m->xiIndex() != xiIndex) {
            throw QswException("WakefieldManager::advance()",
                               "Slice " + std::to_string(xiIndex) + " requested, but the "
                                   + "simulation is at slice "
                                   + std::to_string(simulation_m->xiIndex()) + ".");
        }
        simulation_m->advance(beam_m);
    }

    void post_step(int /*xiIndex*/) override {
        const auto& Ez = simulation_m->state().fields.Ez;
        const int c    = params_m.gridSteps / 2;

        T ez00;
        Kokkos::deep_copy(ez00, Kokkos::subview(Ez, c, c));
        history_m.record(ez00);
    }

    void diagnose(int xiIndex) override {
        Inform m("Wake");

        std::ostringstream line;
        line << "xi=" << std::showpos << std::fixed << std::setprecision(4)
             << -xiIndex * params_m.xiStepSize << " " << std::scientific
             << history_m.last() << std::noshowpos << "|" << history_m.peakReport() << "|";
        m << line.str() << endl;
    }
};

#endif

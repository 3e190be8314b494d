//
// Class QswTimings
//   A singleton registry of named timers that can be printed out at the
//   end of a run.
//
#include "Qsw.h"

#include "Utility/QswTimings.h"

#include <Kokkos_Core.hpp>

#include <algorithm>
#include <iomanip>

bool QswTimings::enableFences = QSW_ENABLE_TIMER_FENCES;

QswTimings::TimerList_t QswTimings::timerList_m;
QswTimings::TimerMap_t QswTimings::timerMap_m;

QswTimings::TimerRef QswTimings::getTimer(const char* nm) {
    std::string s(nm);
    TimerMap_t::iterator loc = timerMap_m.find(s);
    if (loc != timerMap_m.end()) {
        return loc->second->indx;
    }
    TimerRef ref = static_cast<TimerRef>(timerList_m.size());
    timerList_m.push_back(std::make_unique<TimerInfo>(s, ref));
    timerMap_m.emplace(s, timerList_m.back().get());
    return ref;
}

void QswTimings::startTimer(TimerRef t) {
    if (t >= timerList_m.size())
        return;
    timerList_m[t]->start();
}

void QswTimings::stopTimer(TimerRef t) {
    if (t >= timerList_m.size())
        return;
    if (enableFences && timerList_m[t]->running) {
        Kokkos::fence();
    }
    timerList_m[t]->stop();
}

void QswTimings::clearTimer(TimerRef t) {
    if (t >= timerList_m.size())
        return;
    timerList_m[t]->clear();
}

QswTimings::TimerInfo* QswTimings::infoTimer(const char* nm) {
    TimerMap_t::iterator loc = timerMap_m.find(std::string(nm));
    return loc == timerMap_m.end() ? nullptr : loc->second;
}

void QswTimings::print() {
    if (timerList_m.empty())
        return;

    const int nodes = qsw::Comm->size();

    Inform msg("Timings");
    msg << level1 << "---------------------------------------------"
        << "\n";
    msg << "     Timing results for " << nodes << " nodes:"
        << "\n";
    msg << "---------------------------------------------"
        << "\n";

    for (const auto& tptr : timerList_m) {
        double wallmax = qsw::Comm->reduce(tptr->wallTime, MPI_MAX);
        double wallmin = qsw::Comm->reduce(tptr->wallTime, MPI_MIN);
        double wallavg = qsw::Comm->reduce(tptr->wallTime, MPI_SUM) / nodes;

        size_t lengthName = std::min<size_t>(tptr->name.length(), 19);
        msg << tptr->name.substr(0, lengthName) << std::string(20 - lengthName, '.')
            << " Wall max = " << std::setw(10) << wallmax << "\n"
            << std::string(20, ' ') << " Wall avg = " << std::setw(10) << wallavg << "\n"
            << std::string(20, ' ') << " Wall min = " << std::setw(10) << wallmin << "\n"
            << std::string(20, ' ') << " Calls    = " << std::setw(10) << tptr->calls << "\n"
            << "\n";
    }
    msg << "---------------------------------------------";
    msg << endl;
}

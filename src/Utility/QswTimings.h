//
// Class QswTimings
//   A singleton registry of named timers that can be printed out at the
//   end of a run.
//
//   General usage
//    1) create a timer:
//       QswTimings::TimerRef val = QswTimings::getTimer("timer name");
//    This will either create a new one, or return a ref to an existing one
//
//    2) start a timer:
//       QswTimings::startTimer(val);
//    Starting a timer that is already running does not change anything.
//
//    3) stop a timer:
//       QswTimings::stopTimer(val);
//    This stops the timer and adds the elapsed time to its total. With
//    enableFences the Kokkos device is fenced first, so that asynchronous
//    kernels are attributed to the timer that launched them.
//
//    4) print out the results (maximum, minimum and average over ranks):
//       QswTimings::print();
//
#ifndef QSW_TIMINGS_H
#define QSW_TIMINGS_H

#ifndef QSW_ENABLE_TIMER_FENCES
#warning "QSW timer fences were not set via CMake! Defaulting to no fences."
#define QSW_ENABLE_TIMER_FENCES false
#endif

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

// accumulated wall time and call count of one named timer
class QswTimerInfo {
public:
    typedef unsigned int TimerRef;
    typedef std::chrono::steady_clock clock_type;

    QswTimerInfo(const std::string& nm, TimerRef ref)
        : name(nm)
        , wallTime(0.0)
        , calls(0)
        , running(false)
        , indx(ref) {}

    void start() {
        if (!running) {
            running = true;
            begin   = clock_type::now();
        }
    }

    // fence (if enabled) must be done by the caller
    void stop() {
        if (running) {
            const std::chrono::duration<double> elapsed = clock_type::now() - begin;
            wallTime += elapsed.count();
            ++calls;
            running = false;
        }
    }

    void clear() {
        running  = false;
        wallTime = 0.0;
        calls    = 0;
    }

    std::string name;

    // the accumulated time in seconds
    double wallTime;

    // number of completed start/stop pairs
    unsigned long calls;

    bool running;

    TimerRef indx;

    clock_type::time_point begin;
};

class QswTimings {
public:
    typedef QswTimerInfo::TimerRef TimerRef;
    typedef QswTimerInfo TimerInfo;

    // create a timer, or get one that already exists
    static TimerRef getTimer(const char* nm);

    static void startTimer(TimerRef t);

    // stop a timer, and accumulate its values
    static void stopTimer(TimerRef t);

    // clear a timer, by turning it off and throwing away its time
    static void clearTimer(TimerRef t);

    // return a TimerInfo struct by asking for the name, nullptr if unknown
    static TimerInfo* infoTimer(const char* nm);

    // print the results to the Timings stream on rank 0
    static void print();

    // fence the Kokkos device before a timer is stopped
    static bool enableFences;

private:
    typedef std::vector<std::unique_ptr<TimerInfo>> TimerList_t;
    typedef std::map<std::string, TimerInfo*> TimerMap_t;

    QswTimings() = default;

    static TimerList_t timerList_m;
    static TimerMap_t timerMap_m;
};

#endif

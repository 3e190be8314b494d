//
// Qsw environment
//   Sets up the communicator, the message streams and Kokkos, and consumes
//   the command line options of the framework.
//
#include <Kokkos_Core.hpp>
#include "Qsw.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "Utility/QswTimings.h"

namespace qsw {

    namespace {
        int parseLevel(const std::string& text) {
            std::size_t parsed = 0;
            int level          = 0;
            try {
                level = std::stoi(text, &parsed);
            } catch (const std::logic_error&) {
                parsed = 0;
            }
            if (parsed == 0 || parsed != text.size() || level < 0 || level > 5) {
                throw std::runtime_error("Expected an info level 0..5, got '" + text + "'.");
            }
            return level;
        }

        bool parseSwitch(const std::string& text) {
            if (text == "on") {
                return true;
            }
            if (text == "off") {
                return false;
            }
            throw std::runtime_error("Expected 'on' or 'off', got '" + text + "'.");
        }

        void printHelp(const char* program) {
            std::cout << "Usage: " << program << " [<option> ...] [<argument> ...]\n"
                      << "   --info <n>              : message level of the Info stream (0..5)\n"
                      << "   --timer-fences <on|off> : fence the device when a timer stops\n"
                      << "   --help                  : display this message\n"
                      << "   --kokkos-*              : options of Kokkos::initialize\n";
        }
    }  // namespace

    void initialize(int& argc, char* argv[], MPI_Comm comm) {
        Comm = std::make_unique<qsw::Communicate>(argc, argv, comm);

        Info  = std::make_unique<Inform>("Qsw");
        Warn  = std::make_unique<Inform>("Warning", std::cerr);
        Error = std::make_unique<Inform>("Error", std::cerr, INFORM_ALL_NODES);

        // framework options are removed from argv, everything else is kept in order
        int infoLevel = 1;
        int kept      = 1;
        try {
            for (int arg = 1; arg < argc; ++arg) {
                const std::string option = argv[arg];
                if (option == "--help" || option == "-h") {
                    if (Comm->rank() == 0) {
                        printHelp(argv[0]);
                    }
                    std::exit(EXIT_SUCCESS);
                } else if (option == "--info" || option == "-i"
                           || option == "--timer-fences") {
                    if (++arg >= argc) {
                        throw std::runtime_error("Option '" + option + "' needs a value.");
                    }
                    if (option == "--timer-fences") {
                        QswTimings::enableFences = parseSwitch(argv[arg]);
                    } else {
                        infoLevel = parseLevel(argv[arg]);
                    }
                } else {
                    argv[kept++] = argv[arg];
                }
            }
        } catch (const std::runtime_error& e) {
            if (Comm->rank() == 0) {
                std::cerr << argv[0] << ": " << e.what() << std::endl;
            }
            std::exit(EXIT_FAILURE);
        }
        argc       = kept;
        argv[argc] = nullptr;

        // warnings and errors are always shown; --info only tunes Info
        Info->setOutputLevel(infoLevel);
        Warn->setOutputLevel(1);
        Error->setOutputLevel(1);

        Kokkos::initialize(argc, argv);

        *Info << level2 << "Qsw on " << Comm->size() << " rank(s), Kokkos execution space "
              << Kokkos::DefaultExecutionSpace::name() << ", timer fences "
              << (QswTimings::enableFences ? "on" : "off") << endl;
    }

    void finalize() {
        Kokkos::finalize();
        Info.reset();
        Warn.reset();
        Error.reset();
        Comm.reset();
    }

    void fence() {
        Kokkos::fence();
    }

    void abort(const char* msg, int errorcode) {
        if (msg) {
            *Error << msg << endl;
        }
        Comm->abort(errorcode);
    }
}  // namespace qsw

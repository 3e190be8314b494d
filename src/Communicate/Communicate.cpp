//
// Class Communicate
//   Owns the MPI environment of a run and answers rank and size queries.
//
#include "Communicate/Communicate.h"

namespace qsw {
    Communicate::Communicate(int& argc, char**& argv, const MPI_Comm& comm)
        : comm_m(comm)
        , ownsEnvironment_m(false) {
        int initialized = 0;
        MPI_Initialized(&initialized);
        if (!initialized) {
            MPI_Init(&argc, &argv);
            ownsEnvironment_m = true;
        }
        MPI_Comm_rank(comm_m, &rank_m);
        MPI_Comm_size(comm_m, &size_m);
    }

    Communicate::~Communicate() {
        if (ownsEnvironment_m) {
            MPI_Finalize();
        }
    }

    double Communicate::reduce(double value, MPI_Op op) const {
        double result = 0.0;
        MPI_Reduce(&value, &result, 1, MPI_DOUBLE, op, 0, comm_m);
        return result;
    }
}  // namespace qsw

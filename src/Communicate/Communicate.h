//
// Class Communicate
//   Owns the MPI environment of a run and answers rank and size queries.
//
#ifndef QSW_COMMUNICATE_H
#define QSW_COMMUNICATE_H

#include <mpi.h>

namespace qsw {
    /*!
     * @file Communicate.h
     *
     * \remark The slice solver itself is not distributed; every rank advances the
     * same slice. MPI is used for the heFFTe backends, reductions of timers and
     * rank-aware printing.
     */
    class Communicate {
    public:
        Communicate(int& argc, char**& argv, const MPI_Comm& comm = MPI_COMM_WORLD);

        ~Communicate();

        Communicate(const Communicate&)            = delete;
        Communicate& operator=(const Communicate&) = delete;

        int size() const noexcept { return size_m; }

        int rank() const noexcept { return rank_m; }

        const MPI_Comm& getCommunicator() const noexcept { return comm_m; }

        void barrier() noexcept { MPI_Barrier(comm_m); }

        void abort(int errorcode = -1) noexcept { MPI_Abort(comm_m, errorcode); }

        /*!
         * Reduces a value over all ranks onto rank 0
         * @param value local contribution
         * @param op MPI reduction operation
         * @return the reduced value (only meaningful on rank 0)
         */
        double reduce(double value, MPI_Op op) const;

    private:
        MPI_Comm comm_m;
        int size_m;
        int rank_m;
        bool ownsEnvironment_m;
    };
}  // namespace qsw

#endif

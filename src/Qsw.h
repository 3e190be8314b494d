//
// Qsw environment
//   The communicator and the message streams shared by the whole program.
//   initialize() must be called before anything else and consumes the
//   framework options (--info, --timer-fences, --kokkos-*) from argv.
//
#ifndef QSW_H
#define QSW_H

#include <iostream>
#include <memory>

#include "Types/QswTypes.h"

#include "Utility/Inform.h"
#include "Utility/ParallelDispatch.h"

#include "Communicate/Communicate.h"

namespace qsw {

    inline std::unique_ptr<qsw::Communicate> Comm = nullptr;

    // Info prints on rank 0 up to the --info level; Warn prints on rank 0
    // and Error on every rank, both at level 1
    inline std::unique_ptr<Inform> Info  = nullptr;
    inline std::unique_ptr<Inform> Warn  = nullptr;
    inline std::unique_ptr<Inform> Error = nullptr;

    void initialize(int& argc, char* argv[], MPI_Comm comm = MPI_COMM_WORLD);

    void finalize();

    void fence();

    void abort(const char* msg = nullptr, int errorcode = -1);
}  // namespace qsw

#endif

//
// Class BatchedRealFFT
//   Batched one dimensional real-to-complex Fourier transform of the rows of
//   a two dimensional Kokkos view. The transform of a row of length L yields
//   L / 2 + 1 complex coefficients. The rows are transformed independently
//   on the local device, with heFFTe's one dimensional executor for the
//   backend that matches the Kokkos memory space.
//
//   The field solvers use it for discrete sine and cosine transforms of
//   type I: a row of N values padded to L = 2N - 2 with even (cosine) or
//   odd (sine) symmetry has a purely real (imaginary) transform that holds
//   twice the DCT-I (minus twice the DST-I) coefficients.
//
#ifndef QSW_FFT_BATCHED_REAL_FFT_H
#define QSW_FFT_BATCHED_REAL_FFT_H

#include <Kokkos_Complex.hpp>
#include <complex>
#include <heffte.h>
#include <memory>

#include "Types/ViewTypes.h"

#include "Utility/QswException.h"

namespace qsw {

    namespace detail {
        /*!
         * Wrapper type for heFFTe backends, templated
         * on the Kokkos memory space
         */
        template <typename>
        struct HeffteBackendType;

#if defined(Heffte_ENABLE_FFTW)
        template <>
        struct HeffteBackendType<Kokkos::HostSpace> {
            using backend = heffte::backend::fftw;
        };
#elif defined(Heffte_ENABLE_MKL)
        template <>
        struct HeffteBackendType<Kokkos::HostSpace> {
            using backend = heffte::backend::mkl;
        };
#endif

#ifdef Heffte_ENABLE_CUDA
#ifdef KOKKOS_ENABLE_CUDA
        template <>
        struct HeffteBackendType<Kokkos::CudaSpace> {
            using backend = heffte::backend::cufft;
        };
#else
#error cuFFT backend is enabled for heFFTe but CUDA is not enabled for Kokkos!
#endif
#endif

#ifdef KOKKOS_ENABLE_HIP
#ifdef Heffte_ENABLE_ROCM
        template <>
        struct HeffteBackendType<Kokkos::HIPSpace> {
            using backend = heffte::backend::rocfft;
        };
#else
        template <>
        struct HeffteBackendType<Kokkos::HIPSpace> {
            using backend = heffte::backend::stock;
        };
#endif
#endif

#if !defined(Heffte_ENABLE_MKL) && !defined(Heffte_ENABLE_FFTW)
        /**
         * Use heFFTe's inbuilt 1D fft computation on CPUs if no
         * vendor specific or optimized backend is found
         */
        template <>
        struct HeffteBackendType<Kokkos::HostSpace> {
            using backend = heffte::backend::stock;
        };
#endif
    }  // namespace detail

    template <typename T, typename MemorySpace = Kokkos::DefaultExecutionSpace::memory_space>
    class BatchedRealFFT {
    public:
        using heffteBackend = typename detail::HeffteBackendType<MemorySpace>::backend;
        using executor_type = typename heffte::one_dim_backend<heffteBackend>::executor_r2c;

        using real_view_type =
            typename detail::ViewType<T, 2, Kokkos::LayoutRight, MemorySpace>::view_type;
        using complex_view_type =
            typename detail::ViewType<Kokkos::complex<T>, 2, Kokkos::LayoutRight,
                                      MemorySpace>::view_type;
        using workspace_type =
            typename detail::ViewType<Kokkos::complex<T>, 1, MemorySpace>::view_type;

        /*!
         * @param rows number of rows transformed at once
         * @param length length of every row (at least 2)
         */
        BatchedRealFFT(int rows, int length);

        int rows() const { return rows_m; }

        int length() const { return length_m; }

        // number of complex coefficients per row
        int outputLength() const { return length_m / 2 + 1; }

        /*!
         * Forward, unnormalized transform of every row of the input
         * @param in real input, rows() x length()
         * @param out complex output, rows() x outputLength()
         */
        void transform(const real_view_type& in, const complex_view_type& out);

    private:
        int rows_m;
        int length_m;

        std::unique_ptr<executor_type> executor_m;

        workspace_type workspace_m;
    };
}  // namespace qsw

#include "FFT/BatchedRealFFT.hpp"

#endif

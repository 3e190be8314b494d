//
// Class BatchedRealFFT
//   Batched one dimensional real-to-complex Fourier transform.
//
#include <string>

namespace qsw {

    template <typename T, typename MemorySpace>
    BatchedRealFFT<T, MemorySpace>::BatchedRealFFT(int rows, int length)
        : rows_m(rows)
        , length_m(length) {
        if (rows < 1 || length < 2) {
            throw QswException("BatchedRealFFT::BatchedRealFFT()",
                               "Invalid transform shape " + std::to_string(rows) + " x "
                                   + std::to_string(length) + ".");
        }

        // heFFTe boxes are ordered fastest index first: dimension 0 runs
        // along a row, dimension 1 over the rows
        heffte::box3d<int> box({0, 0, 0}, {length - 1, rows - 1, 0});
        executor_m = std::make_unique<executor_type>(nullptr, box, 0);

        workspace_m = workspace_type("fft_workspace", executor_m->workspace_size());
    }

    template <typename T, typename MemorySpace>
    void BatchedRealFFT<T, MemorySpace>::transform(const real_view_type& in,
                                                   const complex_view_type& out) {
        if (static_cast<int>(in.extent(0)) != rows_m
            || static_cast<int>(in.extent(1)) != length_m
            || static_cast<int>(out.extent(0)) != rows_m
            || static_cast<int>(out.extent(1)) != outputLength()) {
            throw QswException("BatchedRealFFT::transform()",
                               "The views do not match the transform shape.");
        }

        // the transform reads the buffers through plain pointers
        Kokkos::fence();

        executor_m->forward(in.data(), reinterpret_cast<std::complex<T>*>(out.data()),
                            reinterpret_cast<std::complex<T>*>(workspace_m.data()));
    }
}  // namespace qsw

//
// Unit test BatchedRealFFTTest
//   Test the batched real-to-complex transform and the sine and cosine
//   transforms built on it.
//
#include "Qsw.h"

#include <Kokkos_MathematicalConstants.hpp>
#include <cmath>

#include "FFT/BatchedRealFFT.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

template <typename T>
class BatchedRealFFTTest : public ::testing::Test {
public:
    using value_type        = T;
    using fft_type          = qsw::BatchedRealFFT<T>;
    using real_view_type    = typename fft_type::real_view_type;
    using complex_view_type = typename fft_type::complex_view_type;

    BatchedRealFFTTest()
        : fft(rows, 2 * n - 2)
        , in("in", rows, 2 * n - 2)
        , out("out", rows, n) {}

    // row r of the test data, sample k = 0 ... n - 1
    static T sample(int r, int k) { return std::cos(T(0.4) * k * (r + 1)) + T(0.1) * r * k; }

    static constexpr int rows = 5;
    static constexpr int n    = 17;

    fft_type fft;
    real_view_type in;
    complex_view_type out;
};

TYPED_TEST_SUITE(BatchedRealFFTTest, TestParams::tests);

TYPED_TEST(BatchedRealFFTTest, Shapes) {
    EXPECT_EQ(this->fft.rows(), this->rows);
    EXPECT_EQ(this->fft.length(), 2 * this->n - 2);
    EXPECT_EQ(this->fft.outputLength(), this->n);
}

TYPED_TEST(BatchedRealFFTTest, ShapeMismatch) {
    using T = typename TestFixture::value_type;
    typename TestFixture::complex_view_type wrong("wrong", this->rows, this->n + 1);
    EXPECT_THROW(this->fft.transform(this->in, wrong), QswException);
    EXPECT_THROW(qsw::BatchedRealFFT<T>(0, 8), QswException);
}

TYPED_TEST(BatchedRealFFTTest, EvenExtensionGivesDCT) {
    using T      = typename TestFixture::value_type;
    const int n  = this->n;
    const int nr = this->rows;
    const int len = 2 * n - 2;
    const T pi   = Kokkos::numbers::pi_v<T>;

    auto hin = Kokkos::create_mirror_view(this->in);
    for (int r = 0; r < nr; ++r) {
        for (int k = 0; k < n; ++k) {
            hin(r, k) = TestFixture::sample(r, k);
        }
        for (int k = 1; k < n - 1; ++k) {
            hin(r, len - k) = TestFixture::sample(r, k);
        }
    }
    Kokkos::deep_copy(this->in, hin);

    this->fft.transform(this->in, this->out);
    auto hout = toHost(this->out);

    for (int r = 0; r < nr; ++r) {
        for (int m = 0; m < n; ++m) {
            double dct = TestFixture::sample(r, 0) + std::pow(-1, m) * TestFixture::sample(r, n - 1);
            double scale = std::abs(dct);
            for (int k = 1; k < n - 1; ++k) {
                const double term = 2 * TestFixture::sample(r, k) * std::cos(pi * k * m / (n - 1));
                dct += term;
                scale += std::abs(term);
            }
            EXPECT_NEAR(hout(r, m).real(), dct, 100 * tolerance<T> * scale);
            EXPECT_NEAR(hout(r, m).imag(), 0, 100 * tolerance<T> * scale);
        }
    }
}

TYPED_TEST(BatchedRealFFTTest, OddExtensionGivesDST) {
    using T       = typename TestFixture::value_type;
    const int n   = this->n;
    const int nr  = this->rows;
    const int len = 2 * n - 2;
    const T pi    = Kokkos::numbers::pi_v<T>;

    // interior samples 1 ... n - 2; the end points are zero
    auto hin = Kokkos::create_mirror_view(this->in);
    Kokkos::deep_copy(hin, T(0));
    for (int r = 0; r < nr; ++r) {
        for (int k = 1; k < n - 1; ++k) {
            hin(r, k)       = TestFixture::sample(r, k);
            hin(r, len - k) = -TestFixture::sample(r, k);
        }
    }
    Kokkos::deep_copy(this->in, hin);

    this->fft.transform(this->in, this->out);
    auto hout = toHost(this->out);

    for (int r = 0; r < nr; ++r) {
        for (int m = 1; m < n - 1; ++m) {
            double dst = 0, scale = 0;
            for (int k = 1; k < n - 1; ++k) {
                const double term = 2 * TestFixture::sample(r, k) * std::sin(pi * k * m / (n - 1));
                dst += term;
                scale += std::abs(term);
            }
            EXPECT_NEAR(-hout(r, m).imag(), dst, 100 * tolerance<T> * scale);
            EXPECT_NEAR(hout(r, m).real(), 0, 100 * tolerance<T> * scale);
        }
    }
}

int main(int argc, char* argv[]) {
    int success = 1;
    qsw::initialize(argc, argv);
    {
        ::testing::InitGoogleTest(&argc, argv);
        success = RUN_ALL_TESTS();
    }
    qsw::finalize();
    return success;
}

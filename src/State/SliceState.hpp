//
// Struct SliceState
//   Everything that is handed from one xi slice to the next.
//
namespace qsw {
    namespace detail {
        template <typename View>
        View cloneView(const View& v) {
            View copy(v.label(), v.extent(0), v.extent(1));
            Kokkos::deep_copy(copy, v);
            return copy;
        }

        template <typename View>
        typename View::HostMirror hostCopy(const View& v) {
            auto mirror = Kokkos::create_mirror(v);
            Kokkos::deep_copy(mirror, v);
            return mirror;
        }
    }  // namespace detail

    template <typename T>
    ParticleState<T> ParticleState<T>::zeros(int nc) {
        return {view_type("x_offt", nc, nc), view_type("y_offt", nc, nc),
                view_type("px", nc, nc), view_type("py", nc, nc), view_type("pz", nc, nc)};
    }

    template <typename T>
    ParticleState<T> ParticleState<T>::clone() const {
        using detail::cloneView;
        return {cloneView(xOfft), cloneView(yOfft), cloneView(px), cloneView(py), cloneView(pz)};
    }

    template <typename T>
    FieldSet<T> FieldSet<T>::zeros(int n) {
        return {view_type("Ex", n, n), view_type("Ey", n, n), view_type("Ez", n, n),
                view_type("Bx", n, n), view_type("By", n, n), view_type("Bz", n, n)};
    }

    template <typename T>
    FieldSet<T> FieldSet<T>::clone() const {
        using detail::cloneView;
        return {cloneView(Ex), cloneView(Ey), cloneView(Ez),
                cloneView(Bx), cloneView(By), cloneView(Bz)};
    }

    template <typename T>
    SourceSet<T> SourceSet<T>::zeros(int n) {
        return {view_type("ro", n, n), view_type("jx", n, n), view_type("jy", n, n),
                view_type("jz", n, n)};
    }

    template <typename T>
    SourceSet<T> SourceSet<T>::clone() const {
        using detail::cloneView;
        return {cloneView(ro), cloneView(jx), cloneView(jy), cloneView(jz)};
    }

    template <typename T>
    SliceState<T> SliceState<T>::zeros(int nc, int n) {
        return {ParticleState<T>::zeros(nc), FieldSet<T>::zeros(n), SourceSet<T>::zeros(n)};
    }

    template <typename T>
    HostSliceState<T> SliceState<T>::snapshot() const {
        using detail::hostCopy;
        HostSliceState<T> host;
        host.xOfft = hostCopy(particles.xOfft);
        host.yOfft = hostCopy(particles.yOfft);
        host.px    = hostCopy(particles.px);
        host.py    = hostCopy(particles.py);
        host.pz    = hostCopy(particles.pz);
        host.Ex    = hostCopy(fields.Ex);
        host.Ey    = hostCopy(fields.Ey);
        host.Ez    = hostCopy(fields.Ez);
        host.Bx    = hostCopy(fields.Bx);
        host.By    = hostCopy(fields.By);
        host.Bz    = hostCopy(fields.Bz);
        host.ro    = hostCopy(sources.ro);
        host.jx    = hostCopy(sources.jx);
        host.jy    = hostCopy(sources.jy);
        host.jz    = hostCopy(sources.jz);
        return host;
    }
}  // namespace qsw

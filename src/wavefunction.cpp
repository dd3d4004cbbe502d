#include "castepbin/wavefunction.hpp"
#include "castepbin/castep_bin_easy.hpp"

#include <algorithm>
#include <cstdint>

namespace castepbin {

static std::size_t wrap(std::int64_t c, std::size_t n) {
    const auto m = static_cast<std::int64_t>(n);
    return static_cast<std::size_t>(((c % m) + m) % m);
}

static void check_layout(const ComplexArray& coeffs, const IntArray& nwaves_at_kp, const IntArray& grid_coords) {
    if (coeffs.rank() != 5) {
        throw CastepBinError(ErrorKind::InvalidData, "coefficient tensor must have rank 5");
    }
    const std::size_t nwaves_max = coeffs.shape[0];
    const std::size_t nkpts = coeffs.shape[3];
    if (nwaves_at_kp.size() != nkpts) {
        throw CastepBinError(ErrorKind::InvalidData, "nwaves_at_kp does not have one entry per k-point");
    }
    if (grid_coords.rank() != 3 || grid_coords.shape[0] != 3 || grid_coords.shape[2] != nkpts) {
        throw CastepBinError(ErrorKind::InvalidData, "grid coordinates must have shape (3, nwaves, nkpts)");
    }
    for (std::size_t k = 0; k < nkpts; ++k) {
        const std::int32_t nw = nwaves_at_kp.data[k];
        if (nw < 0 || static_cast<std::size_t>(nw) > nwaves_max ||
            static_cast<std::size_t>(nw) > grid_coords.shape[1]) {
            throw CastepBinError(ErrorKind::InvalidData,
                "k-point " + std::to_string(k + 1) + " claims " + std::to_string(nw) + " plane waves");
        }
    }
}

IntArray coords_to_indices(const IntArray& grid_coords, const std::array<std::size_t, 3>& mesh) {
    if (grid_coords.rank() == 0 || grid_coords.shape[0] != 3) {
        throw CastepBinError(ErrorKind::InvalidData, "grid coordinates must have a leading axis of 3");
    }
    for (std::size_t n : mesh) {
        if (n == 0) throw CastepBinError(ErrorKind::InvalidData, "mesh extents must be positive");
    }
    IntArray out = grid_coords;
    for (std::size_t i = 0; i < out.data.size(); ++i) {
        out.data[i] = static_cast<std::int32_t>(wrap(out.data[i], mesh[i % 3]));
    }
    return out;
}

ComplexArray coeffs_to_grid(
    const ComplexArray& coeffs,
    const IntArray& nwaves_at_kp,
    const IntArray& grid_coords,
    std::size_t nx, std::size_t ny, std::size_t nz
) {
    check_layout(coeffs, nwaves_at_kp, grid_coords);
    const IntArray idx = coords_to_indices(grid_coords, {nx, ny, nz});

    const std::size_t nwaves_max = coeffs.shape[0];
    const std::size_t nspinors = coeffs.shape[1];
    const std::size_t nbands = coeffs.shape[2];
    const std::size_t nkpts = coeffs.shape[3];
    const std::size_t nspins = coeffs.shape[4];
    const std::size_t ncoord = grid_coords.shape[1];
    const std::size_t cell = nx * ny * nz;

    ComplexArray grid({nx, ny, nz, nspinors, nbands, nkpts, nspins});
    for (std::size_t s = 0; s < nspins; ++s) {
        for (std::size_t k = 0; k < nkpts; ++k) {
            const auto nw = static_cast<std::size_t>(nwaves_at_kp.data[k]);
            for (std::size_t b = 0; b < nbands; ++b) {
                for (std::size_t sp = 0; sp < nspinors; ++sp) {
                    const std::size_t block = sp + nspinors * (b + nbands * (k + nkpts * s));
                    const std::complex<double>* src = coeffs.data.data() + nwaves_max * block;
                    std::complex<double>* dst = grid.data.data() + cell * block;
                    for (std::size_t i = 0; i < nw; ++i) {
                        const std::int32_t* g = idx.data.data() + 3 * (i + ncoord * k);
                        const auto off = static_cast<std::size_t>(g[0]) +
                                         nx * (static_cast<std::size_t>(g[1]) + ny * static_cast<std::size_t>(g[2]));
                        dst[off] = src[i];
                    }
                }
            }
        }
    }
    return grid;
}

// ------------------------------
// WavefunctionRecord
// ------------------------------

std::vector<std::complex<double>> WavefunctionRecord::plane_wave_coeffs(
    std::size_t spin, std::size_t k, std::size_t band, std::size_t spinor) const {
    const std::size_t nw = static_cast<std::size_t>(nwaves_at_kp.at({k}));
    const std::size_t base = coeffs.offset({0, spinor, band, k, spin});
    return std::vector<std::complex<double>>(coeffs.data.begin() + base, coeffs.data.begin() + base + nw);
}

static IntArray slice_kpoint(const IntArray& a, const IntArray& nwaves_at_kp, std::size_t k) {
    const std::size_t nw = static_cast<std::size_t>(nwaves_at_kp.at({k}));
    IntArray out({3, nw});
    if (nw == 0) return out;
    const std::size_t base = a.offset({0, 0, k});
    std::copy(a.data.begin() + base, a.data.begin() + base + 3 * nw, out.data.begin());
    return out;
}

IntArray WavefunctionRecord::gvectors(std::size_t k) const {
    return slice_kpoint(pw_grid_coords, nwaves_at_kp, k);
}

IntArray WavefunctionRecord::gmesh_indices(std::size_t k) const {
    return slice_kpoint(pw_grid_indices, nwaves_at_kp, k);
}

RealArray WavefunctionRecord::kpoints_cartesian() const {
    const std::size_t nk = kpts.rank() == 2 ? kpts.shape[1] : 0;
    RealArray out({3, nk});
    for (std::size_t k = 0; k < nk; ++k) {
        for (std::size_t a = 0; a < 3; ++a) {
            double sum = 0.0;
            for (std::size_t i = 0; i < 3; ++i) sum += recip_lattice.at({i, a}) * kpts.at({i, k});
            out.at({a, k}) = sum;
        }
    }
    return out;
}

// ------------------------------
// Assembly
// ------------------------------

static std::size_t mesh_extent(const Namespace& wf, const std::string& key) {
    const std::int32_t n = easy::get_int(wf, key);
    if (n <= 0) throw CastepBinError(ErrorKind::InvalidData, "wavefunction mesh extent '" + key + "' is not positive");
    return static_cast<std::size_t>(n);
}

WavefunctionRecord build_wavefunction(const Namespace& ns) {
    const Value::Struct& wf = easy::require(ns, "wavefunction").as_struct();

    WavefunctionRecord out;
    out.coeffs = easy::get_complexes(wf, "coeffs");
    out.pw_grid_coords = easy::get_ints(wf, "pw_grid_coords");
    out.nwaves_at_kp = easy::get_ints(wf, "nwaves_at_kp");
    out.kpts = easy::get_reals(wf, "kpts");
    out.mesh_size = {mesh_extent(wf, "ngx"), mesh_extent(wf, "ngy"), mesh_extent(wf, "ngz")};
    check_layout(out.coeffs, out.nwaves_at_kp, out.pw_grid_coords);
    out.pw_grid_indices = coords_to_indices(out.pw_grid_coords, out.mesh_size);

    out.real_lattice = easy::get_reals(ns, "real_lattice");
    out.recip_lattice = easy::get_reals(ns, "recip_lattice");
    out.eigenvalues = easy::get_reals(ns, "eigenvalues");
    out.occupancies = easy::get_reals(ns, "occupancies");
    out.fermi_energy = easy::get_real(ns, "fermi_energy");

    if (out.eigenvalues.size() != out.occupancies.size()) {
        throw CastepBinError(ErrorKind::InvalidData, "eigenvalues and occupancies differ in size");
    }

    // Band-structure runs store no occupancies; occupy everything below the Fermi level.
    bool any_occupied = false;
    for (double o : out.occupancies.data) {
        if (o != 0.0) {
            any_occupied = true;
            break;
        }
    }
    if (!any_occupied) {
        for (std::size_t i = 0; i < out.occupancies.size(); ++i) {
            if (out.eigenvalues.data[i] < out.fermi_energy) out.occupancies.data[i] = 1.0;
        }
    }
    return out;
}

ComplexArray reciprocal_grid(const WavefunctionRecord& wf) {
    return coeffs_to_grid(wf.coeffs, wf.nwaves_at_kp, wf.pw_grid_coords,
                          wf.mesh_size[0], wf.mesh_size[1], wf.mesh_size[2]);
}

} // namespace castepbin

#pragma once

#include "castepbin/castep_bin.hpp"

#include <array>
#include <complex>
#include <cstddef>
#include <vector>

namespace castepbin {

// ------------------------------
// Plane-wave wavefunction
// ------------------------------

struct WavefunctionRecord {
    ComplexArray coeffs{};          // (nwaves_max, nspinors, nbands, nkpts, nspins)
    IntArray pw_grid_coords{};      // (3, nwaves_max, nkpts), signed reciprocal-lattice indices
    IntArray pw_grid_indices{};     // pw_grid_coords wrapped onto the mesh
    IntArray nwaves_at_kp{};        // (nkpts)
    RealArray kpts{};               // (3, nkpts), fractional
    std::array<std::size_t, 3> mesh_size{};

    // Lattices hold the lattice vectors as rows, in atomic units.
    RealArray real_lattice{};
    RealArray recip_lattice{};
    RealArray eigenvalues{};        // (nbands, nkpts, nspins)
    RealArray occupancies{};        // (nbands, nkpts, nspins)
    double fermi_energy{0.0};

    std::size_t nwaves_max() const noexcept { return coeffs.shape[0]; }
    std::size_t nspinors() const noexcept { return coeffs.shape[1]; }
    std::size_t nbands() const noexcept { return coeffs.shape[2]; }
    std::size_t nkpts() const noexcept { return coeffs.shape[3]; }
    std::size_t nspins() const noexcept { return coeffs.shape[4]; }

    /// The populated coefficients of one (spin, k-point, band, spinor).
    std::vector<std::complex<double>> plane_wave_coeffs(
        std::size_t spin = 0, std::size_t k = 0, std::size_t band = 0, std::size_t spinor = 0) const;

    /// G-vectors of k-point `k` in reciprocal-lattice units, shape (3, nwaves_at_kp[k]).
    IntArray gvectors(std::size_t k = 0) const;

    /// Mesh indices of each plane wave at k-point `k`, shape (3, nwaves_at_kp[k]).
    IntArray gmesh_indices(std::size_t k = 0) const;

    /// K-points in cartesian coordinates (recip_lattice^T . kpts), shape (3, nkpts).
    RealArray kpoints_cartesian() const;
};

/// Wrap signed grid coordinates (3, ...) onto a mesh with a true modulo.
IntArray coords_to_indices(const IntArray& grid_coords, const std::array<std::size_t, 3>& mesh);

/// Scatter compact coefficients onto a dense (nx, ny, nz, nspinors, nbands, nkpts, nspins)
/// grid, ready for an inverse FFT. Cells without a plane wave are zero.
ComplexArray coeffs_to_grid(
    const ComplexArray& coeffs,
    const IntArray& nwaves_at_kp,
    const IntArray& grid_coords,
    std::size_t nx, std::size_t ny, std::size_t nz
);

/// Assemble a wavefunction from a decoded checkpoint namespace.
WavefunctionRecord build_wavefunction(const Namespace& ns);

ComplexArray reciprocal_grid(const WavefunctionRecord& wf);

} // namespace castepbin

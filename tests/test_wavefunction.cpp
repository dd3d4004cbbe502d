#include "test_util.hpp"

#include "castepbin/wavefunction.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace castepbin;

static Namespace decode_bytes(const std::string& bytes) {
    std::istringstream is(bytes, std::ios::in | std::ios::binary);
    return decode_standard_file(is);
}

static std::size_t count_nonzero(const ComplexArray& a) {
    std::size_t n = 0;
    for (const auto& c : a.data) {
        if (c != std::complex<double>(0, 0)) ++n;
    }
    return n;
}

int main() {
    try {
        // One plane wave at (-1, 0, 0) on a 4x4x4 mesh lands at (3, 0, 0)
        {
            ComplexArray coeffs({1, 1, 1, 1, 1});
            coeffs.data[0] = {2.0, 3.0};
            IntArray nwaves({1});
            nwaves.data[0] = 1;
            IntArray coords({3, 1, 1});
            coords.data = {-1, 0, 0};

            ComplexArray grid = coeffs_to_grid(coeffs, nwaves, coords, 4, 4, 4);
            CHECK((grid.shape == std::vector<std::size_t>{4, 4, 4, 1, 1, 1, 1}));
            CHECK(grid.at({3, 0, 0, 0, 0, 0, 0}) == std::complex<double>(2.0, 3.0));
            CHECK(count_nonzero(grid) == 1);

            // with no populated slots nothing is scattered
            nwaves.data[0] = 0;
            CHECK(count_nonzero(coeffs_to_grid(coeffs, nwaves, coords, 4, 4, 4)) == 0);

            CHECK_THROWS_KIND(coeffs_to_grid(coeffs, nwaves, coords, 0, 4, 4), ErrorKind::InvalidData);
            nwaves.data[0] = 2;
            CHECK_THROWS_KIND(coeffs_to_grid(coeffs, nwaves, coords, 4, 4, 4), ErrorKind::InvalidData);
        }

        // True modulo in both directions
        {
            IntArray coords({3, 2, 1});
            coords.data = {-5, 4, -1, 9, -4, 0};
            IntArray idx = coords_to_indices(coords, {4, 3, 2});
            CHECK((idx.data == std::vector<std::int32_t>{3, 1, 1, 1, 2, 0}));
            CHECK(idx.shape == coords.shape);
        }

        // Checkpoint file end to end
        testutil::ModelOptions o;
        o.checkpoint = true;
        o.nbands = 3;
        const std::string check = testutil::build_model_file(o);
        {
            std::istringstream is(check, std::ios::in | std::ios::binary);
            RecordReader reader(is);
            CHECK(build_header_index(reader).checkpoint);

            Namespace ns = decode_bytes(check);
            CHECK(easy::get_reals(ns, "eigenvalues").at({2, 1, 0}) == testutil::eigenvalue(2, 1, 0));
            CHECK(easy::has(ns, "charge_density"));

            WavefunctionRecord wf = build_wavefunction(ns);
            CHECK(wf.nwaves_max() == 3);
            CHECK(wf.nspinors() == 1);
            CHECK(wf.nbands() == 3);
            CHECK(wf.nkpts() == 2);
            CHECK(wf.nspins() == 1);
            CHECK(wf.mesh_size[0] == 4 && wf.mesh_size[2] == 4);
            CHECK(wf.fermi_energy == testutil::kFermi);

            auto pw = wf.plane_wave_coeffs(0, 1, 2, 0);
            CHECK(pw.size() == 2);
            CHECK(pw[1] == testutil::coefficient(1, 2, 1, 0));

            IntArray g = wf.gvectors(0);
            CHECK((g.shape == std::vector<std::size_t>{3, 3}));
            CHECK(g.at({0, 0}) == -1 && g.at({1, 0}) == 0 && g.at({2, 0}) == 0);
            CHECK(g.at({2, 2}) == -2);

            IntArray m = wf.gmesh_indices(0);
            CHECK(m.at({0, 0}) == 3);
            CHECK(m.at({2, 2}) == 2);
            CHECK((wf.gmesh_indices(1).shape == std::vector<std::size_t>{3, 2}));

            RealArray cart = wf.kpoints_cartesian();
            const double b = 2 * 3.14159265358979323846 / testutil::kLattice;
            CHECK((cart.shape == std::vector<std::size_t>{3, 2}));
            CHECK(std::abs(cart.at({2, 1}) - b * testutil::kpoint(2, 1)) < 1e-12);
            CHECK(std::abs(cart.at({0, 0})) < 1e-12);

            ComplexArray grid = reciprocal_grid(wf);
            CHECK((grid.shape == std::vector<std::size_t>{4, 4, 4, 1, 3, 2, 1}));
            CHECK(grid.at({3, 0, 0, 0, 0, 0, 0}) == testutil::coefficient(0, 0, 0, 0));
            CHECK(grid.at({1, 0, 2, 0, 1, 0, 0}) == testutil::coefficient(2, 1, 0, 0));
            CHECK(grid.at({0, 1, 3, 0, 2, 1, 0}) == testutil::coefficient(1, 2, 1, 0));
            // 3 + 2 plane waves per band
            CHECK(count_nonzero(grid) == 3 * (3 + 2));

            // stored occupancies are kept as they are
            CHECK(wf.occupancies.at({1, 0, 0}) == 0.0);
        }

        // Band-structure runs store no occupancies
        {
            testutil::ModelOptions z = o;
            z.zero_occupancies = true;
            WavefunctionRecord wf = build_wavefunction(decode_bytes(testutil::build_model_file(z)));
            for (std::size_t k = 0; k < 2; ++k) {
                CHECK(wf.occupancies.at({0, k, 0}) == 1.0);
                CHECK(wf.occupancies.at({1, k, 0}) == 1.0);
                CHECK(wf.occupancies.at({2, k, 0}) == 0.0);
            }
        }

        // A standard file carries no wavefunction
        {
            Namespace ns = decode_bytes(testutil::build_model_file());
            CHECK_THROWS_KIND(build_wavefunction(ns), ErrorKind::MissingField);

            Namespace partial = decode_bytes(check);
            partial.erase("fermi_energy");
            CHECK_THROWS_KIND(build_wavefunction(partial), ErrorKind::MissingField);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}

#include "test_util.hpp"

#include "castepbin/fields.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace castepbin;

// Decode one structured block from `bytes` on top of a prepared namespace.
static void run_block(StructuredKind kind, const std::string& bytes, Namespace& ns) {
    std::istringstream is(bytes, std::ios::in | std::ios::binary);
    RecordReader reader(is);
    ShapeLedger ledger;
    ReadOptions opts;
    DecodeContext ctx{reader, ns, ledger, opts};
    decode_field(StructuredField{kind}, ctx);
}

static Namespace density_inputs(std::int32_t n, std::int32_t nspins, const std::string& treatment) {
    Namespace ns;
    ns["ngx_fine"] = Value::make_int(n);
    ns["ngy_fine"] = Value::make_int(n);
    ns["ngz_fine"] = Value::make_int(n);
    ns["nspins"] = Value::make_int(nspins);
    ns["spin_treatment"] = Value::make_string(treatment);
    return ns;
}

static std::vector<std::uint8_t> column(std::int32_t x, std::int32_t y, const std::vector<std::complex<double>>& v) {
    auto rec = easy::pack(std::vector<std::int32_t>{x, y});
    auto tail = testutil::c16(v, Endian::Big);
    rec.insert(rec.end(), tail.begin(), tail.end());
    return rec;
}

int main() {
    try {
        // 2x2x2 charge density: columns (1,1) and (2,2) carry data
        {
            testutil::SyntheticFile f(Endian::Big, false);
            f.w().write(column(1, 1, {{1, 0}, {2, 0}}));
            f.w().write(column(2, 2, {{3, 0}, {4, 0}}));
            f.w().write(column(2, 1, {{0, 0}, {0, 0}}));
            f.w().write(column(1, 2, {{0, 0}, {0, 0}}));

            Namespace ns = density_inputs(2, 1, "NONE");
            run_block(StructuredKind::ChargeDensity, f.bytes(), ns);

            const auto& rho = easy::get_complexes(ns, "charge_density");
            CHECK((rho.shape == std::vector<std::size_t>{2, 2, 2}));
            CHECK(rho.at({0, 0, 0}) == std::complex<double>(1, 0));
            CHECK(rho.at({0, 0, 1}) == std::complex<double>(2, 0));
            CHECK(rho.at({1, 1, 0}) == std::complex<double>(3, 0));
            CHECK(rho.at({1, 1, 1}) == std::complex<double>(4, 0));
            for (std::size_t z = 0; z < 2; ++z) {
                CHECK(rho.at({0, 1, z}) == std::complex<double>(0, 0));
                CHECK(rho.at({1, 0, z}) == std::complex<double>(0, 0));
            }
            CHECK(!easy::has(ns, "spin_density"));
        }

        // Bad column indices
        {
            testutil::SyntheticFile dup(Endian::Big, false);
            dup.w().write(column(1, 1, {{1, 0}, {2, 0}}));
            dup.w().write(column(1, 1, {{1, 0}, {2, 0}}));
            Namespace ns = density_inputs(2, 1, "NONE");
            CHECK_THROWS_KIND(run_block(StructuredKind::ChargeDensity, dup.bytes(), ns), ErrorKind::InvalidData);

            testutil::SyntheticFile out(Endian::Big, false);
            out.w().write(column(3, 1, {{1, 0}, {2, 0}}));
            Namespace ns2 = density_inputs(2, 1, "NONE");
            CHECK_THROWS_KIND(run_block(StructuredKind::ChargeDensity, out.bytes(), ns2), ErrorKind::InvalidData);

            testutil::SyntheticFile shortcol(Endian::Big, false);
            shortcol.w().write(column(1, 1, {{1, 0}}));
            Namespace ns3 = density_inputs(2, 1, "NONE");
            CHECK_THROWS_KIND(run_block(StructuredKind::ChargeDensity, shortcol.bytes(), ns3), ErrorKind::Truncated);

            Namespace ns4 = density_inputs(2, 1, "NONE");
            ns4.erase("spin_treatment");
            CHECK_THROWS_KIND(run_block(StructuredKind::ChargeDensity, dup.bytes(), ns4), ErrorKind::MissingField);
        }

        // Non-collinear spin density, component fastest; the treatment is matched case-insensitively
        {
            testutil::SyntheticFile f(Endian::Big, false);
            std::vector<std::complex<double>> v{{1, 0}};
            for (int c = 0; c < 3; ++c) v.push_back({10.0 + c, 0});
            f.w().write(column(1, 1, v));

            Namespace ns = density_inputs(1, 1, "vector");
            run_block(StructuredKind::ChargeDensity, f.bytes(), ns);
            const auto& spin = easy::get_complexes(ns, "spin_density");
            CHECK((spin.shape == std::vector<std::size_t>{1, 1, 1, 3}));
            CHECK(spin.at({0, 0, 0, 0}) == std::complex<double>(10, 0));
            CHECK(spin.at({0, 0, 0, 2}) == std::complex<double>(12, 0));
        }

        // Eigenvalues and occupancies: k-point outer, spin inner
        {
            testutil::SyntheticFile f(Endian::Big, false);
            for (std::size_t k = 0; k < 2; ++k) {
                for (std::size_t s = 0; s < 2; ++s) {
                    f.w().write_f64s({0.5 * k, 0.0, 0.25});
                    f.w().write_f64s({1.0, 0.5 * s, 0.0});
                    f.w().write_f64s({-2.0 + k, 1.0 + s, 3.0});
                }
            }

            Namespace ns;
            ns["nbands"] = Value::make_int(3);
            ns["nspins"] = Value::make_int(2);
            ns["nkpts"] = Value::make_int(2);
            run_block(StructuredKind::EigenvaluesOccupancies, f.bytes(), ns);

            const auto& eig = easy::get_reals(ns, "eigenvalues");
            const auto& occ = easy::get_reals(ns, "occupancies");
            CHECK((eig.shape == std::vector<std::size_t>{3, 2, 2}));
            CHECK((occ.shape == std::vector<std::size_t>{3, 2, 2}));
            CHECK(eig.at({0, 1, 0}) == -1.0);
            CHECK(eig.at({1, 0, 1}) == 2.0);
            CHECK(occ.at({1, 1, 1}) == 0.5);
            CHECK(occ.at({1, 1, 0}) == 0.0);

            const auto& kp = easy::get_reals(ns, "kpoints_of_eigenvalues");
            CHECK((kp.shape == std::vector<std::size_t>{3, 2}));
            CHECK(kp.at({0, 1}) == 0.5);
            CHECK(kp.at({2, 0}) == 0.25);

            Namespace missing;
            missing["nbands"] = Value::make_int(3);
            CHECK_THROWS_KIND(run_block(StructuredKind::EigenvaluesOccupancies, f.bytes(), missing),
                              ErrorKind::MissingField);
        }

        // Wavefunction block
        {
            testutil::ModelOptions o;
            o.nspins = 2;
            testutil::SyntheticFile f(Endian::Big, false);
            testutil::write_wavefunction(f, o);

            Namespace ns;
            run_block(StructuredKind::Wavefunction, f.bytes(), ns);
            const auto& wf = easy::require(ns, "wavefunction").as_struct();

            CHECK(easy::get_int(wf, "ngx") == testutil::kMesh);
            CHECK(easy::get_int(wf, "ngz") == testutil::kMesh);

            const auto& coeffs = easy::get_complexes(wf, "coeffs");
            CHECK((coeffs.shape == std::vector<std::size_t>{3, 1, 2, 2, 2}));
            CHECK(coeffs.at({2, 0, 1, 0, 1}) == testutil::coefficient(2, 1, 0, 1));
            CHECK(coeffs.at({1, 0, 0, 1, 0}) == testutil::coefficient(1, 0, 1, 0));
            // slots past nwaves_at_kp stay zero
            CHECK(coeffs.at({2, 0, 0, 1, 0}) == std::complex<double>(0, 0));

            const auto& nw = easy::get_ints(wf, "nwaves_at_kp");
            CHECK((nw.data == std::vector<std::int32_t>{3, 2}));

            const auto& coords = easy::get_ints(wf, "pw_grid_coords");
            CHECK((coords.shape == std::vector<std::size_t>{3, 3, 2}));
            CHECK(coords.at({0, 0, 0}) == -1);
            CHECK(coords.at({2, 2, 0}) == -2);
            CHECK(coords.at({1, 1, 1}) == 1);

            const auto& kpts = easy::get_reals(wf, "kpts");
            CHECK(kpts.at({2, 1}) == testutil::kpoint(2, 1));

            // nwaves above nwaves_max
            testutil::SyntheticFile bad(Endian::Big, false);
            bad.w().write_i32s({4, 4, 4});
            bad.w().write_i32s({1, 1, 1, 1, 1});
            bad.w().write(easy::concat({
                easy::pack(std::vector<double>{0.0, 0.0, 0.0}),
                easy::pack(std::vector<std::int32_t>{2}),
            }));
            Namespace ns2;
            CHECK_THROWS_KIND(run_block(StructuredKind::Wavefunction, bad.bytes(), ns2), ErrorKind::InvalidData);
        }

        CHECK(to_string(StructuredKind::ChargeDensity) == "charge density");
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}

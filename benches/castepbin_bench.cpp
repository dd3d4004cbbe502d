#include "castepbin/castep_bin_easy.hpp"
#include "castepbin/records.hpp"
#include "castepbin/wavefunction.hpp"

#include <chrono>
#include <complex>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

struct BenchSize {
    std::int32_t fine{64};
    std::int32_t mesh{32};
    std::int32_t nwaves_max{4000};
    std::int32_t nbands{16};
    std::int32_t nkpts{4};
};

// Synthetic checkpoint file: electronic parameters, two cells, and a ground state
// with wavefunction, eigenvalues and charge density.
static void write_checkpoint(const std::filesystem::path& file, const BenchSize& n) {
    using castepbin::RecordWriter;
    namespace easy = castepbin::easy;

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    RecordWriter w(os);
    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    w.write_text("BEGIN_ELECTRONIC");
    for (int i = 0; i < 5; ++i) w.write_i32(0);
    w.write_f64(0.0);
    for (int i = 0; i < 3; ++i) w.write_i32(0);
    w.write_text("DM", 10);
    for (int i = 0; i < 5; ++i) w.write_f64(0.0);
    w.write_text("NONE", 20);

    for (int pass = 0; pass < 2; ++pass) {
        w.write_text("CELL%REAL_LATTICE");
        w.write_f64s({10.0, 0, 0, 0, 10.0, 0, 0, 0, 10.0});
        w.write_text("CELL%RECIP_LATTICE");
        w.write_f64s({0.628, 0, 0, 0, 0.628, 0, 0, 0, 0.628});
        w.write_text("NKPTS");
        w.write_i32(n.nkpts);
        w.write_text("END_CELL_GLOBAL");
    }

    w.write_i32(1);
    w.write_i32(1);
    w.write_f64(-1000.0);
    w.write_f64(0.1);
    w.write(easy::pack(std::vector<std::int32_t>{n.nbands, 1}));

    // wavefunction
    w.write_i32s({n.mesh, n.mesh, n.mesh});
    w.write_i32s({n.nwaves_max, 1, n.nbands, n.nkpts, 1});
    std::uniform_int_distribution<std::int32_t> coord(-n.mesh / 2, n.mesh / 2 - 1);
    for (std::int32_t k = 0; k < n.nkpts; ++k) {
        w.write(easy::concat({
            easy::pack(std::vector<double>{0.0, 0.0, 0.25 * k}),
            easy::pack(std::vector<std::int32_t>{n.nwaves_max}),
        }));
        for (int axis = 0; axis < 3; ++axis) {
            std::vector<std::int32_t> g(static_cast<std::size_t>(n.nwaves_max));
            for (auto& x : g) x = coord(rng);
            w.write_i32s(g);
        }
        std::vector<std::complex<double>> c(static_cast<std::size_t>(n.nwaves_max));
        for (std::int32_t b = 0; b < n.nbands; ++b) {
            for (auto& x : c) x = {dist(rng), dist(rng)};
            w.write_c128s(c);
        }
    }

    // eigenvalues and occupancies
    for (std::int32_t k = 0; k < n.nkpts; ++k) {
        w.write_f64s({0.0, 0.0, 0.25 * k});
        w.write_f64s(std::vector<double>(static_cast<std::size_t>(n.nbands), 1.0));
        std::vector<double> eig(static_cast<std::size_t>(n.nbands));
        for (auto& e : eig) e = dist(rng);
        w.write_f64s(eig);
    }

    // charge density
    w.write_i32(1);
    w.write(easy::pack(std::vector<std::int32_t>{n.fine, n.fine, n.fine}));
    std::vector<std::complex<double>> col(static_cast<std::size_t>(n.fine));
    for (std::int32_t y = 1; y <= n.fine; ++y) {
        for (std::int32_t x = 1; x <= n.fine; ++x) {
            std::vector<std::uint8_t> rec = easy::pack(std::vector<std::int32_t>{x, y});
            for (auto& v : col) v = {dist(rng), 0.0};
            auto tail = easy::pack(col);
            rec.insert(rec.end(), tail.begin(), tail.end());
            w.write(rec);
        }
    }

    w.write_text("END");
}

int main(int argc, char** argv) {
    std::filesystem::path file = (argc >= 2) ? argv[1] : (std::filesystem::temp_directory_path() / "castepbin_bench.check");
    try {
        BenchSize size;
        write_checkpoint(file, size);

        std::uintmax_t sz = std::filesystem::file_size(file);
        double mb = static_cast<double>(sz) / (1024.0 * 1024.0);
        std::cout << "file=" << mb << " MiB\n";

        auto t0 = std::chrono::high_resolution_clock::now();
        castepbin::HeaderIndex index = castepbin::read_header_index(file);
        double i_ms = ms_since(t0);
        std::cout << "index : " << i_ms << " ms, " << index.entries.size() << " headers\n";

        t0 = std::chrono::high_resolution_clock::now();
        castepbin::Namespace ns = castepbin::decode_standard_file(file);
        double d_ms = ms_since(t0);
        std::cout << "decode: " << d_ms << " ms, throughput=" << (mb / (d_ms / 1000.0)) << " MiB/s\n";

        t0 = std::chrono::high_resolution_clock::now();
        castepbin::WavefunctionRecord wf = castepbin::build_wavefunction(ns);
        castepbin::ComplexArray grid = castepbin::reciprocal_grid(wf);
        double g_ms = ms_since(t0);
        std::cout << "grid  : " << g_ms << " ms, " << grid.size() << " cells\n";
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

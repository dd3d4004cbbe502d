#include "castepbin/castep_bin_easy.hpp"
#include "castepbin/logger.hpp"
#include "castepbin/wavefunction.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static void usage() {
    std::cerr <<
        "castepbin_demo - decode a CASTEP .castep_bin / .check file\n"
        "\n"
        "Usage:\n"
        "  castepbin_demo <FILE> [--header <H>]... [--little-endian] [--deferred] [--log <FILE>] [--debug]\n";
}

struct Args {
    std::string file;
    std::vector<std::string> headers;
    bool little_endian{false};
    bool deferred{false};
    bool debug{false};
    std::string log_file;
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2) return false;
    a.file = argv[1];

    int i = 2;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--little-endian") a.little_endian = true;
        else if (opt == "--deferred") a.deferred = true;
        else if (opt == "--debug") a.debug = true;
        else if (opt == "--header" && i < argc) a.headers.push_back(argv[i++]);
        else if (opt == "--log" && i < argc) a.log_file = argv[i++];
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    try {
        using namespace castepbin;

        const Logger::Level level = a.debug ? Logger::Level::Debug : Logger::Level::Warn;
        std::unique_ptr<Logger> logger = a.log_file.empty()
            ? std::make_unique<Logger>(level)
            : std::make_unique<Logger>(a.log_file, level);

        ReadOptions opts;
        opts.endian = a.little_endian ? Endian::Little : Endian::Big;
        opts.shapes = a.deferred ? ShapeMode::Deferred : ShapeMode::Eager;
        opts.logger = logger.get();

        HeaderIndex index = read_header_index(a.file, opts);
        std::cout << "File: " << a.file << (index.checkpoint ? " (checkpoint)" : "") << "\n";
        std::cout << "Headers: " << index.entries.size() << "\n";
        for (const auto& e : index.entries) {
            std::cout << "  " << std::left << std::setw(32) << e.name << " @ " << e.offset << "\n";
        }

        Namespace ns = decode_standard_file(a.file, a.headers, opts);
        std::cout << "Fields: " << ns.size() << "\n";
        for (const auto& [name, value] : ns) {
            std::cout << "  " << std::left << std::setw(32) << name << " " << value.describe() << "\n";
        }

        if (easy::has(ns, "wavefunction")) {
            WavefunctionRecord wf = build_wavefunction(ns);
            ComplexArray grid = reciprocal_grid(wf);
            std::cout << "Wavefunction: " << wf.nbands() << " bands, " << wf.nkpts() << " k-points, mesh "
                      << wf.mesh_size[0] << "x" << wf.mesh_size[1] << "x" << wf.mesh_size[2]
                      << ", grid of " << grid.size() << " coefficients\n";
        }
        return 0;

    } catch (const castepbin::CastepBinError& e) {
        std::cerr << "castepbin error (" << castepbin::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

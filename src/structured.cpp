#include "castepbin/fields.hpp"

#include "internal.hpp"

#include <algorithm>
#include <cctype>

namespace castepbin {

// ------------------------------
// Helpers
// ------------------------------

static std::vector<std::uint8_t> read_at_least(RecordReader& r, std::size_t bytes, const std::string& what) {
    const std::uint64_t offset = r.tell();
    std::vector<std::uint8_t> payload = r.read_payload();
    if (payload.size() < bytes) {
        throw CastepBinError(ErrorKind::Truncated,
            what + " record at offset " + std::to_string(offset) + " has " + std::to_string(payload.size())
            + " bytes, expected " + std::to_string(bytes));
    }
    return payload;
}

static std::size_t checked_count(std::int32_t n, const char* what) {
    if (n < 0) {
        throw CastepBinError(ErrorKind::InvalidData, std::string(what) + " is negative (" + std::to_string(n) + ")");
    }
    return static_cast<std::size_t>(n);
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// ------------------------------
// Eigenvalues and occupancies
// ------------------------------
//
// for each k-point, for each spin:
//   [f8 x 3 k-point] [f8 x nbands occupancies] [f8 x nbands eigenvalues]

static void decode_eigenvalues_occupancies(DecodeContext& ctx) {
    const std::size_t nbands = require_extent(ctx.ns, "nbands");
    const std::size_t nspins = require_extent(ctx.ns, "nspins");
    const std::size_t nkpts = require_extent(ctx.ns, "nkpts");
    const Endian e = ctx.reader.endian();

    RealArray occ({nbands, nkpts, nspins});
    RealArray eig({nbands, nkpts, nspins});
    RealArray kpts({3, nkpts});

    for (std::size_t k = 0; k < nkpts; ++k) {
        for (std::size_t s = 0; s < nspins; ++s) {
            auto kp = read_at_least(ctx.reader, 3 * 8, "k-point");
            for (std::size_t i = 0; i < 3; ++i) kpts.at({i, k}) = load_f64(kp.data() + 8 * i, e);

            auto o = read_at_least(ctx.reader, nbands * 8, "occupancy");
            const std::size_t base = occ.offset({0, k, s});
            for (std::size_t b = 0; b < nbands; ++b) occ.data[base + b] = load_f64(o.data() + 8 * b, e);

            auto ev = read_at_least(ctx.reader, nbands * 8, "eigenvalue");
            for (std::size_t b = 0; b < nbands; ++b) eig.data[base + b] = load_f64(ev.data() + 8 * b, e);
        }
    }

    ctx.ns["occupancies"] = Value::make_reals(std::move(occ));
    ctx.ns["eigenvalues"] = Value::make_reals(std::move(eig));
    ctx.ns["kpoints_of_eigenvalues"] = Value::make_reals(std::move(kpts));
}

// ------------------------------
// Fine-grid charge density
// ------------------------------
//
// nx * ny records, one per (x, y) column:
//   [i4 x, i4 y (1-based)] [c16 x nz density] [c16 x nz spin | c16 x 3nz vector spin]

static void decode_charge_density(DecodeContext& ctx) {
    const std::size_t nx = require_extent(ctx.ns, "ngx_fine");
    const std::size_t ny = require_extent(ctx.ns, "ngy_fine");
    const std::size_t nz = require_extent(ctx.ns, "ngz_fine");
    const std::size_t nspins = require_extent(ctx.ns, "nspins");

    auto it = ctx.ns.find("spin_treatment");
    if (it == ctx.ns.end()) {
        throw CastepBinError(ErrorKind::MissingField, "required field 'spin_treatment' has not been decoded");
    }
    const auto* treatment = std::get_if<std::string>(&it->second.v);
    if (!treatment) {
        throw CastepBinError(ErrorKind::InvalidData, "'spin_treatment' holds " + it->second.describe());
    }

    const bool noncollinear = upper(*treatment) == "VECTOR";
    const bool collinear_spin = nspins == 2 && !noncollinear;
    const std::size_t spin_components = noncollinear ? 3 : (collinear_spin ? 1 : 0);
    const std::size_t column_bytes = 8 + 16 * nz * (1 + spin_components);
    const Endian e = ctx.reader.endian();

    ComplexArray rho({nx, ny, nz});
    ComplexArray spin;
    if (noncollinear) spin = ComplexArray({nx, ny, nz, 3});
    else if (collinear_spin) spin = ComplexArray({nx, ny, nz});

    std::vector<bool> seen(nx * ny, false);
    for (std::size_t n = 0; n < nx * ny; ++n) {
        auto p = read_at_least(ctx.reader, column_bytes, "charge density column");
        const std::int32_t x = load_i32(p.data(), e);
        const std::int32_t y = load_i32(p.data() + 4, e);
        if (x < 1 || y < 1 || static_cast<std::size_t>(x) > nx || static_cast<std::size_t>(y) > ny) {
            throw CastepBinError(ErrorKind::InvalidData,
                "charge density column (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the "
                + std::to_string(nx) + " x " + std::to_string(ny) + " grid");
        }
        const std::size_t ix = static_cast<std::size_t>(x - 1);
        const std::size_t iy = static_cast<std::size_t>(y - 1);
        if (seen[ix + nx * iy]) {
            throw CastepBinError(ErrorKind::InvalidData,
                "charge density column (" + std::to_string(x) + ", " + std::to_string(y) + ") appears twice");
        }
        seen[ix + nx * iy] = true;

        const std::uint8_t* col = p.data() + 8;
        for (std::size_t z = 0; z < nz; ++z) rho.at({ix, iy, z}) = load_c128(col + 16 * z, e);

        col += 16 * nz;
        if (noncollinear) {
            for (std::size_t z = 0; z < nz; ++z) {
                for (std::size_t c = 0; c < 3; ++c) spin.at({ix, iy, z, c}) = load_c128(col + 16 * (3 * z + c), e);
            }
        } else if (collinear_spin) {
            for (std::size_t z = 0; z < nz; ++z) spin.at({ix, iy, z}) = load_c128(col + 16 * z, e);
        }
    }

    ctx.ns["charge_density"] = Value::make_complexes(std::move(rho));
    if (spin_components > 0) ctx.ns["spin_density"] = Value::make_complexes(std::move(spin));
}

// ------------------------------
// Plane-wave wavefunction
// ------------------------------
//
//   [i4 ngx ngy ngz]
//   [i4 nwaves_max nspinors nbands nkpts nspins]
//   for each spin, for each k-point:
//     [f8 x 3 k-point, i4 nwaves]
//     [i4 x nwaves grid x] [i4 x nwaves grid y] [i4 x nwaves grid z]
//     for each band, for each spinor: [c16 x nwaves]

static void decode_wavefunction(DecodeContext& ctx) {
    const Endian e = ctx.reader.endian();

    auto mesh = read_at_least(ctx.reader, 3 * 4, "wavefunction mesh");
    const std::int32_t ngx = load_i32(mesh.data(), e);
    const std::int32_t ngy = load_i32(mesh.data() + 4, e);
    const std::int32_t ngz = load_i32(mesh.data() + 8, e);

    auto dims = read_at_least(ctx.reader, 5 * 4, "wavefunction dimensions");
    const std::size_t nwaves_max = checked_count(load_i32(dims.data(), e), "nwaves_max");
    const std::size_t nspinors = checked_count(load_i32(dims.data() + 4, e), "nspinors");
    const std::size_t nbands = checked_count(load_i32(dims.data() + 8, e), "nbands");
    const std::size_t nkpts = checked_count(load_i32(dims.data() + 12, e), "nkpts");
    const std::size_t nspins = checked_count(load_i32(dims.data() + 16, e), "nspins");

    ComplexArray coeffs({nwaves_max, nspinors, nbands, nkpts, nspins});
    IntArray coords({3, nwaves_max, nkpts});
    IntArray nwaves_at_kp({nkpts});
    RealArray kpts({3, nkpts});

    // per k-point header record, decoded into a scratch namespace
    static const CompositeField kpoint_header{{
        ArrayField{"kpt", ElementType::Float64, {3}},
        ScalarField{"nwaves", ElementType::Int32},
    }};
    Namespace scratch;
    ShapeLedger ledger;
    DecodeContext sub{ctx.reader, scratch, ledger, ctx.opts};

    for (std::size_t s = 0; s < nspins; ++s) {
        for (std::size_t k = 0; k < nkpts; ++k) {
            decode_composite(kpoint_header, sub);
            const auto& kpt = std::get<RealArray>(scratch.at("kpt").v);
            const std::int32_t nw = std::get<std::int32_t>(scratch.at("nwaves").v);
            if (nw < 0 || static_cast<std::size_t>(nw) > nwaves_max) {
                throw CastepBinError(ErrorKind::InvalidData,
                    "k-point " + std::to_string(k + 1) + " has " + std::to_string(nw)
                    + " plane waves, more than nwaves_max = " + std::to_string(nwaves_max));
            }
            const auto nwaves = static_cast<std::size_t>(nw);
            nwaves_at_kp.at({k}) = nw;
            for (std::size_t i = 0; i < 3; ++i) kpts.at({i, k}) = kpt.data[i];

            for (std::size_t axis = 0; axis < 3; ++axis) {
                auto g = read_at_least(ctx.reader, nwaves * 4, "plane-wave grid coordinate");
                for (std::size_t i = 0; i < nwaves; ++i) coords.at({axis, i, k}) = load_i32(g.data() + 4 * i, e);
            }

            for (std::size_t b = 0; b < nbands; ++b) {
                for (std::size_t sp = 0; sp < nspinors; ++sp) {
                    auto c = read_at_least(ctx.reader, nwaves * 16, "plane-wave coefficient");
                    if (nwaves == 0) continue;
                    const std::size_t base = coeffs.offset({0, sp, b, k, s});
                    for (std::size_t i = 0; i < nwaves; ++i) coeffs.data[base + i] = load_c128(c.data() + 16 * i, e);
                }
            }
        }
    }

    Value::Struct wf;
    wf["coeffs"] = Value::make_complexes(std::move(coeffs));
    wf["pw_grid_coords"] = Value::make_ints(std::move(coords));
    wf["nwaves_at_kp"] = Value::make_ints(std::move(nwaves_at_kp));
    wf["kpts"] = Value::make_reals(std::move(kpts));
    wf["ngx"] = Value::make_int(ngx);
    wf["ngy"] = Value::make_int(ngy);
    wf["ngz"] = Value::make_int(ngz);
    ctx.ns["wavefunction"] = Value::make_struct(std::move(wf));
}

// ------------------------------
// Dispatch
// ------------------------------

void decode_structured(const StructuredField& field, DecodeContext& ctx) {
    internal::log(ctx.opts.logger, Logger::Level::Debug, "decoding " + to_string(field.kind) + " block");
    switch (field.kind) {
        case StructuredKind::EigenvaluesOccupancies: decode_eigenvalues_occupancies(ctx); return;
        case StructuredKind::ChargeDensity: decode_charge_density(ctx); return;
        case StructuredKind::Wavefunction: decode_wavefunction(ctx); return;
    }
    throw CastepBinError(ErrorKind::Unsupported, "unknown structured field kind");
}

} // namespace castepbin

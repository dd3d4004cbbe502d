#include "castepbin/fields.hpp"

#include "internal.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace castepbin {

// ------------------------------
// Field type system
// ------------------------------

std::size_t element_width(ElementType t, std::size_t text_width) {
    switch (t) {
        case ElementType::Int32: return 4;
        case ElementType::Float64: return 8;
        case ElementType::Complex128: return 16;
        case ElementType::Text: return text_width;
    }
    return 0;
}

const std::string& field_name(const ElementField& f) {
    return std::visit([](const auto& x) -> const std::string& { return x.name; }, f);
}

std::string to_string(StructuredKind k) {
    switch (k) {
        case StructuredKind::EigenvaluesOccupancies: return "eigenvalues/occupancies";
        case StructuredKind::ChargeDensity: return "charge density";
        case StructuredKind::Wavefunction: return "wavefunction";
    }
    return "unknown";
}

// ------------------------------
// Shape resolution
// ------------------------------

std::optional<std::size_t> lookup_extent(const Namespace& ns, const std::string& name) {
    auto it = ns.find(name);
    if (it == ns.end()) return std::nullopt;
    const auto* n = std::get_if<std::int32_t>(&it->second.v);
    if (!n) {
        throw CastepBinError(ErrorKind::InvalidData,
            "dimension '" + name + "' holds " + it->second.describe() + ", expected an int32 scalar");
    }
    if (*n < 0) {
        throw CastepBinError(ErrorKind::ShapeMismatch,
            "dimension '" + name + "' is negative (" + std::to_string(*n) + ")");
    }
    return static_cast<std::size_t>(*n);
}

std::size_t require_extent(const Namespace& ns, const std::string& name) {
    auto n = lookup_extent(ns, name);
    if (!n) throw CastepBinError(ErrorKind::MissingField, "required field '" + name + "' has not been decoded");
    return *n;
}

ResolvedShape resolve_shape(const std::vector<Dim>& declared, const Namespace& ns) {
    ResolvedShape out;
    out.extents.reserve(declared.size());
    for (std::size_t i = 0; i < declared.size(); ++i) {
        const Dim& d = declared[i];
        if (!d.is_named()) {
            out.extents.push_back(d.extent);
            continue;
        }
        auto n = lookup_extent(ns, d.name);
        if (n) {
            out.extents.push_back(*n);
        } else {
            out.extents.push_back(0);
            out.unknown_axes.push_back(i);
        }
    }
    return out;
}

std::vector<std::string> unresolved_names(const std::vector<Dim>& declared, const Namespace& ns) {
    std::vector<std::string> out;
    for (const auto& d : declared) {
        if (!d.is_named() || lookup_extent(ns, d.name)) continue;
        if (std::find(out.begin(), out.end(), d.name) == out.end()) out.push_back(d.name);
    }
    return out;
}

std::string describe_shape(const std::vector<Dim>& declared) {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < declared.size(); ++i) {
        if (i) oss << ", ";
        if (declared[i].is_named()) oss << declared[i].name;
        else oss << declared[i].extent;
    }
    oss << ")";
    return oss.str();
}

void ShapeLedger::park(std::string field, std::vector<Dim> declared) {
    for (auto& e : entries_) {
        if (e.field == field) {
            e.declared = std::move(declared);
            return;
        }
    }
    entries_.push_back(PendingShape{std::move(field), std::move(declared)});
}

void ShapeLedger::erase(const std::string& field) {
    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [&](const PendingShape& e) { return e.field == field; }),
        entries_.end());
}

static std::int32_t checked_extent(std::size_t n, const std::string& name) {
    if (n > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())) {
        throw CastepBinError(ErrorKind::ShapeMismatch, "solved extent of '" + name + "' does not fit in int32");
    }
    return static_cast<std::int32_t>(n);
}

static std::size_t flat_size(const Value& v, const std::string& field) {
    if (const auto* a = std::get_if<IntArray>(&v.v)) return a->size();
    if (const auto* a = std::get_if<RealArray>(&v.v)) return a->size();
    if (const auto* a = std::get_if<ComplexArray>(&v.v)) return a->size();
    throw CastepBinError(ErrorKind::InvalidData, "pending field '" + field + "' holds " + v.describe() + ", expected an array");
}

static void set_shape(Value& v, std::vector<std::size_t> shape) {
    if (auto* a = std::get_if<IntArray>(&v.v)) a->shape = std::move(shape);
    else if (auto* a = std::get_if<RealArray>(&v.v)) a->shape = std::move(shape);
    else if (auto* a = std::get_if<ComplexArray>(&v.v)) a->shape = std::move(shape);
}

// Solve the single unknown name of a parked field (if any) and reshape it in place.
static void solve_pending(Namespace& ns, const PendingShape& p, Logger* logger) {
    auto it = ns.find(p.field);
    if (it == ns.end()) {
        throw CastepBinError(ErrorKind::MissingField, "pending field '" + p.field + "' is not in the namespace");
    }
    const std::size_t total = flat_size(it->second, p.field);

    std::string unknown;
    unsigned occurrences = 0;
    std::size_t known = 1;
    for (const auto& d : p.declared) {
        if (!d.is_named()) {
            known *= d.extent;
            continue;
        }
        auto n = lookup_extent(ns, d.name);
        if (n) {
            known *= *n;
        } else {
            unknown = d.name;
            ++occurrences;
        }
    }

    if (occurrences > 0) {
        if (known == 0 || total % known != 0) {
            throw CastepBinError(ErrorKind::ShapeMismatch,
                "field '" + p.field + "' has " + std::to_string(total) + " elements, not a multiple of the known extents "
                + describe_shape(p.declared));
        }
        const std::size_t ratio = total / known;
        const auto n = static_cast<std::size_t>(
            std::llround(std::pow(static_cast<double>(ratio), 1.0 / static_cast<double>(occurrences))));
        std::size_t check = 1;
        for (unsigned i = 0; i < occurrences; ++i) check *= n;
        if (check != ratio) {
            throw CastepBinError(ErrorKind::ShapeMismatch,
                "field '" + p.field + "': " + std::to_string(ratio) + " is not a perfect power "
                + std::to_string(occurrences) + " for dimension '" + unknown + "'");
        }
        ns[unknown] = Value::make_int(checked_extent(n, unknown));
        internal::log(logger, Logger::Level::Debug,
            "solved '" + unknown + "' = " + std::to_string(n) + " from field '" + p.field + "'");
    }

    ResolvedShape rs = resolve_shape(p.declared, ns);
    if (numel(rs.extents) != total) {
        throw CastepBinError(ErrorKind::ShapeMismatch,
            "field '" + p.field + "' has " + std::to_string(total) + " elements but shape "
            + describe_shape(p.declared) + " needs " + std::to_string(numel(rs.extents)));
    }
    set_shape(it->second, std::move(rs.extents));
}

void resolve_pending(Namespace& ns, ShapeLedger& ledger, Logger* logger) {
    while (!ledger.empty()) {
        const std::vector<PendingShape> pending = ledger.entries();

        bool blocked = true;
        for (const auto& p : pending) {
            if (unresolved_names(p.declared, ns).size() < 2) {
                blocked = false;
                break;
            }
        }
        if (blocked) {
            std::ostringstream oss;
            oss << "cannot resolve shapes of";
            for (const auto& p : pending) oss << " '" << p.field << "' " << describe_shape(p.declared);
            oss << ": every field has two or more unknown dimensions";
            throw CastepBinError(ErrorKind::UnresolvableShape, oss.str());
        }

        for (const auto& p : pending) {
            if (unresolved_names(p.declared, ns).size() >= 2) continue;
            solve_pending(ns, p, logger);
            ledger.erase(p.field);
        }
    }
}

// ------------------------------
// Element decoding
// ------------------------------

static Value decode_elements(ElementType type, const std::uint8_t* data, std::size_t count,
                             std::vector<std::size_t> shape, std::size_t text_width, Endian e) {
    switch (type) {
        case ElementType::Int32: {
            IntArray a;
            a.shape = std::move(shape);
            a.data.resize(count);
            for (std::size_t i = 0; i < count; ++i) a.data[i] = load_i32(data + 4 * i, e);
            return Value::make_ints(std::move(a));
        }
        case ElementType::Float64: {
            RealArray a;
            a.shape = std::move(shape);
            a.data.resize(count);
            for (std::size_t i = 0; i < count; ++i) a.data[i] = load_f64(data + 8 * i, e);
            return Value::make_reals(std::move(a));
        }
        case ElementType::Complex128: {
            ComplexArray a;
            a.shape = std::move(shape);
            a.data.resize(count);
            for (std::size_t i = 0; i < count; ++i) a.data[i] = load_c128(data + 16 * i, e);
            return Value::make_complexes(std::move(a));
        }
        case ElementType::Text: {
            StringList out;
            out.reserve(count);
            for (std::size_t i = 0; i < count; ++i) out.push_back(internal::trim_text(data + text_width * i, text_width));
            return Value::make_strings(std::move(out));
        }
    }
    throw CastepBinError(ErrorKind::Unsupported, "unknown element type");
}

static Value decode_scalar(const ScalarField& f, const std::uint8_t* data, std::size_t size, Endian e) {
    if (f.type == ElementType::Text) {
        throw CastepBinError(ErrorKind::Unsupported, "scalar field '" + f.name + "' cannot have text type");
    }
    const std::size_t width = element_width(f.type);
    if (size < width) {
        throw CastepBinError(ErrorKind::Truncated,
            "field '" + f.name + "' needs " + std::to_string(width) + " bytes, record has " + std::to_string(size));
    }
    switch (f.type) {
        case ElementType::Int32: return Value::make_int(load_i32(data, e));
        case ElementType::Float64: return Value::make_real(load_f64(data, e));
        case ElementType::Complex128: return Value::make_complex(load_c128(data, e));
        case ElementType::Text: break;
    }
    throw CastepBinError(ErrorKind::Unsupported, "unknown element type for '" + f.name + "'");
}

static Value decode_array(const ArrayField& f, const std::uint8_t* data, std::size_t size, DecodeContext& ctx) {
    const std::size_t width = element_width(f.type, f.text_width);
    if (width == 0) {
        throw CastepBinError(ErrorKind::InvalidData, "array field '" + f.name + "' has zero element width");
    }
    if (f.type == ElementType::Text && f.shape.size() != 1) {
        throw CastepBinError(ErrorKind::Unsupported,
            "text array '" + f.name + "' must be one-dimensional, got shape " + describe_shape(f.shape));
    }
    const Endian e = ctx.reader.endian();

    ResolvedShape rs = resolve_shape(f.shape, ctx.ns);
    if (rs.unknown_axes.empty()) {
        const std::size_t count = numel(rs.extents);
        if (count > size / width) {
            throw CastepBinError(ErrorKind::Truncated,
                "field '" + f.name + "' with shape " + describe_shape(f.shape) + " needs "
                + std::to_string(count * width) + " bytes, record has " + std::to_string(size));
        }
        ctx.ledger.erase(f.name);
        return decode_elements(f.type, data, count, std::move(rs.extents), f.text_width, e);
    }

    if (size % width != 0) {
        throw CastepBinError(ErrorKind::ShapeMismatch,
            "field '" + f.name + "': record of " + std::to_string(size) + " bytes is not a whole number of "
            + std::to_string(width) + "-byte elements");
    }
    const std::size_t total = size / width;

    if (rs.unknown_axes.size() > 1) {
        if (ctx.opts.shapes == ShapeMode::Deferred) {
            ctx.ledger.park(f.name, f.shape);
            internal::log(ctx.opts.logger, Logger::Level::Debug,
                "deferring shape " + describe_shape(f.shape) + " of '" + f.name + "' ("
                + std::to_string(total) + " elements)");
            return decode_elements(f.type, data, total, {total}, f.text_width, e);
        }
        throw CastepBinError(ErrorKind::AmbiguousShape,
            "field '" + f.name + "' has " + std::to_string(rs.unknown_axes.size())
            + " unresolved dimensions in shape " + describe_shape(f.shape));
    }

    const std::size_t axis = rs.unknown_axes.front();
    std::size_t known = 1;
    for (std::size_t i = 0; i < rs.extents.size(); ++i) {
        if (i != axis) known *= rs.extents[i];
    }
    if (known == 0 || total % known != 0) {
        throw CastepBinError(ErrorKind::ShapeMismatch,
            "field '" + f.name + "': " + std::to_string(total) + " elements do not divide into shape "
            + describe_shape(f.shape));
    }
    const std::string& dim = f.shape[axis].name;
    rs.extents[axis] = total / known;
    ctx.ns[dim] = Value::make_int(checked_extent(rs.extents[axis], dim));
    ctx.ledger.erase(f.name);
    return decode_elements(f.type, data, total, std::move(rs.extents), f.text_width, e);
}

namespace {

struct ElementDecoder {
    const std::uint8_t* data;
    std::size_t size;
    DecodeContext& ctx;

    Value operator()(const ScalarField& f) const { return decode_scalar(f, data, size, ctx.reader.endian()); }

    Value operator()(const ArrayField& f) const { return decode_array(f, data, size, ctx); }

    Value operator()(const StringField& f) const {
        const std::size_t width = f.width ? f.width : size;
        if (size < width) {
            throw CastepBinError(ErrorKind::Truncated,
                "string field '" + f.name + "' needs " + std::to_string(width) + " bytes, record has "
                + std::to_string(size));
        }
        return Value::make_string(internal::trim_text(data, width));
    }

    Value operator()(const BoolField& f) const {
        if (size < 4) {
            throw CastepBinError(ErrorKind::Truncated, "logical field '" + f.name + "' needs 4 bytes");
        }
        return Value::make_bool(load_i32(data, ctx.reader.endian()) != 0);
    }
};

} // namespace

Value decode_element(const ElementField& field, const std::uint8_t* data, std::size_t size, DecodeContext& ctx) {
    return std::visit(ElementDecoder{data, size, ctx}, field);
}

// ------------------------------
// Composite records
// ------------------------------

long long composite_consumption(const ElementField& field, const Namespace& ns) {
    if (const auto* s = std::get_if<ScalarField>(&field)) {
        if (s->type == ElementType::Text) return 0;
        return static_cast<long long>(element_width(s->type));
    }
    if (const auto* s = std::get_if<StringField>(&field)) return static_cast<long long>(s->width);
    if (std::holds_alternative<BoolField>(field)) return 4;

    const auto& a = std::get<ArrayField>(field);
    ResolvedShape rs = resolve_shape(a.shape, ns);
    if (!rs.unknown_axes.empty()) return 0;
    return static_cast<long long>(element_width(a.type, a.text_width) * numel(rs.extents));
}

void decode_composite(const CompositeField& field, DecodeContext& ctx) {
    const std::uint64_t offset = ctx.reader.tell();
    const std::vector<std::uint8_t> payload = ctx.reader.read_payload();

    std::size_t cursor = 0;
    for (const auto& sub : field.fields) {
        const long long bytes = composite_consumption(sub, ctx.ns);
        if (bytes <= 0) {
            throw CastepBinError(ErrorKind::InvalidCompositeLayout,
                "composite record at offset " + std::to_string(offset) + ": sub-field '" + field_name(sub)
                + "' has no known size");
        }
        const auto n = static_cast<std::size_t>(bytes);
        if (n > payload.size() - cursor) {
            throw CastepBinError(ErrorKind::Truncated,
                "composite record at offset " + std::to_string(offset) + " ends inside sub-field '"
                + field_name(sub) + "'");
        }
        Value v = decode_element(sub, payload.data() + cursor, n, ctx);
        ctx.ns[field_name(sub)] = std::move(v);
        cursor += n;
    }
}

// ------------------------------
// Field dispatch
// ------------------------------

namespace {

struct FieldDecoder {
    DecodeContext& ctx;

    template <typename F>
    void element(const F& f) const {
        const std::vector<std::uint8_t> payload = ctx.reader.read_payload();
        Value v = decode_element(ElementField{f}, payload.data(), payload.size(), ctx);
        ctx.ns[f.name] = std::move(v);
    }

    void operator()(const ScalarField& f) const { element(f); }
    void operator()(const ArrayField& f) const { element(f); }
    void operator()(const StringField& f) const { element(f); }
    void operator()(const BoolField& f) const { element(f); }
    void operator()(const SkipField&) const { ctx.reader.skip(); }

    void operator()(const CopyField& f) const {
        if (ctx.ns.count(f.to)) return;
        auto it = ctx.ns.find(f.from);
        if (it == ctx.ns.end()) {
            throw CastepBinError(ErrorKind::MissingField, "field '" + f.from + "' has not been decoded");
        }
        ctx.ns[f.to] = it->second;
    }
    void operator()(const CompositeField& f) const { decode_composite(f, ctx); }
    void operator()(const StructuredField& f) const { decode_structured(f, ctx); }
};

} // namespace

void decode_field(const FieldSpec& field, DecodeContext& ctx) {
    std::visit(FieldDecoder{ctx}, field);
}

} // namespace castepbin

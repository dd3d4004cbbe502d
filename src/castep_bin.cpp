#include "castepbin/castep_bin.hpp"
#include "castepbin/fields.hpp"
#include "castepbin/records.hpp"

#include "internal.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

#include <zlib.h>

namespace castepbin {

CastepBinError::CastepBinError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind CastepBinError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::Truncated: return "Truncated";
        case ErrorKind::RecordMarkerMismatch: return "RecordMarkerMismatch";
        case ErrorKind::HeaderNotFound: return "HeaderNotFound";
        case ErrorKind::AmbiguousShape: return "AmbiguousShape";
        case ErrorKind::UnresolvableShape: return "UnresolvableShape";
        case ErrorKind::ShapeMismatch: return "ShapeMismatch";
        case ErrorKind::InvalidCompositeLayout: return "InvalidCompositeLayout";
        case ErrorKind::MissingField: return "MissingField";
        case ErrorKind::InvalidData: return "InvalidData";
        case ErrorKind::Unsupported: return "Unsupported";
        case ErrorKind::ZlibError: return "ZlibError";
    }
    return "Unknown";
}

std::size_t numel(const std::vector<std::size_t>& shape) {
    if (shape.empty()) return 0;
    std::size_t n = 1;
    for (std::size_t d : shape) {
        if (d != 0 && n > (std::numeric_limits<std::size_t>::max)() / d) {
            throw CastepBinError(ErrorKind::InvalidData, "array shape element count overflows");
        }
        n *= d;
    }
    return n;
}

// ------------------------------
// Value
// ------------------------------

Value Value::make_struct() { return Value{Struct{}}; }
Value Value::make_struct(Struct m) { return Value{std::move(m)}; }

Value Value::make_int(std::int32_t x) { return Value{x}; }
Value Value::make_real(double x) { return Value{x}; }
Value Value::make_complex(std::complex<double> x) { return Value{x}; }
Value Value::make_bool(bool b) { return Value{b}; }
Value Value::make_string(std::string s) { return Value{std::move(s)}; }
Value Value::make_strings(StringList s) { return Value{std::move(s)}; }
Value Value::make_ints(IntArray a) { return Value{std::move(a)}; }
Value Value::make_reals(RealArray a) { return Value{std::move(a)}; }
Value Value::make_complexes(ComplexArray a) { return Value{std::move(a)}; }

bool Value::is_struct() const noexcept { return std::holds_alternative<Struct>(v); }

const Value::Struct& Value::as_struct() const {
    if (!is_struct()) throw CastepBinError(ErrorKind::InvalidData, "value is " + describe() + ", not a struct");
    return std::get<Struct>(v);
}

Value::Struct& Value::as_struct() {
    if (!is_struct()) throw CastepBinError(ErrorKind::InvalidData, "value is " + describe() + ", not a struct");
    return std::get<Struct>(v);
}

static std::string shape_label(const std::vector<std::size_t>& shape) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << " x ";
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

std::string Value::describe() const {
    if (const auto* s = std::get_if<Struct>(&v)) return "struct{" + std::to_string(s->size()) + "}";
    if (std::holds_alternative<std::int32_t>(v)) return "int32";
    if (std::holds_alternative<double>(v)) return "float64";
    if (std::holds_alternative<std::complex<double>>(v)) return "complex128";
    if (std::holds_alternative<bool>(v)) return "bool";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (const auto* s = std::get_if<StringList>(&v)) return "string[" + std::to_string(s->size()) + "]";
    if (const auto* a = std::get_if<IntArray>(&v)) return "int32" + shape_label(a->shape);
    if (const auto* a = std::get_if<RealArray>(&v)) return "float64" + shape_label(a->shape);
    if (const auto* a = std::get_if<ComplexArray>(&v)) return "complex128" + shape_label(a->shape);
    return "unknown";
}

// ------------------------------
// Text helpers (internal)
// ------------------------------

namespace internal {

static bool is_pad(char c) {
    return c == ' ' || c == '\0' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim_text(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_pad(s[b])) ++b;
    while (e > b && is_pad(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string trim_text(const std::uint8_t* data, std::size_t size) {
    if (size == 0) return {};
    return trim_text(std::string(reinterpret_cast<const char*>(data), size));
}

std::optional<std::string> header_text(const std::uint8_t* data, std::size_t size) {
    // only trailing NULs are tolerated; anything else must be printable ASCII
    while (size > 0 && data[size - 1] == 0) --size;
    if (size == 0) return std::nullopt;
    for (std::size_t i = 0; i < size; ++i) {
        if (data[i] < 0x20 || data[i] > 0x7E) return std::nullopt;
    }
    std::string s = trim_text(data, size);
    while (!s.empty() && s.front() == '\'') s.erase(s.begin());
    while (!s.empty() && s.back() == '\'') s.pop_back();
    s = trim_text(s);

    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) return std::nullopt;
    for (char c : s) {
        if (std::islower(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return s;
}

} // namespace internal

// ------------------------------
// Header index
// ------------------------------

const HeaderEntry* HeaderIndex::find(const std::string& name) const {
    for (const auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

bool HeaderIndex::contains(const std::string& name) const { return find(name) != nullptr; }

static std::string suffixed_name(const HeaderIndex& index, const std::string& name) {
    for (int counter = 1;; ++counter) {
        std::ostringstream oss;
        oss << name << "_" << std::setw(2) << std::setfill('0') << counter;
        if (!index.contains(oss.str())) return oss.str();
    }
}

HeaderIndex build_header_index(RecordReader& reader, Logger* logger) {
    HeaderIndex index;

    const std::uint64_t start = reader.tell();
    Record title = reader.read(true);
    const bool has_title = title.payload &&
        internal::trim_text(title.payload->data(), title.payload->size()) == "CASTEP_BIN";
    if (!has_title) {
        index.checkpoint = true;
        reader.seek(start);
        internal::log(logger, Logger::Level::Info, "no CASTEP_BIN title record, reading as a checkpoint file");
    }

    try {
        while (true) {
            Record rec = reader.read(true);
            if (!rec.payload) continue;
            auto name = internal::header_text(rec.payload->data(), rec.payload->size());
            if (!name) continue;
            if (*name == "END") break;

            const std::uint64_t next = reader.tell();
            if (index.contains(*name)) {
                std::string alias = suffixed_name(index, *name);
                internal::log(logger, Logger::Level::Debug, "header '" + *name + "' repeats, indexed as '" + alias + "'");
                index.entries.push_back(HeaderEntry{std::move(alias), next});
            } else {
                index.entries.push_back(HeaderEntry{std::move(*name), next});
            }
        }
    } catch (const CastepBinError& e) {
        if (e.kind() != ErrorKind::Truncated) throw;
        throw CastepBinError(ErrorKind::Truncated, std::string("file ends before the END header: ") + e.what());
    }

    internal::log(logger, Logger::Level::Info, "indexed " + std::to_string(index.entries.size()) + " section headers");
    return index;
}

// ------------------------------
// Section dispatch
// ------------------------------

static bool always_kept(const std::string& header) {
    return header.compare(0, 5, "CELL%") == 0;
}

Namespace decode_sections(
    RecordReader& reader,
    const SpecTable& spec,
    const HeaderIndex& index,
    const std::vector<std::string>& headers,
    const ReadOptions& opts
) {
    for (const auto& h : headers) {
        auto it = std::find_if(spec.begin(), spec.end(), [&](const Section& s) { return s.header == h; });
        if (it == spec.end()) {
            throw CastepBinError(ErrorKind::Unsupported, "no decoder is defined for header '" + h + "'");
        }
    }

    Namespace ns;
    ShapeLedger ledger;
    DecodeContext ctx{reader, ns, ledger, opts};

    for (const auto& section : spec) {
        const bool requested = std::find(headers.begin(), headers.end(), section.header) != headers.end();
        if (!headers.empty() && !requested && !always_kept(section.header)) continue;

        const HeaderEntry* entry = index.find(section.header);
        if (!entry) {
            if (requested) {
                throw CastepBinError(ErrorKind::HeaderNotFound, "header '" + section.header + "' is not in the file");
            }
            internal::log(opts.logger, Logger::Level::Debug, "section '" + section.header + "' not present, skipped");
            continue;
        }

        reader.seek(entry->offset);
        try {
            for (const auto& field : section.fields) decode_field(field, ctx);
        } catch (const CastepBinError& e) {
            throw CastepBinError(e.kind(), "section '" + section.header + "': " + e.what());
        }
        internal::log(opts.logger, Logger::Level::Debug, "decoded section '" + section.header + "'");
    }

    if (!ledger.empty()) {
        internal::log(opts.logger, Logger::Level::Info,
            "resolving " + std::to_string(ledger.size()) + " deferred array shape(s)");
        resolve_pending(ns, ledger, opts.logger);
    }
    return ns;
}

// ------------------------------
// File entry points
// ------------------------------

namespace {

struct InflateStream {
    z_stream zs{};
    bool open{false};

    ~InflateStream() {
        if (open) inflateEnd(&zs);
    }
};

} // namespace

static std::string inflate_gzip(std::istream& is) {
    InflateStream s;
    if (inflateInit2(&s.zs, 16 + MAX_WBITS) != Z_OK) {
        throw CastepBinError(ErrorKind::ZlibError, "zlib inflateInit2 failed");
    }
    s.open = true;

    std::vector<char> in(1 << 16);
    std::vector<char> buf(1 << 16);
    std::string out;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (s.zs.avail_in == 0 && is) {
            is.read(in.data(), static_cast<std::streamsize>(in.size()));
            s.zs.next_in = reinterpret_cast<Bytef*>(in.data());
            s.zs.avail_in = static_cast<uInt>(is.gcount());
        }
        s.zs.next_out = reinterpret_cast<Bytef*>(buf.data());
        s.zs.avail_out = static_cast<uInt>(buf.size());
        rc = inflate(&s.zs, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR && s.zs.avail_in == 0 && !is) {
            throw CastepBinError(ErrorKind::ZlibError, "gzip stream ends before its trailer");
        }
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            throw CastepBinError(ErrorKind::ZlibError,
                std::string("zlib inflate failed: ") + (s.zs.msg ? s.zs.msg : std::to_string(rc)));
        }
        out.append(buf.data(), buf.size() - s.zs.avail_out);
    }
    return out;
}

// True when the stream starts with the gzip magic. The position is restored.
static bool is_gzip(std::istream& is) {
    const auto pos = is.tellg();
    std::array<unsigned char, 2> magic{};
    is.read(reinterpret_cast<char*>(magic.data()), 2);
    const bool gz = is.gcount() == 2 && magic[0] == 0x1f && magic[1] == 0x8b;
    is.clear();
    is.seekg(pos);
    if (!is) throw CastepBinError(ErrorKind::Io, "failed to rewind input stream");
    return gz;
}

static std::ifstream open_file(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw CastepBinError(ErrorKind::Io, "failed to open " + file.string());
    return is;
}

Namespace decode_standard_file(
    std::istream& is,
    const std::vector<std::string>& headers,
    const ReadOptions& opts
) {
    if (is_gzip(is)) {
        internal::log(opts.logger, Logger::Level::Debug, "inflating gzip input");
        std::istringstream raw(inflate_gzip(is), std::ios::binary);
        return decode_standard_file(raw, headers, opts);
    }
    RecordReader reader(is, opts);
    HeaderIndex index = build_header_index(reader, opts.logger);
    return decode_sections(reader, spec_for(index), index, headers, opts);
}

Namespace decode_standard_file(
    const std::filesystem::path& file,
    const std::vector<std::string>& headers,
    const ReadOptions& opts
) {
    std::ifstream is = open_file(file);
    internal::log(opts.logger, Logger::Level::Info, "reading " + file.string());
    return decode_standard_file(is, headers, opts);
}

HeaderIndex read_header_index(const std::filesystem::path& file, const ReadOptions& opts) {
    std::ifstream is = open_file(file);
    if (is_gzip(is)) {
        std::istringstream raw(inflate_gzip(is), std::ios::binary);
        RecordReader reader(raw, opts);
        return build_header_index(reader, opts.logger);
    }
    RecordReader reader(is, opts);
    return build_header_index(reader, opts.logger);
}

} // namespace castepbin

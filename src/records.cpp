#include "castepbin/records.hpp"

#include <array>
#include <cstring>
#include <limits>
#include <sstream>

namespace castepbin {

// ------------------------------
// Element codecs
// ------------------------------

std::uint32_t load_u32(const std::uint8_t* p, Endian e) noexcept {
    if (e == Endian::Big) {
        return (static_cast<std::uint32_t>(p[0]) << 24) |
               (static_cast<std::uint32_t>(p[1]) << 16) |
               (static_cast<std::uint32_t>(p[2]) <<  8) |
               (static_cast<std::uint32_t>(p[3])      );
    }
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

std::int32_t load_i32(const std::uint8_t* p, Endian e) noexcept {
    return static_cast<std::int32_t>(load_u32(p, e));
}

static std::uint64_t load_u64(const std::uint8_t* p, Endian e) noexcept {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; ++i) {
        const int shift = (e == Endian::Big) ? 8 * (7 - i) : 8 * i;
        u |= static_cast<std::uint64_t>(p[i]) << shift;
    }
    return u;
}

double load_f64(const std::uint8_t* p, Endian e) noexcept {
    const std::uint64_t u = load_u64(p, e);
    double d = 0.0;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

std::complex<double> load_c128(const std::uint8_t* p, Endian e) noexcept {
    return {load_f64(p, e), load_f64(p + 8, e)};
}

void append_u32(std::vector<std::uint8_t>& out, std::uint32_t v, Endian e) {
    for (int i = 0; i < 4; ++i) {
        const int shift = (e == Endian::Big) ? 8 * (3 - i) : 8 * i;
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFu));
    }
}

void append_i32(std::vector<std::uint8_t>& out, std::int32_t v, Endian e) {
    append_u32(out, static_cast<std::uint32_t>(v), e);
}

void append_f64(std::vector<std::uint8_t>& out, double v, Endian e) {
    std::uint64_t u = 0;
    std::memcpy(&u, &v, sizeof(u));
    for (int i = 0; i < 8; ++i) {
        const int shift = (e == Endian::Big) ? 8 * (7 - i) : 8 * i;
        out.push_back(static_cast<std::uint8_t>((u >> shift) & 0xFFu));
    }
}

void append_c128(std::vector<std::uint8_t>& out, std::complex<double> v, Endian e) {
    append_f64(out, v.real(), e);
    append_f64(out, v.imag(), e);
}

// ------------------------------
// RecordReader
// ------------------------------

RecordReader::RecordReader(std::istream& is, Endian endian, std::uint32_t inline_payload_limit)
    : is_(is), endian_(endian), inline_limit_(inline_payload_limit) {
    if (!is_) throw CastepBinError(ErrorKind::Io, "RecordReader: stream is not readable");
}

RecordReader::RecordReader(std::istream& is, const ReadOptions& opts)
    : RecordReader(is, opts.endian, opts.inline_payload_limit) {}

std::uint32_t RecordReader::read_marker(const char* which) {
    std::array<std::uint8_t, 4> b{};
    is_.read(reinterpret_cast<char*>(b.data()), 4);
    if (!is_) {
        throw CastepBinError(ErrorKind::Truncated, std::string("unexpected EOF reading ") + which + " record marker");
    }
    return load_u32(b.data(), endian_);
}

Record RecordReader::read(bool skip_payload) {
    Record rec;
    rec.offset = tell();
    rec.length = read_marker("leading");

    if (!skip_payload || rec.length <= inline_limit_) {
        std::vector<std::uint8_t> buf(rec.length);
        if (!buf.empty()) {
            is_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
            if (!is_) {
                std::ostringstream oss;
                oss << "unexpected EOF in record payload at offset " << rec.offset
                    << " (declared " << rec.length << " bytes)";
                throw CastepBinError(ErrorKind::Truncated, oss.str());
            }
        }
        rec.payload = std::move(buf);
    } else {
        is_.seekg(static_cast<std::streamoff>(rec.length), std::ios::cur);
        if (!is_) throw CastepBinError(ErrorKind::Io, "seek failed while skipping record payload");
    }

    const std::uint32_t trailing = read_marker("trailing");
    if (trailing != rec.length) {
        std::ostringstream oss;
        oss << "record at offset " << rec.offset << ": leading marker " << rec.length
            << " does not match trailing marker " << trailing;
        throw CastepBinError(ErrorKind::RecordMarkerMismatch, oss.str());
    }
    return rec;
}

std::vector<std::uint8_t> RecordReader::read_payload() {
    Record rec = read(false);
    return std::move(*rec.payload);
}

void RecordReader::skip() {
    (void)read(true);
}

std::uint64_t RecordReader::tell() {
    const auto pos = is_.tellg();
    if (pos < 0) throw CastepBinError(ErrorKind::Io, "unable to query stream position");
    return static_cast<std::uint64_t>(pos);
}

void RecordReader::seek(std::uint64_t pos) {
    is_.clear();
    is_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    if (!is_) {
        throw CastepBinError(ErrorKind::Io, "seek to offset " + std::to_string(pos) + " failed");
    }
}

// ------------------------------
// RecordWriter
// ------------------------------

RecordWriter::RecordWriter(std::ostream& os, Endian endian)
    : os_(os), endian_(endian) {
    if (!os_) throw CastepBinError(ErrorKind::Io, "RecordWriter: stream is not writable");
}

void RecordWriter::write(const std::vector<std::uint8_t>& payload) {
    if (payload.size() > (std::numeric_limits<std::uint32_t>::max)()) {
        throw CastepBinError(ErrorKind::InvalidData, "record payload exceeds 32-bit marker range");
    }
    std::vector<std::uint8_t> marker;
    append_u32(marker, static_cast<std::uint32_t>(payload.size()), endian_);

    os_.write(reinterpret_cast<const char*>(marker.data()), 4);
    if (!payload.empty()) {
        os_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    os_.write(reinterpret_cast<const char*>(marker.data()), 4);
    if (!os_) throw CastepBinError(ErrorKind::Io, "failed writing record");
}

void RecordWriter::write_text(const std::string& s, std::size_t width) {
    std::vector<std::uint8_t> out(s.begin(), s.end());
    if (out.size() < width) out.resize(width, static_cast<std::uint8_t>(' '));
    write(out);
}

void RecordWriter::write_i32(std::int32_t v) {
    std::vector<std::uint8_t> out;
    append_i32(out, v, endian_);
    write(out);
}

void RecordWriter::write_f64(double v) {
    std::vector<std::uint8_t> out;
    append_f64(out, v, endian_);
    write(out);
}

void RecordWriter::write_i32s(const std::vector<std::int32_t>& v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size() * 4);
    for (auto x : v) append_i32(out, x, endian_);
    write(out);
}

void RecordWriter::write_f64s(const std::vector<double>& v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size() * 8);
    for (auto x : v) append_f64(out, x, endian_);
    write(out);
}

void RecordWriter::write_c128s(const std::vector<std::complex<double>>& v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size() * 16);
    for (const auto& x : v) append_c128(out, x, endian_);
    write(out);
}

} // namespace castepbin

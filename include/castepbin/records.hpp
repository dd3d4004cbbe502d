#pragma once

#include "castepbin/castep_bin.hpp"

#include <complex>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace castepbin {

// ------------------------------
// Element codecs
// ------------------------------

std::uint32_t load_u32(const std::uint8_t* p, Endian e) noexcept;
std::int32_t load_i32(const std::uint8_t* p, Endian e) noexcept;
double load_f64(const std::uint8_t* p, Endian e) noexcept;
std::complex<double> load_c128(const std::uint8_t* p, Endian e) noexcept;

void append_u32(std::vector<std::uint8_t>& out, std::uint32_t v, Endian e);
void append_i32(std::vector<std::uint8_t>& out, std::int32_t v, Endian e);
void append_f64(std::vector<std::uint8_t>& out, double v, Endian e);
void append_c128(std::vector<std::uint8_t>& out, std::complex<double> v, Endian e);

// ------------------------------
// Fortran unformatted sequential records
// ------------------------------
//
//   [u32 length][length bytes of payload][u32 length]

struct Record {
    std::uint64_t offset{0}; // stream position of the leading marker
    std::uint32_t length{0};
    // Absent when the payload was skipped over.
    std::optional<std::vector<std::uint8_t>> payload{};
};

class RecordReader {
public:
    explicit RecordReader(std::istream& is, Endian endian = Endian::Big,
                          std::uint32_t inline_payload_limit = 512);
    RecordReader(std::istream& is, const ReadOptions& opts);

    /// Read one record. With `skip_payload`, payloads longer than the inline limit are
    /// seeked over instead of read. Throws RecordMarkerMismatch if the markers differ.
    Record read(bool skip_payload = false);

    /// Read one record and return its payload.
    std::vector<std::uint8_t> read_payload();

    /// Advance past one record without keeping it.
    void skip();

    std::uint64_t tell();
    void seek(std::uint64_t pos);

    Endian endian() const noexcept { return endian_; }

private:
    std::uint32_t read_marker(const char* which);

    std::istream& is_;
    Endian endian_;
    std::uint32_t inline_limit_;
};

class RecordWriter {
public:
    explicit RecordWriter(std::ostream& os, Endian endian = Endian::Big);

    void write(const std::vector<std::uint8_t>& payload);

    // Space-padded to `width` when width is larger than the text.
    void write_text(const std::string& s, std::size_t width = 0);

    void write_i32(std::int32_t v);
    void write_f64(double v);
    void write_i32s(const std::vector<std::int32_t>& v);
    void write_f64s(const std::vector<double>& v);
    void write_c128s(const std::vector<std::complex<double>>& v);

    Endian endian() const noexcept { return endian_; }

private:
    std::ostream& os_;
    Endian endian_;
};

} // namespace castepbin

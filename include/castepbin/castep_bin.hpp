#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace castepbin {

class Logger;
class RecordReader;
struct Section;
using SpecTable = std::vector<Section>;

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    Truncated,
    RecordMarkerMismatch,
    HeaderNotFound,
    AmbiguousShape,
    UnresolvableShape,
    ShapeMismatch,
    InvalidCompositeLayout,
    MissingField,
    InvalidData,
    Unsupported,
    ZlibError,
};

std::string to_string(ErrorKind k);

class CastepBinError : public std::runtime_error {
public:
    CastepBinError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Public data model
// ------------------------------

enum class Endian {
    Big,
    Little,
};

/// Product of the extents. An empty shape has no elements.
std::size_t numel(const std::vector<std::size_t>& shape);

// Dense array in Fortran (column-major) element order.
template <typename T>
struct NdArray {
    std::vector<std::size_t> shape{};
    std::vector<T> data{};

    NdArray() = default;
    explicit NdArray(std::vector<std::size_t> s)
        : shape(std::move(s)), data(numel(shape)) {}

    std::size_t rank() const noexcept { return shape.size(); }
    std::size_t size() const noexcept { return data.size(); }

    std::size_t offset(std::initializer_list<std::size_t> idx) const {
        if (idx.size() != shape.size()) {
            throw CastepBinError(ErrorKind::InvalidData, "index rank does not match array rank");
        }
        std::size_t off = 0;
        std::size_t stride = 1;
        std::size_t axis = 0;
        for (std::size_t i : idx) {
            if (i >= shape[axis]) {
                throw CastepBinError(ErrorKind::InvalidData, "array index out of range");
            }
            off += i * stride;
            stride *= shape[axis];
            ++axis;
        }
        return off;
    }

    T& at(std::initializer_list<std::size_t> idx) { return data[offset(idx)]; }
    const T& at(std::initializer_list<std::size_t> idx) const { return data[offset(idx)]; }
};

using IntArray = NdArray<std::int32_t>;
using RealArray = NdArray<double>;
using ComplexArray = NdArray<std::complex<double>>;
using StringList = std::vector<std::string>;

struct Value {
    using Struct = std::map<std::string, Value>;

    std::variant<
        Struct,
        std::int32_t,
        double,
        std::complex<double>,
        bool,
        std::string,
        StringList,
        IntArray,
        RealArray,
        ComplexArray
    > v;

    // Convenience constructors
    static Value make_struct();
    static Value make_struct(Struct m);

    static Value make_int(std::int32_t x);
    static Value make_real(double x);
    static Value make_complex(std::complex<double> x);
    static Value make_bool(bool b);
    static Value make_string(std::string s);
    static Value make_strings(StringList s);
    static Value make_ints(IntArray a);
    static Value make_reals(RealArray a);
    static Value make_complexes(ComplexArray a);

    bool is_struct() const noexcept;
    const Struct& as_struct() const;
    Struct& as_struct();

    /// Short label such as "int32", "float64[3 x 2]" or "struct{7}".
    std::string describe() const;
};

// Flat field-name -> value mapping produced by a decode.
using Namespace = Value::Struct;

// ------------------------------
// Header index
// ------------------------------

struct HeaderEntry {
    std::string name{};
    std::uint64_t offset{0}; // start of the record that follows the header
};

struct HeaderIndex {
    bool checkpoint{false};            // no leading CASTEP_BIN title record
    std::vector<HeaderEntry> entries{}; // in order of appearance

    const HeaderEntry* find(const std::string& name) const;
    bool contains(const std::string& name) const;
};

// ------------------------------
// Options
// ------------------------------

enum class ShapeMode {
    Eager,    // an array with two or more unresolved axes is an error
    Deferred, // such arrays are kept flat and solved after all sections are read
};

struct ReadOptions {
    Endian endian{Endian::Big};
    std::uint32_t inline_payload_limit{512}; // records this small are always read, even when skipping
    ShapeMode shapes{ShapeMode::Eager};
    Logger* logger{nullptr}; // not owned; may be null
};

// ------------------------------
// API
// ------------------------------

/// Scan the stream from the reader's current position and index every section header.
HeaderIndex build_header_index(RecordReader& reader, Logger* logger = nullptr);

/// Decode every section of `spec` found in `index`. A non-empty `headers` list restricts
/// the sections read (CELL% sections are always kept); a requested header missing from
/// the file raises HeaderNotFound. A requested header that `spec` has no section for is
/// not ignored: it raises Unsupported before anything is read.
Namespace decode_sections(
    RecordReader& reader,
    const SpecTable& spec,
    const HeaderIndex& index,
    const std::vector<std::string>& headers = {},
    const ReadOptions& opts = ReadOptions{}
);

/// Read a .castep_bin or .check file (gzip-compressed files are inflated transparently).
Namespace decode_standard_file(
    const std::filesystem::path& file,
    const std::vector<std::string>& headers = {},
    const ReadOptions& opts = ReadOptions{}
);

Namespace decode_standard_file(
    std::istream& is,
    const std::vector<std::string>& headers = {},
    const ReadOptions& opts = ReadOptions{}
);

/// Build the header index of a file without decoding any section.
HeaderIndex read_header_index(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

} // namespace castepbin

#pragma once

#include "castepbin/castep_bin.hpp"
#include "castepbin/records.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace castepbin {

// ------------------------------
// Field type system
// ------------------------------

enum class ElementType {
    Int32,      // i4 (also Fortran LOGICAL)
    Float64,    // f8
    Complex128, // c16
    Text,       // fixed-width character block
};

std::size_t element_width(ElementType t, std::size_t text_width = 0);

// One axis of a declared shape: a literal extent, or the name of an i4 scalar
// that is looked up in (or solved into) the namespace.
struct Dim {
    Dim(int n) : extent(checked(n)) {}
    Dim(std::size_t n) : extent(n) {}
    Dim(const char* n) : name(n) {}
    Dim(std::string n) : name(std::move(n)) {}

    bool is_named() const noexcept { return !name.empty(); }

    std::size_t extent{0};
    std::string name{};

private:
    static std::size_t checked(int n) {
        if (n < 0) {
            throw CastepBinError(ErrorKind::InvalidData, "negative literal extent " + std::to_string(n));
        }
        return static_cast<std::size_t>(n);
    }
};

struct ScalarField {
    std::string name;
    ElementType type{ElementType::Int32};
};

struct ArrayField {
    std::string name;
    ElementType type{ElementType::Float64};
    std::vector<Dim> shape{};
    std::size_t text_width{0};
};

struct StringField {
    std::string name;
    std::size_t width{0};
};

// Fortran LOGICAL stored as a 4-byte integer; nonzero is true.
struct BoolField {
    std::string name;
};

// Consumes one record and keeps nothing.
struct SkipField {};

// Consumes no record. Copies the decoded value `from` to `to` unless `to` is already set.
struct CopyField {
    std::string from;
    std::string to;
};

using ElementField = std::variant<ScalarField, ArrayField, StringField, BoolField>;

// Several element fields packed into a single record.
struct CompositeField {
    std::vector<ElementField> fields{};
};

enum class StructuredKind {
    EigenvaluesOccupancies,
    ChargeDensity,
    Wavefunction,
};

struct StructuredField {
    StructuredKind kind{StructuredKind::EigenvaluesOccupancies};
};

using FieldSpec = std::variant<
    ScalarField,
    ArrayField,
    StringField,
    BoolField,
    SkipField,
    CopyField,
    CompositeField,
    StructuredField
>;

struct Section {
    std::string header;
    std::vector<FieldSpec> fields{};
};

const std::string& field_name(const ElementField& f);
std::string to_string(StructuredKind k);

// ------------------------------
// Section registries
// ------------------------------

const SpecTable& standard_spec();
const SpecTable& checkpoint_spec();

/// The registry matching the layout detected while indexing.
const SpecTable& spec_for(const HeaderIndex& index);

// ------------------------------
// Shape resolution
// ------------------------------

struct ResolvedShape {
    std::vector<std::size_t> extents{};     // 0 where unresolved
    std::vector<std::size_t> unknown_axes{}; // positions of unresolved named axes
};

/// Extent stored under `name`, if the namespace has one. Throws if the entry is not an i4 scalar.
std::optional<std::size_t> lookup_extent(const Namespace& ns, const std::string& name);

/// Like lookup_extent, but a missing entry raises MissingField.
std::size_t require_extent(const Namespace& ns, const std::string& name);

ResolvedShape resolve_shape(const std::vector<Dim>& declared, const Namespace& ns);

/// Distinct names among the axes of `declared` still absent from `ns`.
std::vector<std::string> unresolved_names(const std::vector<Dim>& declared, const Namespace& ns);

std::string describe_shape(const std::vector<Dim>& declared);

struct PendingShape {
    std::string field;
    std::vector<Dim> declared;
};

// Arrays decoded flat because their shape could not be solved when read.
class ShapeLedger {
public:
    void park(std::string field, std::vector<Dim> declared);
    void erase(const std::string& field);

    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    const std::vector<PendingShape>& entries() const noexcept { return entries_; }

private:
    std::vector<PendingShape> entries_;
};

/// Solve every parked array to a fixed point, writing solved extents into `ns`.
/// Throws UnresolvableShape when no remaining field has fewer than two unknown names.
void resolve_pending(Namespace& ns, ShapeLedger& ledger, Logger* logger = nullptr);

// ------------------------------
// Decoding
// ------------------------------

// State threaded through every decode step of one file.
struct DecodeContext {
    RecordReader& reader;
    Namespace& ns;
    ShapeLedger& ledger;
    const ReadOptions& opts;
};

/// Decode one element field from `size` bytes at `data`.
Value decode_element(const ElementField& field, const std::uint8_t* data, std::size_t size, DecodeContext& ctx);

/// Bytes a composite sub-field occupies given what is already decoded; <= 0 when unknown.
long long composite_consumption(const ElementField& field, const Namespace& ns);

void decode_composite(const CompositeField& field, DecodeContext& ctx);
void decode_structured(const StructuredField& field, DecodeContext& ctx);
void decode_field(const FieldSpec& field, DecodeContext& ctx);

} // namespace castepbin

#include "castepbin/fields.hpp"

namespace castepbin {

namespace {

FieldSpec skip() { return SkipField{}; }

FieldSpec scalar_i4(std::string name) { return ScalarField{std::move(name), ElementType::Int32}; }
FieldSpec scalar_f8(std::string name) { return ScalarField{std::move(name), ElementType::Float64}; }

FieldSpec array_i4(std::string name, std::vector<Dim> shape) {
    return ArrayField{std::move(name), ElementType::Int32, std::move(shape)};
}

FieldSpec array_f8(std::string name, std::vector<Dim> shape) {
    return ArrayField{std::move(name), ElementType::Float64, std::move(shape)};
}

FieldSpec text(std::string name, std::size_t width) { return StringField{std::move(name), width}; }

FieldSpec text_array(std::string name, std::size_t width, std::vector<Dim> shape) {
    return ArrayField{std::move(name), ElementType::Text, std::move(shape), width};
}

FieldSpec flag(std::string name) { return BoolField{std::move(name)}; }

FieldSpec composite(std::vector<ElementField> fields) { return CompositeField{std::move(fields)}; }

FieldSpec structured(StructuredKind kind) { return StructuredField{kind}; }

// The cell block appears twice: the original cell under the bare headers and the
// current cell under the "_01" headers. Original-cell values are also copied to the
// plain names, so a file with a single cell block still resolves; the current cell
// overwrites them when it is present.
void add_cell(SpecTable& t, const std::string& header_suffix, const std::string& name_suffix) {
    const std::string max_ions = "max_ions_in_species" + name_suffix;
    const std::string num_species = "num_species" + name_suffix;

    auto add = [&](const std::string& header, FieldSpec field, const std::string& name) {
        std::vector<FieldSpec> fields{std::move(field)};
        if (!name_suffix.empty()) fields.push_back(CopyField{name + name_suffix, name});
        t.push_back({header + header_suffix, std::move(fields)});
    };

    add("CELL%NUM_IONS", scalar_i4("num_ions" + name_suffix), "num_ions");
    add("CELL%MAX_IONS_IN_SPECIES", scalar_i4(max_ions), "max_ions_in_species");
    add("CELL%REAL_LATTICE", array_f8("real_lattice" + name_suffix, {3, 3}), "real_lattice");
    add("CELL%RECIP_LATTICE", array_f8("recip_lattice" + name_suffix, {3, 3}), "recip_lattice");
    add("CELL%NUM_SPECIES", scalar_i4(num_species), "num_species");
    add("CELL%NUM_IONS_IN_SPECIES", array_i4("num_ions_in_species" + name_suffix, {num_species}),
        "num_ions_in_species");
    // both cells decode to the same name; the current cell wins
    t.push_back({"CELL%IONIC_POSITIONS" + header_suffix,
                 {array_f8("ionic_positions", {3, max_ions, num_species})}});
    add("CELL%SPECIES_SYMBOL", text_array("species_symbol" + name_suffix, 8, {num_species}), "species_symbol");
}

SpecTable build_table(bool checkpoint) {
    SpecTable t;

    t.push_back({"BEGIN_ELECTRONIC", {
        skip(), skip(), skip(), skip(), skip(),
        scalar_f8("elec_temp"),
        skip(), skip(), skip(),
        text("electronic_minimizer", 10),
        scalar_f8("nelectrons"),
        scalar_f8("nup"),
        scalar_f8("ndown"),
        scalar_f8("spin"),
        scalar_f8("charge"),
        text("spin_treatment", 20),
    }});

    add_cell(t, "", "_orig");
    add_cell(t, "_01", "");

    t.push_back({"NKPTS_01", {scalar_i4("nkpts")}});
    t.push_back({"KPOINTS_01", {array_f8("kpoints", {3, "nkpts"})}});
    t.push_back({"KPOINT_WEIGHTS_01", {array_f8("kpoint_weights", {"nkpts"})}});

    std::vector<FieldSpec> end_cell{
        flag("found_ground_state_wavefunction"),
        flag("found_ground_state_density"),
        scalar_f8("total_energy"),
        scalar_f8("fermi_energy"),
        composite({ScalarField{"nbands"}, ScalarField{"nspins"}}),
    };
    if (checkpoint) end_cell.push_back(structured(StructuredKind::Wavefunction));
    end_cell.push_back(structured(StructuredKind::EigenvaluesOccupancies));
    end_cell.push_back(flag("found_ground_state_density"));
    end_cell.push_back(composite({ScalarField{"ngx_fine"}, ScalarField{"ngy_fine"}, ScalarField{"ngz_fine"}}));
    end_cell.push_back(structured(StructuredKind::ChargeDensity));
    t.push_back({"END_CELL_GLOBAL_01", std::move(end_cell)});

    t.push_back({"E_FERMI", {scalar_f8("fermi_energy_second_spin")}});
    t.push_back({"FORCES", {array_f8("forces", {3, "max_ions_in_species", "num_species"})}});
    t.push_back({"FORCE_CON", {
        array_i4("phonon_supercell_matrix", {3, 3}),
        array_f8("phonon_force_constant_matrix", {3, "num_ions", 3, "num_ions", "num_cells"}),
        array_i4("phonon_supercell_origins", {3, "num_cells"}),
        scalar_i4("phonon_force_constant_row"),
    }});
    t.push_back({"BORN_CHGS", {array_f8("born_charges", {3, 3, "num_ions"})}});

    return t;
}

} // namespace

const SpecTable& standard_spec() {
    static const SpecTable table = build_table(false);
    return table;
}

const SpecTable& checkpoint_spec() {
    static const SpecTable table = build_table(true);
    return table;
}

const SpecTable& spec_for(const HeaderIndex& index) {
    return index.checkpoint ? checkpoint_spec() : standard_spec();
}

} // namespace castepbin

#pragma once

#include "castepbin/castep_bin.hpp"

#include <complex>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace castepbin::easy {

namespace detail {
inline bool is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}

// Complex values swap each component separately.
template <typename T> struct swap_unit { static constexpr std::size_t value = sizeof(T); };
template <typename T> struct swap_unit<std::complex<T>> { static constexpr std::size_t value = sizeof(T); };
} // namespace detail

// Pack a typed vector into element bytes in the requested byte order.
// CASTEP writes big-endian unless told otherwise.
template <typename T>
inline std::vector<std::uint8_t> pack(const std::vector<T>& v, Endian e = Endian::Big) {
    static_assert(std::is_trivially_copyable_v<T>, "pack requires trivially copyable types");
    std::vector<std::uint8_t> out(sizeof(T) * v.size());
    if (!out.empty()) {
        std::memcpy(out.data(), v.data(), out.size());
        if ((e == Endian::Little) != detail::is_little_endian()) {
            constexpr std::size_t unit = detail::swap_unit<T>::value;
            detail::bswap_inplace(out.data(), unit, out.size() / unit);
        }
    }
    return out;
}

// Concatenate packed pieces, e.g. the sub-fields of one composite record.
inline std::vector<std::uint8_t> concat(std::initializer_list<std::vector<std::uint8_t>> parts) {
    std::vector<std::uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

inline bool has(const Namespace& ns, const std::string& key) {
    return ns.find(key) != ns.end();
}

inline const Value& require(const Namespace& ns, const std::string& key) {
    auto it = ns.find(key);
    if (it == ns.end()) throw CastepBinError(ErrorKind::MissingField, "field '" + key + "' is not present");
    return it->second;
}

template <typename T>
inline const T& get(const Namespace& ns, const std::string& key) {
    const Value& v = require(ns, key);
    const T* p = std::get_if<T>(&v.v);
    if (!p) throw CastepBinError(ErrorKind::InvalidData, "field '" + key + "' holds " + v.describe());
    return *p;
}

inline std::int32_t get_int(const Namespace& ns, const std::string& key) { return get<std::int32_t>(ns, key); }
inline double get_real(const Namespace& ns, const std::string& key) { return get<double>(ns, key); }
inline bool get_bool(const Namespace& ns, const std::string& key) { return get<bool>(ns, key); }
inline const std::string& get_string(const Namespace& ns, const std::string& key) { return get<std::string>(ns, key); }
inline const IntArray& get_ints(const Namespace& ns, const std::string& key) { return get<IntArray>(ns, key); }
inline const RealArray& get_reals(const Namespace& ns, const std::string& key) { return get<RealArray>(ns, key); }
inline const ComplexArray& get_complexes(const Namespace& ns, const std::string& key) { return get<ComplexArray>(ns, key); }

inline void set(Namespace& root, std::string key, Value v) {
    root[std::move(key)] = std::move(v);
}

} // namespace castepbin::easy

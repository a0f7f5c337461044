// identity.cpp - Identity comparison for Value

#include <change_detect/identity.h>

#include <cmath>
#include <string>
#include <type_traits>
#include <variant>

namespace change_detect {

namespace {

inline std::size_t hash_combine(std::size_t seed, std::size_t v) noexcept
{
    return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

inline std::size_t hash_pointer(const void* p) noexcept
{
    return std::hash<const void*>{}(p);
}

} // anonymous namespace

bool identical(const Value& a, const Value& b) noexcept
{
    if (&a == &b) {
        return true;
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueTable>) {
            // same HAMT root: one is a copy of the other
            return lhs.impl().root == rhs.impl().root &&
                   lhs.impl().size == rhs.impl().size;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return lhs.impl().root == rhs.impl().root &&
                   lhs.impl().tail == rhs.impl().tail &&
                   lhs.impl().size == rhs.impl().size;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return lhs.data() == rhs.data() && lhs.size() == rhs.size();
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, double>) {
            // NaN is identical to NaN
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

std::size_t identity_hash(const Value& val) noexcept
{
    const std::size_t seed = val.data.index();

    return std::visit([seed](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueTable>) {
            return hash_combine(seed, hash_pointer(arg.impl().root));
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return hash_combine(hash_combine(seed, hash_pointer(arg.impl().root)),
                                hash_pointer(arg.impl().tail));
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return hash_combine(seed, hash_pointer(arg.data()));
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return seed;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return hash_combine(seed, std::hash<std::string>{}(arg));
        } else if constexpr (std::is_same_v<T, double>) {
            return std::isnan(arg) ? seed : hash_combine(seed, std::hash<double>{}(arg));
        } else {
            return hash_combine(seed, std::hash<T>{}(arg));
        }
    }, val.data);
}

} // namespace change_detect

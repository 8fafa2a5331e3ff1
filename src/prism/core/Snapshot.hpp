#pragma once
#include "core/Value.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <set>
#include <string>

namespace Prism {

// Names of state variables; ordered so dirty sets iterate deterministically.
using VariableSet = std::set<std::string>;

/**
 * Snapshot: an immutable-by-convention view of every state variable.
 *
 * The committed snapshot lives in the StateStore; transactions work on a
 * copy and install it wholesale on success.
 */
class Snapshot {
public:
    using Map = phmap::flat_hash_map<std::string, Value>;

    Snapshot() = default;

    [[nodiscard]] auto find(std::string const& name) const -> Value const* {
        auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto contains(std::string const& name) const -> bool {
        return values_.contains(name);
    }

    auto set(std::string const& name, Value value) -> void {
        values_.insert_or_assign(name, std::move(value));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
    [[nodiscard]] auto begin() const { return values_.begin(); }
    [[nodiscard]] auto end() const { return values_.end(); }

    [[nodiscard]] auto footprint() const -> std::size_t {
        std::size_t total = sizeof(Snapshot);
        for (auto const& [name, value] : values_)
            total += sizeof(Map::value_type) + name.capacity() + value.footprint();
        return total;
    }

    friend auto operator==(Snapshot const& lhs, Snapshot const& rhs) -> bool {
        return lhs.values_ == rhs.values_;
    }

private:
    Map values_;
};

} // namespace Prism

// beacon/include/beacon/discovery/backend_diff.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

#include "beacon/discovery/backend.hpp"
#include "beacon/discovery/backend_key.hpp"

namespace beacon::discovery {

/// @brief Outcome of reconciling a discovery result against a Backend Set.
struct ReconcileResult {
    /// @brief Keys minted in this pass, in discovery order.
    std::vector<std::string> added;
    /// @brief Keys of the previous set that are no longer reported, in the
    /// previous set's key order.
    std::vector<std::string> removed;
    /// @brief The new authoritative Backend Set.
    BackendSet backends;
    /// @brief Endpoints dropped because their (name, address) pair was
    /// already reported earlier in the same discovery result.
    std::size_t duplicates = 0;
    /// @brief Number of endpoints in the discovery result, duplicates
    /// included.
    std::size_t discovered = 0;

    bool changed() const { return !added.empty() || !removed.empty(); }
};

/// @brief Keys that were advertised and then removed, so they are not
/// minted again. Holds at most `capacity` keys; the oldest is forgotten
/// first. Random keys make a collision with a forgotten key negligible.
class RetiredKeys {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 4096;

    explicit RetiredKeys(std::size_t capacity = DEFAULT_CAPACITY);

    void retire(const std::string& key);
    bool contains(const std::string& key) const {
        return _keys.count(key) > 0;
    }
    std::size_t size() const { return _keys.size(); }
    std::size_t capacity() const { return _capacity; }

private:
    std::size_t _capacity;
    std::unordered_set<std::string> _keys;
    std::deque<std::string> _order;
};

/// @brief Reconciles `previous` with a freshly discovered endpoint list.
///
/// Each discovered endpoint keeps the key of the previous Backend with the
/// same (name, address); otherwise a fresh key is drawn from `next_key`.
/// A drawn key already used by `previous` or the new set, or held by
/// `retired`, is discarded and drawn again. Repeated (name, address)
/// pairs collapse into a single Backend.
///
/// The function does not touch its inputs; emitting events for the result
/// is up to the caller.
/// @throws std::runtime_error if `next_key` keeps producing used keys.
ReconcileResult reconcile(const BackendSet& previous,
                          const std::vector<Endpoint>& discovered,
                          std::uint16_t port, const KeyGenerator& next_key,
                          const RetiredKeys& retired = RetiredKeys(0));

/// @brief reconcile() with keys from generate_backend_key().
ReconcileResult reconcile(const BackendSet& previous,
                          const std::vector<Endpoint>& discovered,
                          std::uint16_t port);

}  // namespace beacon::discovery

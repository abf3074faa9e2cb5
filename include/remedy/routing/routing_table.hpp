#pragma once
// Remedy: RoutingTable
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: every incident does one lookup, reloads are rare.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • reload() builds a whole new immutable map and swaps it with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
// Lookups against one snapshot are pure and deterministic.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace remedy::routing {

/**
 * @brief Static routing fact: which repository (and branch) owns a service.
 */
struct ServiceMapping final {
    std::string service_name;
    std::string repository;   ///< "owner/repo"
    std::string branch;       ///< Ref the remediation workflow runs on

    bool operator==(const ServiceMapping&) const = default;
};

using MappingList = std::vector<ServiceMapping>;

// -----------------------------------------------------------------------------
// Error codes returned by reload. Never throw exceptions in the lookup path.
// -----------------------------------------------------------------------------
/// Result codes for routing table reloads.
enum class RoutingErr {
    Ok,         ///< New snapshot published.
    Duplicate,  ///< Same service mapped twice in one reload.
    Invalid,    ///< Input validation failed (names, repository format).
    Capacity    ///< Too many mappings.
};

const char* to_string(RoutingErr e) noexcept;

// -----------------------------------------------------------------------------
// Hard limits for bounded memory usage.
// -----------------------------------------------------------------------------
/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxServices    = 4096; ///< Max mappings per snapshot.
    static constexpr std::size_t MaxServiceLen  = 256;  ///< Max service name length.
    static constexpr std::size_t MaxRepoLen     = 200;  ///< Max "owner/repo" length.
    static constexpr std::size_t MaxBranchLen   = 255;  ///< Max git ref length.
};

// -----------------------------------------------------------------------------
// RoutingTable class
// -----------------------------------------------------------------------------
///
/// Maintains a mapping: service name → ServiceMapping.
/// - Loaded as an immutable set; reload() swaps in a new set atomically.
/// - Reads: grab shared_ptr snapshot, consistent, non-blocking.
/// - Non-throwing lookups.
///
class RoutingTable final {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, ServiceMapping, SKeyHash, SKeyEq>;

    RoutingTable() = default;

    /// Build and publish an initial snapshot; invalid input leaves the table empty.
    explicit RoutingTable(std::span<const ServiceMapping> mappings) { (void)reload(mappings); }

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the whole table.
    std::shared_ptr<const Map> snapshot() const noexcept;

    // --------------------------- Lookups -------------------------------------
    /// Mapping for a service, std::nullopt when unroutable.
    [[nodiscard]] std::optional<ServiceMapping> lookup(std::string_view service_name) const;

    /// Repository for a service; `found` mirrors the optional.
    [[nodiscard]] std::string lookup_repository(std::string_view service_name, bool& found) const;

    /// Branch of the first mapping that targets `repository`.
    [[nodiscard]] std::optional<std::string> branch_for_repository(std::string_view repository) const;

    [[nodiscard]] bool has_service(std::string_view service_name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] MappingList list() const;

    /// Monotonic version counter. Increments on every published reload.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Validate and atomically replace the whole table. On error the old snapshot stays.
    RoutingErr reload(std::span<const ServiceMapping> mappings);

    /// Validation used by reload (exposed for the config loader).
    static RoutingErr validate(std::span<const ServiceMapping> mappings);

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t lookups{0}, misses{0}, reloads{0}, rejected_reloads{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};

    mutable std::atomic<uint64_t> lookups_{0}, misses_{0};
    std::atomic<uint64_t> reloads_{0}, rejected_{0};

    static bool validateServiceName(std::string_view name) noexcept;
    static bool validateRepository(std::string_view repo) noexcept;
    static bool validateBranch(std::string_view branch) noexcept;
};

} // namespace remedy::routing

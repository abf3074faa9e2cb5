// RoutingTable: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: build a fresh map, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its ref.

#include "remedy/routing/routing_table.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <unordered_set>

namespace remedy::routing {

const char* to_string(RoutingErr e) noexcept {
    switch (e) {
        case RoutingErr::Ok:        return "ok";
        case RoutingErr::Duplicate: return "duplicate";
        case RoutingErr::Invalid:   return "invalid";
        case RoutingErr::Capacity:  return "capacity";
    }
    return "unknown";
}

//------------------------------- Validation -----------------------------------

bool RoutingTable::validateServiceName(std::string_view name) noexcept {
    // Any text an incident may carry; only bounded and non-empty.
    return !name.empty() && name.size() <= Limits::MaxServiceLen;
}

bool RoutingTable::validateRepository(std::string_view repo) noexcept {
    if (repo.empty() || repo.size() > Limits::MaxRepoLen) return false;
    // Exactly "owner/name", both parts non-empty, [A-Za-z0-9_.-]
    const auto slash = repo.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == repo.size()) return false;
    if (repo.find('/', slash + 1) != std::string_view::npos) return false;
    for (char c : repo) {
        if (c == '/') continue;
        const bool ok = (c == '_' || c == '-' || c == '.' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool RoutingTable::validateBranch(std::string_view branch) noexcept {
    // Empty means "use the configured default branch".
    if (branch.size() > Limits::MaxBranchLen) return false;
    for (char c : branch) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '~' || c == '^' || c == ':') return false;
    }
    return true;
}

RoutingErr RoutingTable::validate(std::span<const ServiceMapping> mappings) {
    if (mappings.size() > Limits::MaxServices) return RoutingErr::Capacity;
    std::unordered_set<std::string_view> seen;
    seen.reserve(mappings.size());
    for (const auto& m : mappings) {
        if (!validateServiceName(m.service_name)) return RoutingErr::Invalid;
        if (!validateRepository(m.repository))    return RoutingErr::Invalid;
        if (!validateBranch(m.branch))            return RoutingErr::Invalid;
        if (!seen.insert(m.service_name).second)  return RoutingErr::Duplicate;
    }
    return RoutingErr::Ok;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const RoutingTable::Map>
RoutingTable::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed map published with RELEASE in reload().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::optional<ServiceMapping> RoutingTable::lookup(std::string_view service_name) const {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    auto snap = snapshot();
    if (snap) {
        auto it = snap->find(service_name);
        if (it != snap->end()) return it->second; // copy
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

std::string RoutingTable::lookup_repository(std::string_view service_name, bool& found) const {
    auto m = lookup(service_name);
    found = m.has_value();
    return found ? m->repository : std::string{};
}

std::optional<std::string> RoutingTable::branch_for_repository(std::string_view repository) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    // Deterministic pick when several services share a repository: smallest service name.
    const ServiceMapping* best = nullptr;
    for (const auto& kv : *snap) {
        if (kv.second.repository != repository) continue;
        if (!best || kv.second.service_name < best->service_name) best = &kv.second;
    }
    if (!best) return std::nullopt;
    return best->branch;
}

bool RoutingTable::has_service(std::string_view service_name) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(service_name) != snap->end());
}

std::size_t RoutingTable::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

MappingList RoutingTable::list() const {
    MappingList out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.second);
    return out;
}

RoutingErr RoutingTable::reload(std::span<const ServiceMapping> mappings) {
    if (const auto err = validate(mappings); err != RoutingErr::Ok) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return err;
    }

    auto next = std::make_shared<Map>();
    next->reserve(mappings.size());
    for (const auto& m : mappings) next->emplace(m.service_name, m);

    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
    reloads_.fetch_add(1, std::memory_order_relaxed);
    return RoutingErr::Ok;
}

RoutingTable::Stats RoutingTable::stats() const noexcept {
    return Stats{
        .lookups          = lookups_.load(std::memory_order_relaxed),
        .misses           = misses_.load(std::memory_order_relaxed),
        .reloads          = reloads_.load(std::memory_order_relaxed),
        .rejected_reloads = rejected_.load(std::memory_order_relaxed),
    };
}

} // namespace remedy::routing

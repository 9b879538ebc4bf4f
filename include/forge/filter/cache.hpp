#pragma once

/// @file cache.hpp
/// @brief Cached results of a layer's non-destructive filter list
///
/// The composite for a layer is its surface run through every enabled
/// filter, first to last. Results are keyed by the layer's change counter,
/// size and enabled filter parameters. A miss starts one asynchronous chain
/// for the layer and keeps returning the stale entry until it completes.

#include "service.hpp"

#include <forge/editor/session.hpp>
#include <forge/layer/types.hpp>
#include <forge/raster/surface.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace forge_filter {

class FilterCache {
public:
    FilterCache(forge_editor::EditorSession& session, FilterService& service);
    ~FilterCache();

    FilterCache(const FilterCache&) = delete;
    FilterCache& operator=(const FilterCache&) = delete;

    /// Filtered pixels for `layer`, or nullptr when the layer has no enabled
    /// filters or nothing has been computed yet
    [[nodiscard]] const forge_raster::Surface* filtered(const forge_layer::Layer& layer);

    /// Key the composite of `layer` would be stored under
    [[nodiscard]] static std::string cache_key(const forge_layer::Layer& layer);

    void invalidate(forge_layer::LayerId layer);
    void clear();

    /// Drop entries of layers no longer in the stack
    void prune();

    [[nodiscard]] bool is_pending(forge_layer::LayerId layer) const { return m_pending.contains(layer); }
    [[nodiscard]] std::size_t size() const { return m_entries.size(); }
    [[nodiscard]] std::uint64_t chains_started() const { return m_chains_started; }

private:
    struct Entry {
        std::string key;
        forge_raster::Surface surface;
    };

    struct Chain;

    void start_chain(const forge_layer::Layer& layer, std::string key);
    void run_step(std::shared_ptr<Chain> chain);

    forge_editor::EditorSession& m_editor;
    FilterService& m_service;
    std::unordered_map<forge_layer::LayerId, Entry> m_entries;
    std::unordered_set<forge_layer::LayerId> m_pending;
    std::uint64_t m_chains_started = 0;
    std::shared_ptr<int> m_lifetime;
};

} // namespace forge_filter

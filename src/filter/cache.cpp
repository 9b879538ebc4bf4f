/// @file cache.cpp
/// @brief FilterCache implementation

#include <forge/filter/cache.hpp>
#include <forge/core/log.hpp>
#include <forge/layer/layer.hpp>

#include <sstream>
#include <vector>

namespace forge_filter {

struct FilterCache::Chain {
    forge_layer::LayerId layer;
    std::string key;
    std::vector<FilterInstance> filters;
    std::size_t next = 0;
    forge_raster::Surface working;
};

FilterCache::FilterCache(forge_editor::EditorSession& session, FilterService& service)
    : m_editor(session)
    , m_service(service)
    , m_lifetime(std::make_shared<int>(0))
{}

FilterCache::~FilterCache() {
    m_lifetime.reset();
}

std::string FilterCache::cache_key(const forge_layer::Layer& layer) {
    std::ostringstream key;
    key << layer.change_counter() << '/' << layer.filter_revision()
        << ':' << layer.width() << 'x' << layer.height();
    for (const auto& filter : layer.filters()) {
        if (filter.enabled) {
            key << '|' << filter.filter_id << ':' << filter.params.dump();
        }
    }
    return key.str();
}

const forge_raster::Surface* FilterCache::filtered(const forge_layer::Layer& layer) {
    if (!layer.has_active_filters() || layer.surface().empty()) {
        return nullptr;
    }

    std::string key = cache_key(layer);
    auto it = m_entries.find(layer.id());
    if (it != m_entries.end() && it->second.key == key) {
        return &it->second.surface;
    }

    if (!m_pending.contains(layer.id())) {
        start_chain(layer, std::move(key));
        it = m_entries.find(layer.id());
    }

    // Stale result while the chain runs
    return it != m_entries.end() ? &it->second.surface : nullptr;
}

void FilterCache::invalidate(forge_layer::LayerId layer) {
    m_entries.erase(layer);
}

void FilterCache::clear() {
    m_entries.clear();
    m_pending.clear();
    // Results of running chains are no longer wanted
    m_lifetime = std::make_shared<int>(0);
}

void FilterCache::prune() {
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (!m_editor.layers().find(it->first)) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

void FilterCache::start_chain(const forge_layer::Layer& layer, std::string key) {
    auto chain = std::make_shared<Chain>();
    chain->layer = layer.id();
    chain->key = std::move(key);
    chain->working = layer.surface();
    for (const auto& filter : layer.filters()) {
        if (filter.enabled) {
            chain->filters.push_back(filter);
        }
    }

    m_pending.insert(layer.id());
    ++m_chains_started;
    forge_core::filter_logger()->trace("Filter chain for layer {}: {} filters", layer.id().id, chain->filters.size());
    run_step(std::move(chain));
}

void FilterCache::run_step(std::shared_ptr<Chain> chain) {
    const forge_layer::Layer* layer = m_editor.layers().find(chain->layer);
    if (!layer || cache_key(*layer) != chain->key) {
        // Layer changed underneath; the next lookup starts over
        m_pending.erase(chain->layer);
        return;
    }

    if (chain->next >= chain->filters.size()) {
        m_pending.erase(chain->layer);
        m_entries[chain->layer] = Entry{chain->key, std::move(chain->working)};
        m_editor.request_render();
        return;
    }

    const FilterInstance& filter = chain->filters[chain->next];
    FilterRequest request;
    request.filter_id = filter.filter_id;
    request.width = chain->working.width();
    request.height = chain->working.height();
    request.params = filter.params;
    request.pixels = chain->working.bytes();

    std::weak_ptr<int> alive = m_lifetime;
    m_service.execute(std::move(request), [this, alive, chain](FilterResult result) {
        if (alive.expired()) {
            return;
        }
        if (!result) {
            forge_core::filter_logger()->warn("Filter '{}' on layer {} failed: {}",
                chain->filters[chain->next].filter_id, chain->layer.id, result.error().message());
            m_pending.erase(chain->layer);
            return;
        }
        if (result->size() != chain->working.byte_size()) {
            forge_core::filter_logger()->warn("Filter '{}' returned {} bytes, expected {}",
                chain->filters[chain->next].filter_id, result->size(), chain->working.byte_size());
            m_pending.erase(chain->layer);
            return;
        }
        chain->working.bytes() = std::move(*result);
        ++chain->next;
        run_step(chain);
    });
}

} // namespace forge_filter

/// @file instance.cpp
/// @brief FilterInstance serialization

#include <forge/filter/instance.hpp>
#include <forge/core/id.hpp>

namespace forge_filter {

namespace {

forge_core::IdGenerator& instance_ids() {
    static forge_core::IdGenerator generator;
    return generator;
}

} // anonymous namespace

FilterInstanceId FilterInstanceId::generate() {
    return FilterInstanceId{instance_ids().next()};
}

nlohmann::json FilterInstance::serialize() const {
    return nlohmann::json{
        {"id", id.id},
        {"filterId", filter_id},
        {"name", name},
        {"enabled", enabled},
        {"params", params},
        {"source", source},
    };
}

forge_core::Result<FilterInstance> FilterInstance::deserialize(const nlohmann::json& data) {
    using forge_core::Err;
    using forge_core::FilterError;

    if (!data.is_object()) {
        return Err<FilterInstance>(FilterError::invalid_definition("", "filter snapshot is not an object"));
    }
    if (!data.contains("filterId") || !data["filterId"].is_string()) {
        return Err<FilterInstance>(FilterError::invalid_definition("", "missing 'filterId'"));
    }

    FilterInstance instance;
    instance.filter_id = data["filterId"].get<std::string>();
    if (data.contains("id") && data["id"].is_number_unsigned()) {
        instance.id = FilterInstanceId{data["id"].get<std::uint64_t>()};
    }
    if (!instance.id.is_valid()) {
        instance.id = FilterInstanceId::generate();
    }
    if (data.contains("name") && data["name"].is_string()) {
        instance.name = data["name"].get<std::string>();
    }
    if (data.contains("enabled") && data["enabled"].is_boolean()) {
        instance.enabled = data["enabled"].get<bool>();
    }
    if (data.contains("source") && data["source"].is_string()) {
        instance.source = data["source"].get<std::string>();
    }
    if (data.contains("params") && data["params"].is_object()) {
        instance.params = data["params"];
    }

    return forge_core::Ok(std::move(instance));
}

FilterInstance FilterInstance::clone() const {
    FilterInstance copy = *this;
    copy.id = FilterInstanceId::generate();
    return copy;
}

std::string serialize_filter_list(const std::vector<FilterInstance>& filters) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& filter : filters) {
        list.push_back(filter.serialize());
    }
    return list.dump();
}

} // namespace forge_filter

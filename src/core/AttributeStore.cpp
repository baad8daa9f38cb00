/**
 * @file AttributeStore.cpp
 * @brief Tile attribute serialisation and the in-memory store
 */

#include "AttributeStore.hpp"

namespace hexmosaic {

void to_json(nlohmann::json& j, const TileAttributes& attributes) {
    j = nlohmann::json{
        {"tile_type", attributes.tile_type},
        {"confidence", attributes.confidence},
        {"outcome", attributes.outcome}
    };
    j["elevation_tier"] = attributes.elevation_tier ? nlohmann::json(*attributes.elevation_tier)
                                                    : nlohmann::json(nullptr);
    j["elevation"] = attributes.elevation ? nlohmann::json(*attributes.elevation)
                                          : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, TileAttributes& attributes) {
    attributes.tile_type = j.at("tile_type").get<std::string>();
    attributes.confidence = j.at("confidence").get<double>();
    attributes.outcome = j.value("outcome", "");

    auto optional_number = [&j](const char* key) -> std::optional<double> {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        return it->get<double>();
    };
    attributes.elevation_tier = optional_number("elevation_tier");
    attributes.elevation = optional_number("elevation");
}

bool InMemoryAttributeStore::begin() {
    if (in_transaction_) {
        last_error_ = "transaction already open";
        return false;
    }
    staged_.clear();
    in_transaction_ = true;
    return true;
}

bool InMemoryAttributeStore::write(TileId tile, const TileAttributes& attributes) {
    if (!in_transaction_) {
        last_error_ = "write outside a transaction";
        return false;
    }
    if (failing_writes_.count(tile)) {
        last_error_ = "store rejected write for tile " + std::to_string(tile);
        return false;
    }
    staged_[tile] = attributes;
    return true;
}

bool InMemoryAttributeStore::commit() {
    if (!in_transaction_) {
        last_error_ = "commit outside a transaction";
        return false;
    }
    if (fail_commit_) {
        last_error_ = "store rejected commit";
        return false;
    }
    for (auto& [tile, attributes] : staged_) {
        committed_[tile] = std::move(attributes);
    }
    staged_.clear();
    in_transaction_ = false;
    return true;
}

void InMemoryAttributeStore::rollback() {
    staged_.clear();
    in_transaction_ = false;
}

std::optional<TileAttributes> InMemoryAttributeStore::read(TileId tile) const {
    auto it = committed_.find(tile);
    if (it == committed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace hexmosaic

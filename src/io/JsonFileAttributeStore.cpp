/**
 * @file JsonFileAttributeStore.cpp
 * @brief Attribute store persisted as a JSON document with atomic commit
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "JsonFileAttributeStore.hpp"
#include "HexMosaicError.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace hexmosaic {

JsonFileAttributeStore::JsonFileAttributeStore(std::string path)
    : path_(std::move(path)), logger_("JsonFileAttributeStore") {
    if (!std::filesystem::exists(path_)) {
        logger_.detailed("Attribute store " + path_ + " does not exist yet; starting empty");
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::VALIDATION,
                             "cannot open attribute store", path_);
    }

    try {
        nlohmann::json document = nlohmann::json::parse(file);
        for (const auto& [key, value] : document.at("tiles").items()) {
            committed_[static_cast<TileId>(std::stoul(key))] = value.get<TileAttributes>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::VALIDATION,
                             std::string("malformed attribute store: ") + e.what(), path_);
    } catch (const std::logic_error& e) {
        throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::VALIDATION,
                             std::string("malformed tile id in attribute store: ") + e.what(), path_);
    }

    logger_.detailed("Opened attribute store " + path_ + " with " + std::to_string(committed_.size()) + " tiles");
}

bool JsonFileAttributeStore::begin() {
    if (in_transaction_) {
        last_error_ = "transaction already open";
        return false;
    }
    staged_.clear();
    in_transaction_ = true;
    return true;
}

bool JsonFileAttributeStore::write(TileId tile, const TileAttributes& attributes) {
    if (!in_transaction_) {
        last_error_ = "write outside a transaction";
        return false;
    }
    staged_[tile] = attributes;
    return true;
}

bool JsonFileAttributeStore::commit() {
    if (!in_transaction_) {
        last_error_ = "commit outside a transaction";
        return false;
    }

    std::map<TileId, TileAttributes> merged = committed_;
    for (const auto& [tile, attributes] : staged_) {
        merged[tile] = attributes;
    }

    nlohmann::json tiles = nlohmann::json::object();
    for (const auto& [tile, attributes] : merged) {
        tiles[std::to_string(tile)] = attributes;
    }
    nlohmann::json document = {{"tiles", tiles}};

    const std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            last_error_ = "cannot write " + temp_path;
            return false;
        }
        file << document.dump(2) << '\n';
        file.flush();
        if (!file) {
            last_error_ = "write to " + temp_path + " failed";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        last_error_ = "cannot replace " + path_ + ": " + ec.message();
        std::filesystem::remove(temp_path, ec);
        return false;
    }

    committed_ = std::move(merged);
    staged_.clear();
    in_transaction_ = false;
    logger_.detailed("Committed " + std::to_string(committed_.size()) + " tiles to " + path_);
    return true;
}

void JsonFileAttributeStore::rollback() {
    staged_.clear();
    in_transaction_ = false;
    std::error_code ec;
    std::filesystem::remove(path_ + ".tmp", ec);
}

std::optional<TileAttributes> JsonFileAttributeStore::read(TileId tile) const {
    auto it = committed_.find(tile);
    if (it == committed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace hexmosaic

/**
 * @file JsonFileAttributeStore.hpp
 * @brief Attribute store persisted as a JSON document with atomic commit
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "../core/AttributeStore.hpp"
#include "../core/Logger.hpp"

#include <map>
#include <string>

namespace hexmosaic {

/**
 * @brief Store backed by one JSON file
 *
 * Committed state is read when the store is opened. A commit writes the
 * merged state to a temporary file beside the target and renames it over
 * the target, so readers see either the old or the new document.
 *
 * Document layout: {"tiles": {"<tile id>": {tile attributes}}}
 */
class JsonFileAttributeStore : public AttributeStore {
public:
    /**
     * @throws HexMosaicError PERSISTENCE_FAILURE when an existing file cannot be parsed
     */
    explicit JsonFileAttributeStore(std::string path);

    bool begin() override;
    bool write(TileId tile, const TileAttributes& attributes) override;
    bool commit() override;
    void rollback() override;
    std::optional<TileAttributes> read(TileId tile) const override;
    std::string last_error() const override { return last_error_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<TileId, TileAttributes> committed_;
    std::map<TileId, TileAttributes> staged_;
    bool in_transaction_ = false;
    std::string last_error_;
    Logger logger_;
};

} // namespace hexmosaic

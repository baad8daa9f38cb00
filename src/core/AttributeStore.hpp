/**
 * @file AttributeStore.hpp
 * @brief Transactional store of per-tile classification attributes
 */

#pragma once

#include "hexmosaic.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief Attributes persisted for one tile
 */
struct TileAttributes {
    std::string tile_type;
    std::optional<double> elevation_tier;
    std::optional<double> elevation;
    double confidence = 0.0;
    std::string outcome;

    bool operator==(const TileAttributes& other) const {
        return tile_type == other.tile_type && elevation_tier == other.elevation_tier &&
               elevation == other.elevation && confidence == other.confidence &&
               outcome == other.outcome;
    }
    bool operator!=(const TileAttributes& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const TileAttributes& attributes);
void from_json(const nlohmann::json& j, TileAttributes& attributes);

/**
 * @brief External attribute store
 *
 * Writes between begin() and commit() must stay invisible to read() until
 * commit() succeeds; rollback() discards them. Operations report failure by
 * returning false, with the reason in last_error().
 */
class AttributeStore {
public:
    virtual ~AttributeStore() = default;

    virtual bool begin() = 0;
    virtual bool write(TileId tile, const TileAttributes& attributes) = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;
    virtual std::optional<TileAttributes> read(TileId tile) const = 0;

    virtual std::string last_error() const = 0;
};

/**
 * @brief Store holding committed state in memory with a staging buffer
 *
 * Failures can be injected for a given tile write or for the commit.
 */
class InMemoryAttributeStore : public AttributeStore {
public:
    bool begin() override;
    bool write(TileId tile, const TileAttributes& attributes) override;
    bool commit() override;
    void rollback() override;
    std::optional<TileAttributes> read(TileId tile) const override;
    std::string last_error() const override { return last_error_; }

    void fail_on_write(TileId tile) { failing_writes_.insert(tile); }
    void fail_on_commit(bool fail = true) { fail_commit_ = fail; }

    bool in_transaction() const { return in_transaction_; }
    size_t committed_count() const { return committed_.size(); }
    size_t staged_count() const { return staged_.size(); }
    const std::map<TileId, TileAttributes>& committed() const { return committed_; }

private:
    std::map<TileId, TileAttributes> committed_;
    std::map<TileId, TileAttributes> staged_;
    std::set<TileId> failing_writes_;
    bool fail_commit_ = false;
    bool in_transaction_ = false;
    std::string last_error_;
};

} // namespace hexmosaic

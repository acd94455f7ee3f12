#pragma once

/// @file include/wfv/model_version.hpp
/// @brief Versioned registry of accepted parameter sets.
///
/// # Module: ModelVersionStore
///
/// ## Lifecycle
///   created → active  (previous active becomes inactive, superseded_by = new)
///          → confirmed (note appended, stays active)
///          → rolled back (previous version reactivated, this one inactive)
///
/// ## Invariants
/// - At most one active version per strategy
/// - Parameters and validation evidence are never modified after creation;
///   only `is_active`, `superseded_by` and `notes` change
/// - Every mutation is written as one document replacement; a failed write
///   leaves both disk and memory in their previous state

#include "wfv/dates.hpp"
#include "wfv/json_store.hpp"
#include "wfv/types.hpp"
#include "wfv/validator.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wfv {

struct ModelVersion {
    std::string           version_id;  ///< `v<YYYYMMDDTHHMMSS>[-n]`, time-ordered
    std::string           strategy_id;
    std::string           created_at;  ///< ISO-8601 timestamp
    ParameterSet          parameters;
    BacktestMatrixResults validation;  ///< Evidence that justified acceptance
    bool                  is_active = false;
    std::optional<std::string> superseded_by;
    std::string           notes;       ///< Audit trail, one event per line
};

class ModelVersionStore {
public:
    /// Open (or create on first save) the store at `path`.
    explicit ModelVersionStore(std::string path);

    /// Create a new active version for `strategy_id`, superseding the
    /// current active one.
    ///
    /// # Returns
    /// The created version, or `nullopt` if persisting failed (no change).
    [[nodiscard]] std::optional<ModelVersion>
    promote(const std::string& strategy_id,
            const ParameterSet& parameters,
            const BacktestMatrixResults& validation,
            const dates::Timestamp& now,
            const std::string& note = "Created by automated re-optimization");

    /// Undo the promotion of `version_id`: reactivate the newest version it
    /// superseded and deactivate it.  A first version has no predecessor;
    /// rolling it back leaves the strategy with no active version.
    ///
    /// # Returns
    /// false if `version_id` is unknown or inactive, or persisting failed.
    [[nodiscard]] bool rollback(const std::string& version_id,
                                const std::string& reason,
                                const dates::Timestamp& now);

    /// Make `version_id` the active version of its strategy, whatever the
    /// current state.  The previously active version is deactivated.
    [[nodiscard]] bool rollback_to(const std::string& version_id,
                                   const std::string& reason,
                                   const dates::Timestamp& now);

    /// Append one line to the notes of `version_id`.
    [[nodiscard]] bool append_note(const std::string& version_id,
                                   const std::string& note);

    [[nodiscard]] std::optional<ModelVersion>
    active(const std::string& strategy_id) const;

    [[nodiscard]] std::optional<ModelVersion>
    find(const std::string& version_id) const;

    /// All versions of `strategy_id`, oldest first.
    [[nodiscard]] std::vector<ModelVersion>
    history(const std::string& strategy_id) const;

    /// Re-read the document from disk.
    void reload();

private:
    using VersionMap = std::map<std::string, ModelVersion>;

    [[nodiscard]] std::string next_version_id(const dates::Timestamp& now) const;
    [[nodiscard]] bool commit(VersionMap next);

    [[nodiscard]] static VersionMap decode(const Json::Value& doc);
    [[nodiscard]] static Json::Value encode(const VersionMap& versions);

    JsonDocumentStore store_;
    VersionMap        versions_;
};

}  // namespace wfv

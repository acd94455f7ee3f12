/// @file src/store/model_version_store.cpp
/// @brief ModelVersionStore: promotion, rollback and audit notes.
///
/// Every mutation is applied to a copy of the version map, written as one
/// document, and only then swapped in.  A crash or write failure therefore
/// can never expose a state with two (or zero) active versions that did not
/// exist before.

#include "wfv/model_version.hpp"
#include "wfv/logging.hpp"
#include "wfv/results_io.hpp"

#include <utility>

namespace wfv {

namespace {

void append_line(std::string& notes, const std::string& line) {
    if (!notes.empty()) notes += '\n';
    notes += line;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ModelVersionStore::ModelVersionStore(std::string path)
    : store_(std::move(path))
{
    reload();
}

void ModelVersionStore::reload() {
    versions_ = decode(store_.load());
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

ModelVersionStore::VersionMap ModelVersionStore::decode(const Json::Value& doc) {
    VersionMap versions;
    for (const auto& id : doc.getMemberNames()) {
        const Json::Value& v = doc[id];
        if (!v.isObject()) {
            logger()->warn("Skipping malformed model version entry {}", id);
            continue;
        }

        ModelVersion mv;
        mv.version_id  = id;
        mv.strategy_id = v["strategy_id"].isString() ? v["strategy_id"].asString() : "";
        mv.created_at  = v["created_at"].isString() ? v["created_at"].asString() : "";
        mv.parameters  = parameters_from_json(v["parameters"]);
        if (auto r = results_from_json(v["validation_results"])) {
            mv.validation = std::move(*r);
        }
        mv.is_active = v["is_active"].isBool() && v["is_active"].asBool();
        if (v["superseded_by"].isString()) {
            mv.superseded_by = v["superseded_by"].asString();
        }
        mv.notes = v["notes"].isString() ? v["notes"].asString() : "";
        versions.emplace(id, std::move(mv));
    }

    // Keep only the newest active version per strategy.  Ids sort by time,
    // so walking the map backwards visits the newest first.
    std::map<std::string, std::string> newest_active;
    for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
        ModelVersion& mv = it->second;
        if (!mv.is_active) continue;
        const auto [pos, inserted] = newest_active.emplace(mv.strategy_id, mv.version_id);
        if (!inserted) {
            logger()->error("Versions {} and {} of {} are both active; deactivating {}",
                            pos->second, mv.version_id, mv.strategy_id, mv.version_id);
            mv.is_active = false;
        }
    }
    return versions;
}

Json::Value ModelVersionStore::encode(const VersionMap& versions) {
    Json::Value doc(Json::objectValue);
    for (const auto& [id, mv] : versions) {
        Json::Value v(Json::objectValue);
        v["strategy_id"]        = mv.strategy_id;
        v["created_at"]         = mv.created_at;
        v["parameters"]         = to_json(mv.parameters);
        v["validation_results"] = to_json(mv.validation);
        v["is_active"]          = mv.is_active;
        v["superseded_by"]      = mv.superseded_by ? Json::Value(*mv.superseded_by)
                                                   : Json::Value(Json::nullValue);
        v["notes"]              = mv.notes;
        doc[id] = v;
    }
    return doc;
}

bool ModelVersionStore::commit(VersionMap next) {
    if (!store_.save(encode(next))) {
        return false;
    }
    versions_ = std::move(next);
    return true;
}

std::string ModelVersionStore::next_version_id(const dates::Timestamp& now) const {
    const std::string base = "v" + dates::compact_timestamp(now);
    std::string id = base;
    for (int n = 2; versions_.count(id) != 0; ++n) {
        id = base + "-" + std::to_string(n);
    }
    return id;
}

// ─── Mutations ────────────────────────────────────────────────────────────────

std::optional<ModelVersion>
ModelVersionStore::promote(const std::string& strategy_id,
                           const ParameterSet& parameters,
                           const BacktestMatrixResults& validation,
                           const dates::Timestamp& now,
                           const std::string& note) {
    VersionMap next = versions_;
    const std::string id = next_version_id(now);

    for (auto& [vid, mv] : next) {
        if (mv.strategy_id == strategy_id && mv.is_active) {
            mv.is_active     = false;
            mv.superseded_by = id;
        }
    }

    ModelVersion created;
    created.version_id  = id;
    created.strategy_id = strategy_id;
    created.created_at  = dates::format_timestamp(now);
    created.parameters  = parameters;
    created.validation  = validation;
    created.is_active   = true;
    created.notes       = note;
    next.emplace(id, created);

    if (!commit(std::move(next))) {
        logger()->error("Failed to persist model version {} for {}", id, strategy_id);
        return std::nullopt;
    }

    logger()->info("Created model version {} for {}", id, strategy_id);
    return created;
}

bool ModelVersionStore::rollback(const std::string& version_id,
                                 const std::string& reason,
                                 const dates::Timestamp& now) {
    VersionMap next = versions_;
    const auto it = next.find(version_id);
    if (it == next.end()) {
        logger()->warn("Rollback requested for unknown version {}", version_id);
        return false;
    }
    if (!it->second.is_active) {
        logger()->warn("Version {} is not active; nothing to roll back", version_id);
        return false;
    }

    // Newest first: a manual rollback_to can leave older versions pointing
    // at the same id.
    ModelVersion* previous = nullptr;
    for (auto rit = next.rbegin(); rit != next.rend(); ++rit) {
        ModelVersion& mv = rit->second;
        if (mv.superseded_by && *mv.superseded_by == version_id) {
            previous = &mv;
            break;
        }
    }

    if (previous != nullptr) {
        previous->is_active = true;
        previous->superseded_by.reset();
        append_line(previous->notes,
                    "Reinstated on " + dates::format_timestamp(now) + " after rollback of " + version_id);
    } else {
        logger()->warn("Version {} superseded nothing; {} is left without an active version",
                       version_id, it->second.strategy_id);
    }

    it->second.is_active = false;
    append_line(it->second.notes,
                "Rolled back on " + dates::format_timestamp(now) + ": " + reason);

    if (!commit(std::move(next))) {
        logger()->error("Failed to persist rollback of {}", version_id);
        return false;
    }

    logger()->warn("Rolled back version {}: {}", version_id, reason);
    return true;
}

bool ModelVersionStore::rollback_to(const std::string& version_id,
                                    const std::string& reason,
                                    const dates::Timestamp& now) {
    VersionMap next = versions_;
    const auto target = next.find(version_id);
    if (target == next.end()) {
        logger()->warn("Rollback target {} not found", version_id);
        return false;
    }
    if (target->second.is_active) {
        return true;
    }

    const std::string stamp = dates::format_timestamp(now);
    for (auto& [vid, mv] : next) {
        if (mv.strategy_id == target->second.strategy_id && mv.is_active) {
            mv.is_active     = false;
            mv.superseded_by = version_id;
            append_line(mv.notes, "Rolled back on " + stamp + " to " + version_id + ": " + reason);
        }
    }

    target->second.is_active = true;
    target->second.superseded_by.reset();
    append_line(target->second.notes, "Reactivated on " + stamp + ": " + reason);

    if (!commit(std::move(next))) {
        logger()->error("Failed to persist manual rollback to {}", version_id);
        return false;
    }

    logger()->warn("Manual rollback to version {}: {}", version_id, reason);
    return true;
}

bool ModelVersionStore::append_note(const std::string& version_id,
                                    const std::string& note) {
    VersionMap next = versions_;
    const auto it = next.find(version_id);
    if (it == next.end()) return false;

    append_line(it->second.notes, note);
    return commit(std::move(next));
}

// ─── Queries ──────────────────────────────────────────────────────────────────

std::optional<ModelVersion>
ModelVersionStore::active(const std::string& strategy_id) const {
    for (const auto& [id, mv] : versions_) {
        if (mv.strategy_id == strategy_id && mv.is_active) return mv;
    }
    return std::nullopt;
}

std::optional<ModelVersion>
ModelVersionStore::find(const std::string& version_id) const {
    const auto it = versions_.find(version_id);
    if (it == versions_.end()) return std::nullopt;
    return it->second;
}

std::vector<ModelVersion>
ModelVersionStore::history(const std::string& strategy_id) const {
    std::vector<ModelVersion> out;
    for (const auto& [id, mv] : versions_) {
        if (mv.strategy_id == strategy_id) out.push_back(mv);
    }
    return out;
}

}  // namespace wfv

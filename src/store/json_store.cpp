/// @file src/store/json_store.cpp
/// @brief Atomic JSON document persistence (jsoncpp + std::filesystem).

#include "wfv/json_store.hpp"
#include "wfv/logging.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace wfv {

JsonDocumentStore::JsonDocumentStore(std::string path)
    : path_(std::move(path))
{}

Json::Value JsonDocumentStore::load() const noexcept {
    try {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return Json::Value(Json::objectValue);
        }

        std::ifstream in(path_);
        if (!in.is_open()) {
            logger()->warn("Cannot open {}; treating store as empty", path_);
            return Json::Value(Json::objectValue);
        }

        Json::CharReaderBuilder builder;
        Json::Value doc;
        std::string errors;
        if (!Json::parseFromStream(builder, in, &doc, &errors) || !doc.isObject()) {
            logger()->warn("Corrupt document {}; treating store as empty: {}",
                           path_, errors.empty() ? "not a JSON object" : errors);
            return Json::Value(Json::objectValue);
        }
        return doc;
    } catch (const std::exception& ex) {
        logger()->error("Error loading {}: {}", path_, ex.what());
        return Json::Value(Json::objectValue);
    }
}

bool JsonDocumentStore::save(const Json::Value& doc) const noexcept {
    try {
        const fs::path target(path_);
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                logger()->error("Cannot create directory for {}: {}", path_, ec.message());
                return false;
            }
        }

        const fs::path tmp = fs::path(path_ + ".tmp");
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                logger()->error("Cannot open {} for writing", tmp.string());
                return false;
            }

            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
            writer->write(doc, &out);
            out << '\n';
            out.flush();
            if (!out) {
                logger()->error("Short write to {}", tmp.string());
                fs::remove(tmp, ec);
                return false;
            }
        }

        // rename(2) replaces the target atomically on POSIX filesystems.
        fs::rename(tmp, target, ec);
        if (ec) {
            logger()->error("Cannot replace {}: {}", path_, ec.message());
            fs::remove(tmp, ec);
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        logger()->error("Error saving {}: {}", path_, ex.what());
        return false;
    }
}

}  // namespace wfv

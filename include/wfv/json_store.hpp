#pragma once

/// @file include/wfv/json_store.hpp
/// @brief Durable JSON document backed by one file.
///
/// ## Guarantees
/// - A missing, unreadable or corrupt file loads as an empty object
/// - `save` replaces the file atomically: the document is written to
///   `<path>.tmp` and renamed over the target, so readers see either the old
///   or the new document, never a partial one
/// - Never throws

#include <json/json.h>

#include <string>

namespace wfv {

class JsonDocumentStore {
public:
    explicit JsonDocumentStore(std::string path);

    /// Read the document.  Returns an empty object on any failure.
    [[nodiscard]] Json::Value load() const noexcept;

    /// Atomically replace the document.  Creates parent directories.
    ///
    /// # Returns
    /// false if the temporary file cannot be written or renamed; the previous
    /// document is then left intact.
    [[nodiscard]] bool save(const Json::Value& doc) const noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

}  // namespace wfv

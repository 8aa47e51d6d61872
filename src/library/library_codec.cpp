/// @file library_codec.cpp
/// @brief JSON encode/decode for the persisted index (nlohmann/json).

#include "shelf/library/library_codec.hpp"

#include <nlohmann/json.hpp>

namespace shelf::library {

using shelf::foundation::ErrorCode;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;

namespace {

constexpr const char* kPathKey = "path";
constexpr const char* kCreatedKey = "created_at";
constexpr const char* kUpdatedKey = "last_updated";
constexpr const char* kFilesKey = "cbz_files";
constexpr const char* kTotalKey = "total_chapters";

ShelfResult<LibraryMap> loadError(std::string message) {
    return ShelfResult<LibraryMap>::err(
        ShelfError(ErrorCode::PersistenceLoadFailed, std::move(message)));
}

} // namespace

std::string encodeLibrary(const LibraryMap& records) {
    auto root = nlohmann::json::object();
    for (const auto& [id, record] : records) {
        nlohmann::json entry;
        entry[kPathKey] = record.path.string();
        entry[kCreatedKey] = foundation::formatIsoTimestamp(record.createdAt);
        entry[kUpdatedKey] = foundation::formatIsoTimestamp(record.lastUpdated);
        entry[kFilesKey] = record.chapterFiles;  // std::set keeps it sorted
        entry[kTotalKey] = record.totalChapters();
        root[id] = std::move(entry);
    }
    // Directory entries are raw bytes; invalid UTF-8 becomes U+FFFD.
    return root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

ShelfResult<LibraryMap> decodeLibrary(std::string_view text) {
    auto root = nlohmann::json::parse(text.begin(), text.end(), nullptr,
                                      /*allow_exceptions=*/false);
    if (root.is_discarded()) {
        return loadError("library file is not valid JSON");
    }
    if (!root.is_object()) {
        return loadError("library file root is not an object");
    }

    LibraryMap records;
    try {
        for (const auto& [id, entry] : root.items()) {
            if (!entry.is_object()) {
                return loadError("entry '" + id + "' is not an object");
            }

            CollectionRecord record;
            record.id = id;
            record.path = entry.at(kPathKey).get<std::string>();

            auto created = foundation::parseIsoTimestamp(
                entry.at(kCreatedKey).get<std::string>());
            auto updated = foundation::parseIsoTimestamp(
                entry.at(kUpdatedKey).get<std::string>());
            if (!created || !updated) {
                return loadError("entry '" + id + "' has a malformed timestamp");
            }
            record.createdAt = *created;
            record.lastUpdated = *updated;

            const auto& files = entry.at(kFilesKey);
            if (!files.is_array()) {
                return loadError("entry '" + id + "' cbz_files is not an array");
            }
            for (const auto& name : files) {
                record.chapterFiles.insert(name.get<std::string>());
            }

            records.emplace(id, std::move(record));
        }
    } catch (const nlohmann::json::exception& e) {
        return loadError(std::string("malformed library entry: ") + e.what());
    }

    return ShelfResult<LibraryMap>::ok(std::move(records));
}

} // namespace shelf::library

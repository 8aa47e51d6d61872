/// @file library_store.cpp
/// @brief LibraryStore: in-memory index, throttled flushes, atomic writes.

#include "shelf/library/library_store.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "shelf/foundation/error_code.hpp"
#include "shelf/foundation/shelf_error.hpp"
#include "shelf/foundation/shelf_logger.hpp"
#include "shelf/library/library_codec.hpp"
#include "shelf/library/throttler.hpp"

namespace shelf::library {

namespace fs = std::filesystem;

using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;

std::string_view refreshOutcomeName(RefreshOutcome outcome) noexcept {
    switch (outcome) {
        case RefreshOutcome::Created: return "created";
        case RefreshOutcome::Updated: return "updated";
        case RefreshOutcome::Removed: return "removed";
        case RefreshOutcome::Absent:  return "absent";
    }
    return "unknown";
}

namespace {

fs::path tempPathFor(const fs::path& target) {
    auto tmp = target;
    tmp += ".tmp";
    return tmp;
}

ShelfResult<void> writeError(const std::string& what, const fs::path& path, int err) {
    return ShelfResult<void>::err(
        ShelfError(ErrorCode::PersistenceWriteFailed,
                   what + ": " + std::strerror(err), path));
}

bool writeAll(int fd, const std::string& payload) {
    const char* data = payload.data();
    std::size_t remaining = payload.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

bool fsyncDirectory(const fs::path& dir) {
    auto target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

/// Write @p payload to "<target>.tmp", fsync, rename over @p target and
/// fsync the parent directory. The temp file never outlives a failure.
ShelfResult<void> writeAtomically(const fs::path& target, const std::string& payload) {
    auto dir = target.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return ShelfResult<void>::err(
                ShelfError(ErrorCode::PersistenceWriteFailed,
                           "cannot create directory: " + ec.message(), dir));
        }
    }

    auto tmp = tempPathFor(target);
    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return writeError("open temp file failed", tmp, errno);
    }

    if (!writeAll(fd, payload)) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return writeError("write failed", tmp, err);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return writeError("fsync failed", tmp, err);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return writeError("close failed", tmp, err);
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return writeError("rename failed", target, err);
    }

    if (!fsyncDirectory(dir)) {
        // The rename is done; only its durability across power loss is open.
        SHELF_LOG_WARN(LogCategory::Store,
                       "directory fsync failed for " + dir.string());
    }
    return ShelfResult<void>::ok();
}

bool endsWith(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// -- Impl -------------------------------------------------------------------

struct LibraryStore::Impl {
    StoreConfig config;

    mutable std::mutex dataMutex;  // Guards records and counters.
    LibraryMap records;
    uint64_t generation = 0;         // Bumped by every mutation.
    uint64_t flushedGeneration = 0;  // Generation last written to disk.
    uint64_t flushes = 0;
    uint64_t flushFailures = 0;

    std::mutex writeMutex;  // Serializes serialize-then-write.

    foundation::Signal<> changed;

    // Declared last: destroyed (and its timer thread joined) first, while
    // the members a running flush touches are still alive.
    Throttler throttler;

    explicit Impl(StoreConfig cfg)
        : config(std::move(cfg))
        , throttler(config.flushWindow) {}

    /// Called after the data lock is released.
    void mutated() {
        throttler.scheduleCall([this]() { (void)persist(); });
        changed.emit();
    }

    ShelfResult<void> persist() {
        std::lock_guard writeLock(writeMutex);

        std::string payload;
        uint64_t capturedGeneration = 0;
        ShelfResult<void> result = ShelfResult<void>::ok();
        {
            std::lock_guard lock(dataMutex);
            try {
                payload = encodeLibrary(records);
            } catch (const std::exception& e) {
                result = ShelfResult<void>::err(
                    ShelfError(ErrorCode::PersistenceWriteFailed,
                               std::string("cannot encode library: ") + e.what(), config.file));
            }
            capturedGeneration = generation;
        }

        if (result.hasValue()) {
            result = writeAtomically(config.file, payload);
        }

        std::lock_guard lock(dataMutex);
        if (result.hasError()) {
            ++flushFailures;
            SHELF_LOG_ERROR(LogCategory::Store,
                            "flush failed: " + result.error().describe());
            return result;
        }
        if (capturedGeneration > flushedGeneration) {
            flushedGeneration = capturedGeneration;
        }
        ++flushes;
        SHELF_LOG_DEBUG(LogCategory::Store,
                        "flushed " + std::to_string(records.size()) +
                            " collections to " + config.file.string());
        return result;
    }
};

// -- Construction / destruction ----------------------------------------------

LibraryStore::LibraryStore(StoreConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

LibraryStore::~LibraryStore() {
    impl_->throttler.cancel();
    if (isDirty()) {
        auto result = impl_->persist();
        if (result.hasError()) {
            SHELF_LOG_ERROR(LogCategory::Store,
                            "final flush lost unsaved changes: " +
                                result.error().describe());
        }
    }
}

// -- Loading -----------------------------------------------------------------

ShelfResult<void> LibraryStore::open() {
    const auto& file = impl_->config.file;

    std::error_code ec;
    auto tmp = tempPathFor(file);
    if (fs::remove(tmp, ec)) {
        SHELF_LOG_WARN(LogCategory::Store,
                       "removed stale temp file " + tmp.string());
    }

    auto reset = [this](LibraryMap records) {
        std::lock_guard lock(impl_->dataMutex);
        impl_->records = std::move(records);
        impl_->flushedGeneration = impl_->generation;
    };

    if (!fs::exists(file, ec)) {
        reset({});
        SHELF_LOG_INFO(LogCategory::Store,
                       "no library file at " + file.string() + ", starting empty");
        return ShelfResult<void>::ok();
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        reset({});
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::PersistenceLoadFailed, "cannot open library file", file));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto decoded = decodeLibrary(buffer.str());
    if (decoded.hasError()) {
        reset({});
        ShelfError error(ErrorCode::PersistenceLoadFailed,
                         std::string(decoded.error().message()), file);
        SHELF_LOG_WARN(LogCategory::Store,
                       "starting with an empty library: " + error.describe());
        return ShelfResult<void>::err(std::move(error));
    }

    auto count = decoded.value().size();
    reset(std::move(decoded).value());
    SHELF_LOG_INFO(LogCategory::Store,
                   "loaded " + std::to_string(count) + " collections from " +
                       file.string());
    return ShelfResult<void>::ok();
}

// -- Reads -------------------------------------------------------------------

std::optional<CollectionRecord> LibraryStore::get(const std::string& id) const {
    std::lock_guard lock(impl_->dataMutex);
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LibraryStore::contains(const std::string& id) const {
    std::lock_guard lock(impl_->dataMutex);
    return impl_->records.count(id) > 0;
}

std::size_t LibraryStore::size() const {
    std::lock_guard lock(impl_->dataMutex);
    return impl_->records.size();
}

LibrarySnapshot LibraryStore::snapshot() const {
    std::lock_guard lock(impl_->dataMutex);
    return LibrarySnapshot(impl_->records, foundation::nowTimestamp());
}

// -- Mutations ---------------------------------------------------------------

void LibraryStore::set(const std::string& id, CollectionRecord record) {
    record.id = id;
    {
        std::lock_guard lock(impl_->dataMutex);
        impl_->records.insert_or_assign(id, std::move(record));
        ++impl_->generation;
    }
    impl_->mutated();
}

bool LibraryStore::remove(const std::string& id) {
    {
        std::lock_guard lock(impl_->dataMutex);
        if (impl_->records.erase(id) == 0) {
            return false;
        }
        ++impl_->generation;
    }
    impl_->mutated();
    return true;
}

ShelfResult<RefreshOutcome> LibraryStore::refreshCollection(
    const std::string& id,
    const fs::path& directory,
    const std::string& extension) {

    std::error_code ec;
    auto status = fs::status(directory, ec);
    if (!fs::is_directory(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory &&
            ec != std::errc::not_a_directory) {
            return ShelfResult<RefreshOutcome>::err(
                ShelfError(ErrorCode::CollectionUpdateFailed,
                           "cannot stat collection: " + ec.message(), directory));
        }
        bool removed = remove(id);
        if (removed) {
            SHELF_LOG_INFO(LogCategory::Store, "collection removed: " + id);
        }
        return ShelfResult<RefreshOutcome>::ok(
            removed ? RefreshOutcome::Removed : RefreshOutcome::Absent);
    }

    // Listing happens without the store lock.
    std::set<std::string> chapters;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return ShelfResult<RefreshOutcome>::err(
            ShelfError(ErrorCode::CollectionUpdateFailed,
                       "cannot list collection: " + ec.message(), directory));
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (endsWith(name, extension)) {
            chapters.insert(std::move(name));
        }
    }
    if (ec) {
        return ShelfResult<RefreshOutcome>::err(
            ShelfError(ErrorCode::CollectionUpdateFailed,
                       "listing interrupted: " + ec.message(), directory));
    }

    RefreshOutcome outcome;
    std::size_t count = chapters.size();
    {
        std::lock_guard lock(impl_->dataMutex);
        auto now = foundation::nowTimestamp();
        auto found = impl_->records.find(id);
        if (found != impl_->records.end()) {
            auto& record = found->second;
            record.path = directory;
            record.chapterFiles = std::move(chapters);
            record.lastUpdated = now;
            outcome = RefreshOutcome::Updated;
        } else {
            CollectionRecord record;
            record.id = id;
            record.path = directory;
            record.createdAt = now;
            record.lastUpdated = now;
            record.chapterFiles = std::move(chapters);
            impl_->records.emplace(id, std::move(record));
            outcome = RefreshOutcome::Created;
        }
        ++impl_->generation;
    }
    impl_->mutated();

    SHELF_LOG_DEBUG(LogCategory::Store,
                    "collection " + std::string(refreshOutcomeName(outcome)) + ": " +
                        id + " (" + std::to_string(count) + " chapters)");
    return ShelfResult<RefreshOutcome>::ok(outcome);
}

bool LibraryStore::renameCollection(const std::string& oldId,
                                    const std::string& newId,
                                    const fs::path& newPath) {
    {
        std::lock_guard lock(impl_->dataMutex);
        auto node = impl_->records.extract(oldId);
        if (node.empty()) {
            return false;
        }
        auto record = std::move(node.mapped());
        record.id = newId;
        record.path = newPath;
        record.lastUpdated = foundation::nowTimestamp();
        impl_->records.insert_or_assign(newId, std::move(record));
        ++impl_->generation;
    }
    impl_->mutated();

    SHELF_LOG_INFO(LogCategory::Store, "collection renamed: " + oldId + " -> " + newId);
    return true;
}

// -- Persistence -------------------------------------------------------------

ShelfResult<void> LibraryStore::forceFlush() {
    impl_->throttler.cancel();
    return impl_->persist();
}

bool LibraryStore::isDirty() const {
    std::lock_guard lock(impl_->dataMutex);
    return impl_->generation != impl_->flushedGeneration;
}

StoreStats LibraryStore::stats() const {
    std::lock_guard lock(impl_->dataMutex);
    StoreStats s;
    s.flushes = impl_->flushes;
    s.flushFailures = impl_->flushFailures;
    s.mutations = impl_->generation;
    return s;
}

const fs::path& LibraryStore::file() const noexcept {
    return impl_->config.file;
}

foundation::Signal<>& LibraryStore::onChanged() {
    return impl_->changed;
}

} // namespace shelf::library

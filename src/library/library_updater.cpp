/// @file library_updater.cpp
/// @brief LibraryUpdater implementation.

#include "shelf/library/library_updater.hpp"

#include <exception>
#include <string>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

using shelf::foundation::LogCategory;

LibraryUpdater::LibraryUpdater(LibraryStore& store, UpdaterConfig config)
    : store_(store)
    , previous_(store.snapshot())
    , throttler_(config.window) {}

LibraryUpdater::~LibraryUpdater() {
    detach();
    throttler_.cancel();
}

// -- Store subscription ------------------------------------------------------

void LibraryUpdater::attach() {
    std::lock_guard lock(attachMutex_);
    if (slot_) {
        return;
    }
    slot_ = store_.onChanged().connect([this]() { scheduleUpdate(); });
}

void LibraryUpdater::detach() {
    std::lock_guard lock(attachMutex_);
    if (!slot_) {
        return;
    }
    store_.onChanged().disconnect(*slot_);
    slot_.reset();
}

bool LibraryUpdater::isAttached() const {
    std::lock_guard lock(attachMutex_);
    return slot_.has_value();
}

// -- Passes ------------------------------------------------------------------

void LibraryUpdater::scheduleUpdate() {
    throttler_.scheduleCall([this]() { (void)updateNow(); });
}

LibraryDiff LibraryUpdater::updateNow() {
    std::lock_guard lock(passMutex_);

    auto current = store_.snapshot();
    auto diff = reconcile(previous_, current);
    previous_ = std::move(current);
    ++passes_;

    if (diff.empty()) {
        return diff;
    }

    SHELF_LOG_INFO(LogCategory::Reconciler, "library changed: " + summarize(diff));
    try {
        onDiff_.emit(diff);
    } catch (const std::exception& e) {
        SHELF_LOG_ERROR(LogCategory::Reconciler,
                        std::string("diff subscriber failed: ") + e.what());
    }
    return diff;
}

void LibraryUpdater::rebase() {
    std::lock_guard lock(passMutex_);
    previous_ = store_.snapshot();
}

LibrarySnapshot LibraryUpdater::baseline() const {
    std::lock_guard lock(passMutex_);
    return previous_;
}

} // namespace shelf::library

/**
 * @file Store.hpp
 * @brief Resource store capability consumed by the engine
 *
 * The engine never talks to a concrete client. Everything it needs from the
 * store is this interface: read, apply (dry-run or real), patch, and a scope
 * lookup. Implementations report failures as StoreError (or a subclass);
 * absence on read is std::nullopt, not an error.
 */

#ifndef FIELDPATCH_STORE_HPP
#define FIELDPATCH_STORE_HPP

#include "fieldpatch/Object.hpp"
#include "fieldpatch/PatchSpec.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace fieldpatch {

/**
 * @brief Shared cancellation flag
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Per-cycle call context: deadline and cancellation
 *
 * Copies share the same token, so cancelling through any copy cancels the
 * cycle.
 */
class CallContext {
public:
    using Clock = std::chrono::steady_clock;

    CallContext();
    explicit CallContext(std::chrono::milliseconds timeout);

    /**
     * @brief Context with no deadline
     */
    static CallContext background();

    void cancel() { token_->cancel(); }
    bool cancelled() const;
    bool expired() const;

    std::chrono::milliseconds remaining() const;

    /**
     * @brief Throw CancelledError if cancelled or past the deadline
     * @param where Operation about to run, for the error message
     */
    void check(const std::string& where) const;

private:
    std::shared_ptr<CancelToken> token_;
    std::optional<Clock::time_point> deadline_;
};

struct ApplyOptions {
    std::string manager;
    bool force = false;
    bool dry_run = false;
};

struct PatchOptions {
    std::string manager;
    bool dry_run = false;
};

/**
 * @brief Abstract resource store
 */
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    /**
     * @brief Read an object
     * @return std::nullopt when absent
     * @throws StoreError for every other failure
     */
    virtual std::optional<Object> get(const TargetRef& ref, const CallContext& ctx) = 0;

    /**
     * @brief Server-side apply of a partial object under a field manager
     * @return The resulting object (the prediction when dry_run is set)
     */
    virtual Object apply(const Object& object, const ApplyOptions& options,
                         const CallContext& ctx) = 0;

    /**
     * @brief Apply a JSON patch or map-merge patch
     * @param kind PatchKind::JsonPatch or PatchKind::MergePatch
     */
    virtual Object patch(const TargetRef& ref, PatchKind kind, const std::string& content,
                         const PatchOptions& options, const CallContext& ctx) = 0;

    /**
     * @brief Whether objects of this kind live in a namespace
     */
    virtual bool namespaced(const std::string& api_version, const std::string& kind) const = 0;
};

} // namespace fieldpatch

#endif // FIELDPATCH_STORE_HPP

/**
 * @file LocalStore.hpp
 * @brief In-process resource store with simplified server-side apply
 *
 * Holds objects in memory and tracks field ownership per manager the way
 * the real store does, closely enough for offline planning and tests:
 *
 * - apply: fields in the applied document become owned by the applier;
 *   a non-forced apply that changes a field owned by another manager fails
 *   with 409; a forced apply takes those fields over. Fields the applier
 *   owned before and no longer applies are removed unless another manager
 *   still owns them.
 * - update / patch: changed fields move to the writer ("Update" entries).
 * - lists whose elements all carry a string "name" merge by name and are
 *   owned per element (k:{"name":...}); other lists are atomic.
 * - registered immutable fields reject changes with 422; registered
 *   schemas reject unknown fields with 400.
 */

#ifndef FIELDPATCH_LOCALSTORE_HPP
#define FIELDPATCH_LOCALSTORE_HPP

#include "fieldpatch/Store.hpp"
#include "fieldpatch/Errors.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fieldpatch {

class LocalStore : public ResourceStore {
public:
    LocalStore();

    // ========================================================================
    // ResourceStore
    // ========================================================================

    std::optional<Object> get(const TargetRef& ref, const CallContext& ctx) override;
    Object apply(const Object& object, const ApplyOptions& options,
                 const CallContext& ctx) override;
    Object patch(const TargetRef& ref, PatchKind kind, const std::string& content,
                 const PatchOptions& options, const CallContext& ctx) override;
    bool namespaced(const std::string& api_version, const std::string& kind) const override;

    // ========================================================================
    // Direct manipulation
    // ========================================================================

    /**
     * @brief Insert or replace an object as-is
     *
     * Ownership is taken from the document's metadata.managedFields.
     *
     * @throws ParseError if managedFields cannot be parsed
     */
    void put(const Object& object);

    /**
     * @brief Non-apply write of a whole object by `manager`
     *
     * Creates the object when absent. Changed fields are recorded under an
     * "Update" entry for the manager and released by everyone else.
     */
    Object update(const Object& object, const std::string& manager);

    /**
     * @brief Update a single field, as an external writer would
     * @throws StoreError (404) if the object does not exist
     */
    Object set_field(const TargetRef& ref, const std::string& path, const Value& value,
                     const std::string& manager);

    bool remove(const TargetRef& ref);
    std::size_t size() const;
    std::vector<Object> list() const;

    // ========================================================================
    // Behavior registration
    // ========================================================================

    void register_cluster_scoped(const std::string& kind);

    /**
     * @brief Changes to `path` on objects of `kind` are rejected with 422
     */
    void register_immutable(const std::string& kind, const std::string& path);

    /**
     * @brief Only fields under these prefixes (plus apiVersion, kind and
     *        metadata) are accepted for `kind`; others fail with 400
     *
     * Prefixes are field-only paths ("spec.replicas"); array selectors in
     * written paths are ignored for the comparison.
     */
    void register_schema(const std::string& kind, std::vector<std::string> allowed);

    /**
     * @brief Fail the next non-dry-run write with this error
     */
    void fail_next_write(const StoreError& error);

    /**
     * @brief Real (non-dry-run) writes performed so far
     */
    std::size_t write_count() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Load objects from a file holding one object or a List
     * @throws FileNotFoundError, ParseError
     */
    void load_file(const std::string& path);

    /**
     * @brief Save objects (a single object, or a List when several)
     */
    void save_file(const std::string& path) const;

private:
    struct FieldsEntry {
        std::string manager;
        std::string operation;
        std::string api_version;
        std::set<std::string> paths;
    };

    struct Stored {
        Value doc;                        ///< Without metadata.managedFields
        std::vector<FieldsEntry> entries;
        long resource_version = 0;
    };

    std::string key_for(const TargetRef& ref) const;
    TargetRef normalize(const TargetRef& ref) const;
    Object render(const Stored& stored) const;

    void check_immutable(const std::string& kind, const Value& before, const Value& after) const;
    void check_schema(const std::string& kind, const std::set<std::string>& paths) const;
    void consume_failure(bool dry_run);
    void record_update(Stored& stored, const Value& before, const std::string& manager);
    Object commit(const std::string& key, Stored stored, bool dry_run);

    mutable std::mutex mutex_;
    std::map<std::string, Stored> objects_;
    std::set<std::string> cluster_scoped_;
    std::map<std::string, std::vector<std::string>> immutable_;
    std::map<std::string, std::vector<std::string>> schemas_;
    std::optional<StoreError> pending_failure_;
    std::size_t writes_ = 0;
    long next_uid_ = 1;
};

} // namespace fieldpatch

#endif // FIELDPATCH_LOCALSTORE_HPP

/**
 * @file LocalStore.cpp
 * @brief In-memory store with simplified server-side apply
 */

#include "fieldpatch/LocalStore.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/FieldSet.hpp"
#include "fieldpatch/Loader.hpp"
#include "fieldpatch/Log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace fieldpatch {

namespace {

const char* const kTag = "local-store";

// Paths the store maintains itself; never owned by a manager
const std::vector<std::string> kUntracked = {
    "apiVersion",
    "kind",
    "metadata.name",
    "metadata.namespace",
    "metadata.uid",
    "metadata.resourceVersion",
    "metadata.generation",
    "metadata.creationTimestamp",
    "metadata.managedFields",
    "status"
};

const std::vector<std::string> kDefaultClusterScoped = {
    "Namespace",
    "Node",
    "PersistentVolume",
    "ClusterRole",
    "ClusterRoleBinding",
    "StorageClass",
    "CustomResourceDefinition"
};

bool untracked(const std::string& path) {
    return std::any_of(kUntracked.begin(), kUntracked.end(),
                       [&](const std::string& u) { return path_has_prefix(path, u); });
}

/**
 * @brief A list merged and owned per element by its "name" field
 */
bool associative(const Value& arr) {
    if (!arr.is_array() || arr.empty()) return false;
    return std::all_of(arr.begin(), arr.end(), [](const Value& e) {
        return e.is_object() && e.contains("name") && e["name"].is_string();
    });
}

std::string element_path(const std::string& prefix, const Value& element) {
    return prefix + join_field_path(FieldPath{
        PathSegment::keyed({{"name", element["name"].get<std::string>()}})});
}

void collect_owned(const Value& node, const std::string& prefix, std::set<std::string>& out) {
    if (node.is_object()) {
        if (node.empty()) {
            if (!prefix.empty()) out.insert(prefix);
            return;
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it->is_null()) continue;
            collect_owned(it.value(), append_field(prefix, it.key()), out);
        }
        return;
    }
    if (associative(node)) {
        for (const auto& element : node) {
            const std::string path = element_path(prefix, element);
            out.insert(path);
            for (auto it = element.begin(); it != element.end(); ++it) {
                if (it->is_null()) continue;
                collect_owned(it.value(), append_field(path, it.key()), out);
            }
        }
        return;
    }
    if (!prefix.empty()) out.insert(prefix);
}

/**
 * @brief Ownership paths of a document: leaves plus keyed element markers
 */
std::set<std::string> owned_paths(const Value& doc) {
    std::set<std::string> all;
    collect_owned(doc, "", all);
    std::set<std::string> out;
    for (const auto& p : all) {
        if (!untracked(p)) out.insert(p);
    }
    return out;
}

bool is_marker(const std::string& path) {
    if (path.empty() || path.back() != ']') return false;
    const FieldPath fp = split_field_path(path);
    return !fp.empty() && fp.back().kind == SegmentKind::Key;
}

bool same_value(const Value& a, const Value& b, const std::string& path) {
    const Value* va = find_by_path(a, path);
    const Value* vb = find_by_path(b, path);
    if (va == nullptr || vb == nullptr) return va == vb;
    return *va == *vb;
}

/**
 * @brief Merge an applied document into the live one
 *
 * Objects recurse, associative lists merge by name, null removes a key,
 * everything else replaces.
 */
void ssa_merge(Value& live, const Value& applied) {
    if (live.is_object() && applied.is_object()) {
        for (auto it = applied.begin(); it != applied.end(); ++it) {
            if (it->is_null()) {
                live.erase(it.key());
                continue;
            }
            auto existing = live.find(it.key());
            if (existing == live.end()) {
                live[it.key()] = it.value();
            } else {
                ssa_merge(*existing, it.value());
            }
        }
        return;
    }
    if (associative(live) && associative(applied)) {
        for (const auto& element : applied) {
            auto match = std::find_if(live.begin(), live.end(), [&](const Value& e) {
                return e["name"] == element["name"];
            });
            if (match == live.end()) {
                live.push_back(element);
            } else {
                ssa_merge(*match, element);
            }
        }
        return;
    }
    live = applied;
}

void erase_path(Value& doc, const std::string& path) {
    const FieldPath fp = split_field_path(path);
    if (fp.empty()) return;
    const Value* target = find_by_path(doc, fp);
    if (target == nullptr) return;

    Value* parent = find_by_path(doc, FieldPath(fp.begin(), fp.end() - 1));
    if (parent == nullptr) return;

    if (fp.back().kind == SegmentKind::Field) {
        parent->erase(fp.back().name);
        return;
    }
    for (std::size_t i = 0; i < parent->size(); ++i) {
        if (&(*parent)[i] == target) {
            parent->erase(i);
            return;
        }
    }
}

std::string field_only(const std::string& path) {
    FieldPath fields;
    for (const auto& seg : split_field_path(path)) {
        if (seg.kind == SegmentKind::Field) fields.push_back(seg);
    }
    return join_field_path(fields);
}

void strip_managed(Value& doc) {
    if (doc.is_object() && doc.contains("metadata") && doc["metadata"].is_object()) {
        doc["metadata"].erase("managedFields");
    }
}

void set_namespace(Value& doc, const std::string& ns) {
    Value& meta = doc["metadata"];
    if (!meta.is_object()) meta = Value::object();
    if (ns.empty()) {
        meta.erase("namespace");
    } else {
        meta["namespace"] = ns;
    }
}

} // namespace

// ============================================================================
// Construction and lookup
// ============================================================================

LocalStore::LocalStore()
    : cluster_scoped_(kDefaultClusterScoped.begin(), kDefaultClusterScoped.end())
{}

bool LocalStore::namespaced(const std::string& /*api_version*/, const std::string& kind) const {
    return cluster_scoped_.count(kind) == 0;
}

TargetRef LocalStore::normalize(const TargetRef& ref) const {
    TargetRef out = ref;
    if (!namespaced(ref.api_version, ref.kind)) {
        if (!out.namespace_.empty()) {
            FIELDPATCH_LOG_DEBUG(kTag, "ignoring namespace '{}' for cluster-scoped {}",
                                 out.namespace_, ref.kind);
        }
        out.namespace_.clear();
    } else if (out.namespace_.empty()) {
        out.namespace_ = "default";
    }
    return out;
}

std::string LocalStore::key_for(const TargetRef& ref) const {
    return ref.kind + "/" + ref.namespace_ + "/" + ref.name;
}

Object LocalStore::render(const Stored& stored) const {
    Object out(stored.doc);
    std::vector<ManagedFieldsEntry> entries;
    for (const auto& e : stored.entries) {
        if (e.paths.empty()) continue;
        ManagedFieldsEntry mf;
        mf.manager = e.manager;
        mf.operation = e.operation;
        mf.api_version = e.api_version;
        mf.fields = FieldSet::from_paths(
            std::vector<std::string>(e.paths.begin(), e.paths.end())).to_value();
        entries.push_back(std::move(mf));
    }
    out.set_managed_fields(entries);
    return out;
}

// ============================================================================
// Validation hooks
// ============================================================================

void LocalStore::check_immutable(const std::string& kind, const Value& before,
                                 const Value& after) const {
    auto it = immutable_.find(kind);
    if (it == immutable_.end() || before.is_null()) return;

    std::vector<std::string> problems;
    for (const auto& path : it->second) {
        const Value* old_value = find_by_path(before, path);
        if (old_value == nullptr) continue;
        const Value* new_value = find_by_path(after, path);
        if (new_value != nullptr && *new_value == *old_value) continue;
        problems.push_back(fmt::format("{}: Invalid value: {}: field is immutable", path,
                                       new_value ? new_value->dump() : "null"));
    }
    if (problems.empty()) return;

    std::string name;
    if (after.contains("metadata") && after["metadata"].contains("name")) {
        name = render_scalar(after["metadata"]["name"]);
    }
    throw StoreError(422, "Invalid",
                     fmt::format("{} \"{}\" is invalid: {}", kind, name,
                                 fmt::join(problems, ", ")));
}

void LocalStore::check_schema(const std::string& kind, const std::set<std::string>& paths) const {
    auto it = schemas_.find(kind);
    if (it == schemas_.end()) return;

    std::vector<std::string> unknown;
    for (const auto& path : paths) {
        const std::string fields = field_only(path);
        if (path_has_prefix(fields, "metadata")) continue;
        bool known = std::any_of(it->second.begin(), it->second.end(),
                                 [&](const std::string& allowed) {
                                     return path_has_prefix(fields, allowed) ||
                                            path_has_prefix(allowed, fields);
                                 });
        if (!known && std::find(unknown.begin(), unknown.end(), fields) == unknown.end()) {
            unknown.push_back(fmt::format("unknown field \"{}\"", fields));
        }
    }
    if (!unknown.empty()) {
        throw StoreError(400, "BadRequest",
                         fmt::format("strict decoding error: {}", fmt::join(unknown, ", ")));
    }
}

void LocalStore::consume_failure(bool dry_run) {
    if (dry_run || !pending_failure_) return;
    StoreError error = *pending_failure_;
    pending_failure_.reset();
    throw error;
}

void LocalStore::record_update(Stored& stored, const Value& before, const std::string& manager) {
    const std::set<std::string> old_paths = owned_paths(before);
    const std::set<std::string> new_paths = owned_paths(stored.doc);

    std::set<std::string> changed;
    for (const auto& p : new_paths) {
        if (is_marker(p)) {
            if (old_paths.count(p) == 0) changed.insert(p);
        } else if (!same_value(before, stored.doc, p)) {
            changed.insert(p);
        }
    }
    std::set<std::string> removed;
    for (const auto& p : old_paths) {
        if (new_paths.count(p) == 0) removed.insert(p);
    }

    FieldsEntry* writer = nullptr;
    for (auto& e : stored.entries) {
        for (const auto& p : removed) e.paths.erase(p);
        if (e.manager == manager && e.operation == "Update") {
            writer = &e;
            continue;
        }
        for (const auto& p : changed) e.paths.erase(p);
    }
    if (!changed.empty()) {
        if (writer == nullptr) {
            stored.entries.push_back(FieldsEntry{manager, "Update",
                                                 stored.doc.value("apiVersion", ""), {}});
            writer = &stored.entries.back();
        }
        writer->paths.insert(changed.begin(), changed.end());
    }

    stored.entries.erase(std::remove_if(stored.entries.begin(), stored.entries.end(),
                                        [](const FieldsEntry& e) { return e.paths.empty(); }),
                         stored.entries.end());
}

Object LocalStore::commit(const std::string& key, Stored stored, bool dry_run) {
    if (dry_run) {
        return render(stored);
    }
    ++stored.resource_version;
    stored.doc["metadata"]["resourceVersion"] = std::to_string(stored.resource_version);
    ++writes_;
    auto& slot = objects_[key];
    slot = std::move(stored);
    return render(slot);
}

// ============================================================================
// ResourceStore
// ============================================================================

std::optional<Object> LocalStore::get(const TargetRef& ref, const CallContext& ctx) {
    ctx.check("get " + ref.describe());
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key_for(normalize(ref)));
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return render(it->second);
}

Object LocalStore::apply(const Object& object, const ApplyOptions& options,
                         const CallContext& ctx) {
    ctx.check("apply");
    if (options.manager.empty()) {
        throw StoreError(400, "BadRequest", "fieldManager is required for apply requests");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const TargetRef ref = normalize(object.ref());
    if (ref.kind.empty() || ref.name.empty() || ref.api_version.empty()) {
        throw StoreError(400, "BadRequest", "apply requires apiVersion, kind and metadata.name");
    }
    consume_failure(options.dry_run);

    Value applied = object.doc();
    strip_managed(applied);
    set_namespace(applied, ref.namespace_);

    const std::string key = key_for(ref);
    auto found = objects_.find(key);
    Stored stored;
    if (found != objects_.end()) {
        stored = found->second;
    } else {
        stored.doc = {
            {"apiVersion", ref.api_version},
            {"kind", ref.kind},
            {"metadata", {{"name", ref.name}, {"uid", fmt::format("uid-{}", next_uid_)}}}
        };
        if (!ref.namespace_.empty()) {
            stored.doc["metadata"]["namespace"] = ref.namespace_;
        }
        if (!options.dry_run) ++next_uid_;
    }
    const Value before = stored.doc;
    const bool existed = found != objects_.end();

    const std::set<std::string> applied_paths = owned_paths(applied);
    check_schema(ref.kind, applied_paths);

    // Fields whose value changes while another manager owns them
    std::vector<std::pair<std::string, std::string>> conflicts;
    for (const auto& p : applied_paths) {
        if (is_marker(p)) continue;
        const Value* live_value = find_by_path(before, p);
        const Value* new_value = find_by_path(applied, p);
        if (live_value == nullptr || new_value == nullptr || *live_value == *new_value) continue;
        for (const auto& e : stored.entries) {
            if (e.manager != options.manager && e.paths.count(p) > 0) {
                conflicts.emplace_back(p, e.manager);
            }
        }
    }

    if (!conflicts.empty() && !options.force) {
        std::vector<std::string> lines;
        for (const auto& c : conflicts) {
            lines.push_back(fmt::format("conflict with \"{}\" using {}: .{}",
                                        c.second, ref.api_version, c.first));
        }
        throw StoreError(409, "Conflict",
                         fmt::format("Apply failed with {} conflict{}: {}", conflicts.size(),
                                     conflicts.size() == 1 ? "" : "s",
                                     fmt::join(lines, "\n")));
    }

    FieldsEntry* mine = nullptr;
    for (auto& e : stored.entries) {
        if (e.manager == options.manager && e.operation == "Apply") {
            mine = &e;
            break;
        }
    }

    // Drop fields this manager stopped applying, unless someone else owns them
    Value after = before;
    if (mine != nullptr) {
        std::vector<std::string> dropped;
        for (const auto& p : mine->paths) {
            if (applied_paths.count(p) == 0) dropped.push_back(p);
        }
        std::sort(dropped.begin(), dropped.end(),
                  [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
        for (const auto& p : dropped) {
            bool shared = std::any_of(stored.entries.begin(), stored.entries.end(),
                                      [&](const FieldsEntry& e) {
                                          if (&e == mine) return false;
                                          return std::any_of(e.paths.begin(), e.paths.end(),
                                                             [&](const std::string& q) {
                                                                 return path_has_prefix(q, p);
                                                             });
                                      });
            if (!shared) erase_path(after, p);
        }
    }

    ssa_merge(after, applied);
    if (existed) {
        check_immutable(ref.kind, before, after);
    }

    for (const auto& c : conflicts) {
        for (auto& e : stored.entries) {
            if (e.manager == c.second) e.paths.erase(c.first);
        }
    }
    if (mine == nullptr) {
        stored.entries.push_back(FieldsEntry{options.manager, "Apply", ref.api_version, {}});
        mine = &stored.entries.back();
    }
    mine->paths = applied_paths;
    mine->api_version = ref.api_version;

    stored.entries.erase(std::remove_if(stored.entries.begin(), stored.entries.end(),
                                        [](const FieldsEntry& e) { return e.paths.empty(); }),
                         stored.entries.end());
    stored.doc = std::move(after);

    FIELDPATCH_LOG_DEBUG(kTag, "{}apply {} by '{}' ({} fields, {} taken over)",
                         options.dry_run ? "dry-run " : "", ref.describe(), options.manager,
                         applied_paths.size(), conflicts.size());
    return commit(key, std::move(stored), options.dry_run);
}

Object LocalStore::patch(const TargetRef& ref, PatchKind kind, const std::string& content,
                         const PatchOptions& options, const CallContext& ctx) {
    ctx.check("patch " + ref.describe());
    if (kind == PatchKind::Merge) {
        throw StoreError(415, "UnsupportedMediaType",
                         "merge documents are submitted through apply");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const TargetRef normalized = normalize(ref);
    const std::string key = key_for(normalized);
    auto found = objects_.find(key);
    if (found == objects_.end()) {
        throw StoreError(404, "NotFound",
                         fmt::format("{} \"{}\" not found", ref.kind, ref.name));
    }
    consume_failure(options.dry_run);

    Value body = Value::parse(content, nullptr, false);
    if (body.is_discarded()) {
        throw StoreError(400, "BadRequest", "invalid patch body: not valid JSON");
    }

    Stored stored = found->second;
    const Value before = stored.doc;
    Value after;
    try {
        if (kind == PatchKind::JsonPatch) {
            after = before.patch(body);
        } else {
            after = before;
            after.merge_patch(body);
        }
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(422, "Invalid", fmt::format("patch could not be applied: {}", e.what()));
    }

    Object patched(after);
    if (patched.kind() != normalized.kind || patched.name() != normalized.name) {
        throw StoreError(422, "Invalid", "metadata.name: Invalid value: field is immutable");
    }

    check_immutable(normalized.kind, before, after);
    check_schema(normalized.kind, owned_paths(after));

    stored.doc = std::move(after);
    record_update(stored, before, options.manager.empty() ? "unknown" : options.manager);
    return commit(key, std::move(stored), options.dry_run);
}

// ============================================================================
// Direct manipulation
// ============================================================================

void LocalStore::put(const Object& object) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TargetRef ref = normalize(object.ref());

    Stored stored;
    stored.doc = object.doc();
    strip_managed(stored.doc);
    set_namespace(stored.doc, ref.namespace_);
    for (const auto& mf : object.managed_fields()) {
        const FieldSet fields = FieldSet::parse(mf.fields);
        FieldsEntry entry{mf.manager, mf.operation.empty() ? "Update" : mf.operation,
                          mf.api_version, {}};
        for (const auto& p : fields.paths()) entry.paths.insert(p);
        stored.entries.push_back(std::move(entry));
    }
    const Value& meta = stored.doc["metadata"];
    if (meta.contains("resourceVersion") && meta["resourceVersion"].is_string()) {
        try {
            stored.resource_version = std::stol(meta["resourceVersion"].get<std::string>());
        } catch (const std::exception&) {
            stored.resource_version = 0;
        }
    }
    objects_[key_for(ref)] = std::move(stored);
}

Object LocalStore::update(const Object& object, const std::string& manager) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TargetRef ref = normalize(object.ref());
    consume_failure(false);

    const std::string key = key_for(ref);
    auto found = objects_.find(key);
    Stored stored;
    Value before;
    if (found != objects_.end()) {
        stored = found->second;
        before = stored.doc;
    }

    Value after = object.doc();
    strip_managed(after);
    set_namespace(after, ref.namespace_);
    if (!before.is_null() && before["metadata"].is_object() &&
        before["metadata"].contains("uid")) {
        after["metadata"]["uid"] = before["metadata"]["uid"];
    } else {
        after["metadata"]["uid"] = fmt::format("uid-{}", next_uid_++);
    }

    check_immutable(ref.kind, before, after);
    check_schema(ref.kind, owned_paths(after));

    stored.doc = std::move(after);
    record_update(stored, before.is_null() ? Value::object() : before, manager);
    return commit(key, std::move(stored), false);
}

Object LocalStore::set_field(const TargetRef& ref, const std::string& path, const Value& value,
                             const std::string& manager) {
    Value doc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = objects_.find(key_for(normalize(ref)));
        if (found == objects_.end()) {
            throw StoreError(404, "NotFound",
                             fmt::format("{} \"{}\" not found", ref.kind, ref.name));
        }
        doc = found->second.doc;
    }
    set_by_path(doc, split_field_path(path), value);
    return update(Object(std::move(doc)), manager);
}

bool LocalStore::remove(const TargetRef& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.erase(key_for(normalize(ref))) > 0;
}

std::size_t LocalStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

std::vector<Object> LocalStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Object> out;
    for (const auto& kv : objects_) {
        out.push_back(render(kv.second));
    }
    return out;
}

// ============================================================================
// Behavior registration
// ============================================================================

void LocalStore::register_cluster_scoped(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    cluster_scoped_.insert(kind);
}

void LocalStore::register_immutable(const std::string& kind, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    immutable_[kind].push_back(path);
}

void LocalStore::register_schema(const std::string& kind, std::vector<std::string> allowed) {
    std::lock_guard<std::mutex> lock(mutex_);
    schemas_[kind] = std::move(allowed);
}

void LocalStore::fail_next_write(const StoreError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failure_ = error;
}

std::size_t LocalStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

// ============================================================================
// Persistence
// ============================================================================

void LocalStore::load_file(const std::string& path) {
    const Value doc = load_document_file(path);
    if (doc.is_array()) {
        for (const auto& item : doc) put(Object(item));
        return;
    }
    if (doc.value("kind", "") == "List" && doc.contains("items") && doc["items"].is_array()) {
        for (const auto& item : doc["items"]) put(Object(item));
        return;
    }
    put(Object(doc));
}

void LocalStore::save_file(const std::string& path) const {
    const std::vector<Object> objects = list();
    if (objects.size() == 1) {
        save_json_file(path, objects.front().doc());
        return;
    }
    Value items = Value::array();
    for (const auto& o : objects) items.push_back(o.doc());
    save_json_file(path, Value{{"apiVersion", "v1"}, {"kind", "List"}, {"items", items}});
}

} // namespace fieldpatch

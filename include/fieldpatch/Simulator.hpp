/**
 * @file Simulator.hpp
 * @brief Submitting a patch through the store, as a dry run or for real
 */

#ifndef FIELDPATCH_SIMULATOR_HPP
#define FIELDPATCH_SIMULATOR_HPP

#include "fieldpatch/Object.hpp"
#include "fieldpatch/PatchSpec.hpp"
#include "fieldpatch/Store.hpp"

#include <string>

namespace fieldpatch {

class MergeSimulator {
public:
    explicit MergeSimulator(ResourceStore& store) : store_(store) {}

    /**
     * @brief Identity skeleton of `live` with the patch document merged in
     *
     * apiVersion, kind, metadata.name and (for namespaced kinds)
     * metadata.namespace; everything else comes from the patch.
     */
    Value build_request(const Object& live, const Value& patch) const;

    /**
     * @brief Submit the patch under `manager`
     *
     * Merge documents go through a forced apply; the other kinds through
     * the store's patch capability. Store failures are rethrown as their
     * structured subclasses (see decode_store_error).
     *
     * @param dry_run Predict only; nothing is persisted
     * @return The store's resulting object
     */
    Object submit(const Object& live, const PatchSpec& spec, const std::string& manager,
                  bool dry_run, const CallContext& ctx) const;

    Object simulate(const Object& live, const PatchSpec& spec, const std::string& manager,
                    const CallContext& ctx) const {
        return submit(live, spec, manager, true, ctx);
    }

private:
    ResourceStore& store_;
};

} // namespace fieldpatch

#endif // FIELDPATCH_SIMULATOR_HPP

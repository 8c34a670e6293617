/**
 * @file Diagnostics.hpp
 * @brief User-facing diagnostics attached to engine results
 */

#ifndef FIELDPATCH_DIAGNOSTICS_HPP
#define FIELDPATCH_DIAGNOSTICS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace fieldpatch {

enum class Severity {
    Info,
    Warning,
    Error
};

const char* severity_name(Severity severity);

struct Diagnostic {
    Severity severity = Severity::Info;
    std::string summary;
    std::string detail;
};

using Diagnostics = std::vector<Diagnostic>;

inline bool has_errors(const Diagnostics& diags) {
    for (const auto& d : diags) {
        if (d.severity == Severity::Error) return true;
    }
    return false;
}

inline std::size_t count_severity(const Diagnostics& diags, Severity severity) {
    std::size_t n = 0;
    for (const auto& d : diags) {
        if (d.severity == severity) ++n;
    }
    return n;
}

} // namespace fieldpatch

#endif // FIELDPATCH_DIAGNOSTICS_HPP

#include <utility>

#include "slopcc/util/assert.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/diagnostic.hpp"

namespace slopcc {

void Diagnostics::push(Diagnostic diagnostic)
{
    SLOPCC_ASSERT(severity_is_emittable(diagnostic.severity));
    SLOPCC_ASSERT(!diagnostic.id.empty());
    if (!can_log(diagnostic.severity)) {
        return;
    }
    if (diagnostic.severity == Severity::error) {
        ++m_error_count;
    }
    m_diagnostics.push_back(std::move(diagnostic));
}

} // namespace slopcc

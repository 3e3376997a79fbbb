#pragma once
#include "core.h"
#include <stdexcept>

namespace tbx {

// Failure raised by a GridService implementation
class ServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── External computation interface ──
// Sort and reorder results are computed outside the engine. Calls run on a
// worker thread, one at a time; an implementation reports failure by
// throwing (ServiceError or any std::exception).

class GridService {
public:
    virtual ~GridService() = default;
    virtual Grid sort(const Grid& grid, const SortState& state) = 0;
    virtual Grid moveRow(const Grid& grid, int from, int to) = 0;
    virtual Grid moveColumn(const Grid& grid, int from, int to) = 0;
    virtual QString name() const { return QStringLiteral("service"); }
};

} // namespace tbx

#pragma once
#include "core.h"

namespace tbx {

struct SelectionStatistics {
    bool   valid          = false;   // false when nothing is selected
    int    count          = 0;       // non-blank values
    int    numericCount   = 0;
    bool   hasNumericData = false;
    double sum            = 0.0;
    double min            = 0.0;
    double max            = 0.0;
    double average        = 0.0;
};

SelectionStatistics computeStatistics(const Grid& grid, const Selection& sel);

// Leading numeric prefix of text after stripping "," "$" "%"
double parseLooseNumber(const QString& text, bool* ok);

} // namespace tbx

#pragma once
#include "core.h"
#include <QSettings>

namespace tbx {

struct EngineSettings {
    static constexpr int kDefaultHistoryLimit = 100;

    int           historyLimit       = kDefaultHistoryLimit;
    QString       columnNameTemplate = QStringLiteral("Column %1");
    SearchOptions searchDefaults;

    static EngineSettings load(QSettings& s);
    static EngineSettings load();            // QSettings("TabulaX", "TabulaX")
    void save(QSettings& s) const;
    void save() const;
};

} // namespace tbx

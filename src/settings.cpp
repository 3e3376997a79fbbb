#include "settings.h"
#include <QDebug>

namespace tbx {

EngineSettings EngineSettings::load(QSettings& s) {
    EngineSettings e;

    bool ok = false;
    int limit = s.value("historyLimit", kDefaultHistoryLimit).toInt(&ok);
    if (ok && limit >= 1) {
        e.historyLimit = limit;
    } else {
        qWarning() << "[Settings] ignoring historyLimit" << s.value("historyLimit")
                   << "- using" << kDefaultHistoryLimit;
    }

    QString tmpl = s.value("columnNameTemplate", e.columnNameTemplate).toString();
    if (tmpl.contains(QLatin1String("%1")))
        e.columnNameTemplate = tmpl;
    else
        qWarning() << "[Settings] columnNameTemplate lacks %1:" << tmpl;

    e.searchDefaults.caseSensitive = s.value("search/caseSensitive", false).toBool();
    e.searchDefaults.wholeWord     = s.value("search/wholeWord", false).toBool();
    e.searchDefaults.regex         = s.value("search/regex", false).toBool();
    return e;
}

EngineSettings EngineSettings::load() {
    QSettings s("TabulaX", "TabulaX");
    return load(s);
}

void EngineSettings::save(QSettings& s) const {
    s.setValue("historyLimit", historyLimit);
    s.setValue("columnNameTemplate", columnNameTemplate);
    s.setValue("search/caseSensitive", searchDefaults.caseSensitive);
    s.setValue("search/wholeWord", searchDefaults.wholeWord);
    s.setValue("search/regex", searchDefaults.regex);
}

void EngineSettings::save() const {
    QSettings s("TabulaX", "TabulaX");
    save(s);
}

} // namespace tbx

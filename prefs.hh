#pragma once

#include <QString>
#include "types.hxx"

namespace tabwright::prefs {
const QString AppConfigName = QLatin1String("Tabwright");
const QString PrefsFileName = QLatin1String("prefs_");
const QString SessionFileName = QLatin1String("session_");
const u2 PrefsFormatVersion = 1;
const u2 SessionFormatVersion = 1;

QString GetPrefsFileName();
QString GetSessionFileName();
QString QueryAppConfigPath();
}

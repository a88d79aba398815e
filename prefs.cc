#include "prefs.hh"

#include <QStandardPaths>

#include "io/io.hh"

namespace tabwright::prefs {

QString GetPrefsFileName() {
	static const QString s = prefs::PrefsFileName
		+ QString::number(prefs::PrefsFormatVersion);
	return s;
}

QString GetSessionFileName() {
	static const QString s = prefs::SessionFileName
		+ QString::number(prefs::SessionFormatVersion);
	return s;
}

QString QueryAppConfigPath()
{
	static QString dir_path = QString();
	
	if (!dir_path.isEmpty())
		return dir_path;
	
	QString config_path = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
	
	if (!config_path.endsWith('/'))
		config_path.append('/');
	
	if (!io::EnsureDir(config_path, prefs::AppConfigName))
		return QString();
	
	dir_path = config_path + prefs::AppConfigName;
	return dir_path;
}
}

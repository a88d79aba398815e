#include "App.hpp"
#include "prefs.hh"

#include <QApplication>
#include <QStringList>

int main(int argc, char *argv[])
{
	QApplication qapp(argc, argv);
	QApplication::setApplicationName(tabwright::prefs::AppConfigName);
	
	QStringList args = qapp.arguments();
	args.removeFirst();
	auto ls = tabwright::LoadSession::Yes;
	QStringList files;
	for (const QString &next: args) {
		if (next == QLatin1String("--no-session")) {
			ls = tabwright::LoadSession::No;
		} else if (next.startsWith(QLatin1String("--"))) {
			tw_printq("Unknown option: ", next);
		} else {
			files.append(next);
		}
	}
	
	tabwright::App app(ls);
	app.OpenFiles(files);
	app.show();
	
	cint app_status = qapp.exec();
	if (app_status != 0) {
		tw_status(app_status);
	}
	
	return app_status;
}

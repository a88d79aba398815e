#pragma once

#include <QTest>

class PrefsTest: public QObject
{
	Q_OBJECT
	
private Q_SLOTS:
	void missingFileKeepsDefaults();
	void saveAndLoad();
	void settersClamp();
	void unknownTrailingBytesSurvive();
	void sessionRoundTrip();
	void brokenSessionResetsStore();
};

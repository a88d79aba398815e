#pragma once

#include <QTest>

class PayloadTest: public QObject
{
	Q_OBJECT
	
private Q_SLOTS:
	void encodeWritesCamelCaseKeys();
	void decodeValid();
	void decodeRejectsMalformed_data();
	void decodeRejectsMalformed();
};

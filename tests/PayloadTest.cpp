#include "PayloadTest.hpp"

#include "../payload.hh"

#include <QJsonDocument>
#include <QJsonObject>

using namespace tabwright;

void PayloadTest::encodeWritesCamelCaseKeys()
{
	payload::TabPayload p;
	p.pane_id = "pane-3";
	p.tab_index = 4;
	p.file_path = "/src/main.rs";
	p.is_pinned = true;
	
	const QJsonObject obj = QJsonDocument::fromJson(payload::Encode(p)).object();
	QCOMPARE(obj.value("paneId").toString(), QString("pane-3"));
	QCOMPARE(obj.value("tabIndex").toInt(), 4);
	QCOMPARE(obj.value("filePath").toString(), QString("/src/main.rs"));
	QCOMPARE(obj.value("isPinned").toBool(), true);
}

void PayloadTest::decodeValid()
{
	const QByteArray data = R"({"paneId":"pane-1","tabIndex":2,"filePath":"/a.txt"})";
	payload::TabPayload p;
	QVERIFY(payload::Decode(data, p));
	QCOMPARE(p.pane_id, QString("pane-1"));
	QCOMPARE(p.tab_index, 2);
	QCOMPARE(p.file_path, QString("/a.txt"));
	QCOMPARE(p.is_pinned, false);
}

void PayloadTest::decodeRejectsMalformed_data()
{
	QTest::addColumn<QByteArray>("data");
	
	QTest::newRow("empty") << QByteArray();
	QTest::newRow("not json") << QByteArray("pane-1:2");
	QTest::newRow("array") << QByteArray(R"(["pane-1",2])");
	QTest::newRow("missing path") << QByteArray(R"({"paneId":"pane-1","tabIndex":2})");
	QTest::newRow("index as string") << QByteArray(R"({"paneId":"pane-1","tabIndex":"2","filePath":"/a"})");
	QTest::newRow("negative index") << QByteArray(R"({"paneId":"pane-1","tabIndex":-1,"filePath":"/a"})");
	QTest::newRow("empty pane") << QByteArray(R"({"paneId":"","tabIndex":0,"filePath":"/a"})");
}

void PayloadTest::decodeRejectsMalformed()
{
	QFETCH(QByteArray, data);
	
	payload::TabPayload p;
	p.pane_id = "untouched";
	QVERIFY(!payload::Decode(data, p));
	QCOMPARE(p.pane_id, QString("untouched"));
}

QTEST_GUILESS_MAIN(PayloadTest)

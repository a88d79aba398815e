#include "payload.hh"

#include "err.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace tabwright::payload {

const QString KeyPaneId = QLatin1String("paneId");
const QString KeyTabIndex = QLatin1String("tabIndex");
const QString KeyFilePath = QLatin1String("filePath");
const QString KeyIsPinned = QLatin1String("isPinned");

QByteArray Encode(const TabPayload &p)
{
	QJsonObject obj;
	obj.insert(KeyPaneId, p.pane_id);
	obj.insert(KeyTabIndex, p.tab_index);
	obj.insert(KeyFilePath, p.file_path);
	obj.insert(KeyIsPinned, p.is_pinned);
	
	return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool Decode(const QByteArray &data, TabPayload &ret)
{
	if (data.isEmpty())
		return false;
	
	QJsonParseError error;
	const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
	if (error.error != QJsonParseError::NoError) {
		tw_warn("Bad drag payload: %s", qPrintable(error.errorString()));
		return false;
	}
	
	TW_CHECK(doc.isObject());
	const QJsonObject obj = doc.object();
	const QJsonValue pane_id = obj.value(KeyPaneId);
	const QJsonValue tab_index = obj.value(KeyTabIndex);
	const QJsonValue file_path = obj.value(KeyFilePath);
	TW_CHECK(pane_id.isString() && tab_index.isDouble() && file_path.isString());
	
	TabPayload p;
	p.pane_id = pane_id.toString();
	p.tab_index = tab_index.toInt(-1);
	p.file_path = file_path.toString();
	p.is_pinned = obj.value(KeyIsPinned).toBool(false);
	TW_CHECK(p.is_valid());
	
	ret = p;
	return true;
}

}

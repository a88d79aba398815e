#pragma once

#include "decl.hxx"

#include <QByteArray>

namespace tabwright::payload {

const QString MimeType = QLatin1String("application/x-tabwright-tab");

struct TabPayload {
	PaneId pane_id;
	int tab_index = -1;
	QString file_path;
	bool is_pinned = false;
	
	bool is_valid() const { return !pane_id.isEmpty() && tab_index >= 0 && !file_path.isEmpty(); }
};

QByteArray Encode(const TabPayload &p);

/// Returns false on empty or malformed data, @ret is left untouched then.
bool Decode(const QByteArray &data, TabPayload &ret);

}

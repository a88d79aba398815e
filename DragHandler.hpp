#pragma once

#include "decl.hxx"

#include <QByteArray>

namespace tabwright {

/// Where the pointer is during a drag over or a drop onto a strip.
struct DropPointer {
	int x = 0; /// strip coordinates
	QVector<TabBounds> tabs;
	bool topmost = true;
	Modifiers mods = {};
	int window_x = 0;
	int window_width = 0;
};

/// The drag lifecycle of one tab strip, free of any UI toolkit. A strip
/// widget forwards its platform drag events here.
class DragHandler {
public:
	virtual ~DragHandler() {}
	
	/// Fills @payload with the data to attach to the platform drag.
	virtual bool OnDragStart(const int index, QByteArray &payload) = 0;
	/// Returns whether the strip is a valid drop zone at this point.
	virtual bool OnDragOver(const DropPointer &pointer) = 0;
	/// Returns whether a tab action was applied. The session is over
	/// afterwards either way.
	virtual bool OnDrop(const DropPointer &pointer, const QByteArray &payload) = 0;
	virtual void OnDragEnd() = 0;
};

}

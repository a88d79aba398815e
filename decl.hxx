#pragma once

#include "types.hxx"

#include <QString>
#include <QVector>

namespace tabwright {
class App;
class ByteArray;
class DragHandler;
class DragSession;
class Prefs;
class Store;
class StripController;
class TabModel;

using PaneId = QString;

const QString PanePrefix = QLatin1String("pane-");

enum class SplitOrientation: i1 {
	None,
	Horizontal, /// side by side
	Vertical, /// stacked
};

enum class DropMode: i1 {
	None,
	Move,
	Copy,
	Split,
};

enum class From: i1 {
	Start,
	CurrentPosition
};

enum class ExactSize: i1 {
	Yes,
	No
};

enum class PrintErrors: i1 {
	Yes,
	No
};

/// A tab slot in a pane. As a drop target @index is a boundary in
/// [0, tab count], as a drag source it is the tab's position.
struct TabRef {
	PaneId pane_id;
	int index = -1;

	bool is_valid() const { return !pane_id.isEmpty() && index >= 0; }
	bool operator == (const TabRef &rhs) const {
		return pane_id == rhs.pane_id && index == rhs.index;
	}
	bool operator != (const TabRef &rhs) const { return !(*this == rhs); }
	static TabRef Invalid() { return TabRef{}; }
};

struct Modifiers {
	bool ctrl = false;
	bool meta = false;
	bool shift = false;

	bool copy() const { return ctrl || meta; }
	bool split() const { return shift; }
};

/// Horizontal extent of one rendered tab, in strip coordinates.
struct TabBounds {
	int x = 0;
	int width = 0;

	int right() const { return x + width; }
	int mid() const { return x + width / 2; }
};

} // tabwright::

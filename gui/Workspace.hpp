#pragma once

#include <QHash>
#include <QWidget>

#include "decl.hxx"
#include "../decl.hxx"
#include "../err.hpp"

QT_BEGIN_NAMESPACE
class QBoxLayout;
QT_END_NAMESPACE

namespace tabwright::gui {

/// Lays out one PaneView per leaf pane inside nested splitters that
/// follow the pane tree of the Store.
class Workspace: public QWidget {
	Q_OBJECT
public:
	Workspace(Store *store, const Prefs *prefs, QWidget *parent = nullptr);
	virtual ~Workspace();

	PaneView* view(const PaneId &id) const { return views_.value(id, nullptr); }
	const QHash<PaneId, PaneView*>& views() const { return views_; }

public Q_SLOTS:
	void Rebuild();

private:
	NO_ASSIGN_COPY_MOVE(Workspace);

	QWidget* Build(const PaneId &id, QHash<PaneId, PaneView*> &old_views);
	PaneView* CreateView(const PaneId &id);
	QString LayoutSignature(const PaneId &id) const;
	void UpdateHighlight();

	Store *store_ = nullptr;
	const Prefs *prefs_ = nullptr;
	QBoxLayout *layout_ = nullptr;
	QWidget *root_widget_ = nullptr;
	QHash<PaneId, PaneView*> views_;
	QString signature_;
};

}

#pragma once

#include <QWidget>

#include "decl.hxx"
#include "../decl.hxx"
#include "../err.hpp"

QT_BEGIN_NAMESPACE
class QLabel;
QT_END_NAMESPACE

namespace tabwright::gui {

/// One leaf pane: its tab strip above a view of the active file.
class PaneView: public QWidget {
	Q_OBJECT
public:
	PaneView(Store *store, const Prefs *prefs, const PaneId &pane_id, QWidget *parent = nullptr);
	virtual ~PaneView();

	const PaneId& pane_id() const;
	void SetHighlighted(const bool flag);
	TabStrip* strip() const { return strip_; }
	void Sync();

Q_SIGNALS:
	void Activated(const PaneId &pane_id);
	void TabChanged(const PaneId &pane_id, const QString &path);
	void TabCloseRequested(const PaneId &pane_id, const QString &path);

protected:
	virtual bool eventFilter(QObject *obj, QEvent *evt) override;

private:
	NO_ASSIGN_COPY_MOVE(PaneView);

	void CreateGui();

	Store *store_ = nullptr;
	const Prefs *prefs_ = nullptr;
	StripController *controller_ = nullptr;
	TabStrip *strip_ = nullptr;
	QLabel *editor_ = nullptr;
	bool highlighted_ = false;
};

}

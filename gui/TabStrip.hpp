#pragma once

#include <QPixmap>
#include <QPoint>
#include <QTabBar>

#include "decl.hxx"
#include "../decl.hxx"
#include "../DragHandler.hpp"
#include "../err.hpp"

QT_BEGIN_NAMESPACE
class QMimeData;
QT_END_NAMESPACE

namespace tabwright::gui {

/// Tab bar of one pane. Forwards platform drag and drop events to its
/// StripController and paints the drop indicator of the shared drag session.
class TabStrip: public QTabBar {
	Q_OBJECT
public:
	TabStrip(StripController *controller, const Prefs *prefs, QWidget *parent = nullptr);
	virtual ~TabStrip();

	QVector<TabBounds> CollectTabBounds() const;
	StripController* controller() const { return controller_; }
	int IndicatorX(const int boundary) const;
	virtual QSize minimumSizeHint() const override;
	QString path_at(const int index) const;
	virtual QSize sizeHint() const override;
	void SyncFromModel();

Q_SIGNALS:
	void TabChanged(const QString &path);
	void TabCloseRequested(const QString &path);

protected:
	virtual void contextMenuEvent(QContextMenuEvent *evt) override;
	virtual void dragEnterEvent(QDragEnterEvent *evt) override;
	virtual void dragLeaveEvent(QDragLeaveEvent *evt) override;
	virtual void dragMoveEvent(QDragMoveEvent *evt) override;
	virtual void dropEvent(QDropEvent *evt) override;
	virtual void mouseMoveEvent(QMouseEvent *evt) override;
	virtual void mousePressEvent(QMouseEvent *evt) override;
	virtual void mouseReleaseEvent(QMouseEvent *evt) override;
	virtual void paintEvent(QPaintEvent *evt) override;

private:
	NO_ASSIGN_COPY_MOVE(TabStrip);

	bool AcceptsDrag(const QMimeData *md) const;
	DropPointer CreatePointer(const QPointF &pos, const Qt::KeyboardModifiers km) const;
	QPixmap CreateDragPixmap(const int index);
	void CurrentChanged(const int index);
	int EmptyHeight() const;
	void Init();
	void StartDragOperation(const int index);

	StripController *controller_ = nullptr;
	const Prefs *prefs_ = nullptr;
	QPoint drag_start_pos_ = {-1, -1};
	int pressed_index_ = -1;
	bool syncing_ = false;
};

}

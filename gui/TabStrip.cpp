#include "TabStrip.hpp"

#include "../payload.hh"
#include "../Prefs.hpp"
#include "../Store.hpp"
#include "../StripController.hpp"

#include <QApplication>
#include <QContextMenuEvent>
#include <QDrag>
#include <QDragEnterEvent>
#include <QFileInfo>
#include <QMenu>
#include <QMimeData>
#include <QMouseEvent>
#include <QPainter>
#include <QPointer>
#include <QStyle>
#include <QStyleOptionTab>
#include <QStylePainter>

#include <algorithm>

namespace tabwright::gui {

/// #define TABWRIGHT_DEBUG_DRAG

TabStrip::TabStrip(StripController *controller, const Prefs *prefs, QWidget *parent):
QTabBar(parent), controller_(controller), prefs_(prefs)
{
	Init();
}

TabStrip::~TabStrip()
{}

bool TabStrip::AcceptsDrag(const QMimeData *md) const
{
	if (md && md->hasFormat(payload::MimeType))
		return true;

	/// The payload got lost on the way, the session still knows the source.
	return controller_->store()->drag().active();
}

QVector<TabBounds> TabStrip::CollectTabBounds() const
{
	QVector<TabBounds> ret;
	cint n = count();
	for (int i = 0; i < n; i++) {
		const QRect r = tabRect(i);
		ret.append(TabBounds{r.x(), r.width()});
	}

	return ret;
}

void TabStrip::contextMenuEvent(QContextMenuEvent *evt)
{
	cint index = tabAt(evt->pos());
	const QString path = path_at(index);
	if (path.isEmpty())
		return;

	Store *store = controller_->store();
	const PaneId pane_id = controller_->pane_id();
	const Pane *p = controller_->pane();
	const bool pinned = p && p->tabs.is_valid_index(index) && p->tabs.at(index).pinned;
	const bool can_split = count() > 1;
	const TabRef ref {pane_id, index};

	QMenu *menu = new QMenu(this);
	menu->setAttribute(Qt::WA_DeleteOnClose);
	QAction *action = menu->addAction(pinned ? tr("Unpin") : tr("Pin"));
	connect(action, &QAction::triggered, [=] {
		store->Dispatch(Action::NewTogglePin(pane_id, path));
	});

	action = menu->addAction(tr("Split Right"));
	action->setEnabled(can_split);
	connect(action, &QAction::triggered, [=] {
		store->Dispatch(Action::NewTabTransfer(ActionType::SplitWithTab, ref, ref,
			SplitOrientation::Horizontal));
	});

	action = menu->addAction(tr("Split Down"));
	action->setEnabled(can_split);
	connect(action, &QAction::triggered, [=] {
		store->Dispatch(Action::NewTabTransfer(ActionType::SplitWithTab, ref, ref,
			SplitOrientation::Vertical));
	});

	menu->addSeparator();
	action = menu->addAction(tr("Close"));
	connect(action, &QAction::triggered, [=] {
		emit TabCloseRequested(path);
	});

	menu->popup(evt->globalPos());
}

DropPointer TabStrip::CreatePointer(const QPointF &pos, const Qt::KeyboardModifiers km) const
{
	DropPointer ret;
	const QPoint pt = pos.toPoint();
	ret.x = pt.x();
	ret.tabs = CollectTabBounds();
	ret.topmost = rect().contains(pt);
	ret.mods.ctrl = km.testFlag(Qt::ControlModifier);
	ret.mods.meta = km.testFlag(Qt::MetaModifier);
	ret.mods.shift = km.testFlag(Qt::ShiftModifier);

	const QWidget *win = window();
	ret.window_x = mapTo(win, pt).x();
	ret.window_width = win->width();

	return ret;
}

QPixmap TabStrip::CreateDragPixmap(const int index)
{
	const QRect r = tabRect(index);
	const QPixmap tab_image = grab(r);
	QPixmap pixmap(tab_image.size());
	pixmap.setDevicePixelRatio(tab_image.devicePixelRatio());
	pixmap.fill(Qt::transparent);

	QPainter painter(&pixmap);
	painter.setOpacity(prefs_->drag_preview_opacity());
	painter.drawPixmap(0, 0, tab_image);

	return pixmap;
}

void TabStrip::CurrentChanged(const int index)
{
	if (syncing_)
		return;

	const QString path = path_at(index);
	if (!path.isEmpty())
		emit TabChanged(path);
}

void TabStrip::dragEnterEvent(QDragEnterEvent *evt)
{
	if (!AcceptsDrag(evt->mimeData())) {
		evt->ignore();
		return;
	}

	controller_->OnDragOver(CreatePointer(evt->position(), evt->modifiers()));
	evt->acceptProposedAction();
	update();
}

void TabStrip::dragLeaveEvent(QDragLeaveEvent *evt)
{
	Q_UNUSED(evt);
	controller_->OnDragLeave();
	update();
}

void TabStrip::dragMoveEvent(QDragMoveEvent *evt)
{
	if (!AcceptsDrag(evt->mimeData())) {
		evt->ignore();
		return;
	}

	const DropPointer pointer = CreatePointer(evt->position(), evt->modifiers());
	if (!controller_->OnDragOver(pointer)) {
		evt->ignore();
		update();
		return;
	}

	if (pointer.mods.copy() && (evt->possibleActions() & Qt::CopyAction)) {
		evt->setDropAction(Qt::CopyAction);
		evt->accept();
	} else {
		evt->acceptProposedAction();
	}
	update();
}

void TabStrip::dropEvent(QDropEvent *evt)
{
	const QMimeData *md = evt->mimeData();
	const QByteArray data = md ? md->data(payload::MimeType) : QByteArray();
	const DropPointer pointer = CreatePointer(evt->position(), evt->modifiers());
#ifdef TABWRIGHT_DEBUG_DRAG
	tw_info("drop at x=%d on %s", pointer.x, qPrintable(controller_->pane_id()));
#endif
	controller_->OnDrop(pointer, data);
	evt->acceptProposedAction();
	update();
}

/// Height of a single tab, kept while the strip has no tabs so that it
/// stays a drop target.
int TabStrip::EmptyHeight() const
{
	QStyleOptionTab opt;
	opt.initFrom(this);
	opt.shape = shape();
	opt.text = QStringLiteral("X");
	cint vspace = style()->pixelMetric(QStyle::PM_TabBarTabVSpace, &opt, this);
	const QSize sz(0, fontMetrics().height() + vspace);
	return style()->sizeFromContents(QStyle::CT_TabBarTab, &opt, sz, this).height();
}

int TabStrip::IndicatorX(const int boundary) const
{
	cint n = count();
	if (n == 0 || boundary <= 0)
		return (n == 0) ? 0 : tabRect(0).left();

	if (boundary >= n)
		return tabRect(n - 1).right() + 1;

	return tabRect(boundary).left();
}

void TabStrip::Init()
{
	setAcceptDrops(true);
	setMovable(false);
	setTabsClosable(true);
	setExpanding(false);
	setElideMode(Qt::ElideMiddle);
	setDocumentMode(true);
	setUsesScrollButtons(true);

	connect(this, &QTabBar::currentChanged, this, &TabStrip::CurrentChanged);
	connect(this, &QTabBar::tabCloseRequested, this, [=](int index) {
		const QString path = path_at(index);
		if (!path.isEmpty())
			emit TabCloseRequested(path);
	});
}

QSize TabStrip::minimumSizeHint() const
{
	const QSize sz = QTabBar::minimumSizeHint();
	if (count() > 0)
		return sz;

	return QSize(sz.width(), std::max(sz.height(), EmptyHeight()));
}

void TabStrip::mouseMoveEvent(QMouseEvent *evt)
{
	const QPoint pos = evt->position().toPoint();
	if ((evt->buttons() & Qt::LeftButton) && pressed_index_ != -1
		&& drag_start_pos_.x() >= 0)
	{
		cint diff = (pos - drag_start_pos_).manhattanLength();
		if (diff >= QApplication::startDragDistance()) {
			cint index = pressed_index_;
			pressed_index_ = -1;
			StartDragOperation(index);
			return;
		}
	}

	QTabBar::mouseMoveEvent(evt);
}

void TabStrip::mousePressEvent(QMouseEvent *evt)
{
	const QPoint pos = evt->position().toPoint();
	if (evt->button() == Qt::MiddleButton) {
		const QString path = path_at(tabAt(pos));
		if (!path.isEmpty())
			emit TabCloseRequested(path);
		return;
	}

	if (evt->button() == Qt::LeftButton) {
		drag_start_pos_ = pos;
		pressed_index_ = tabAt(pos);
	}

	QTabBar::mousePressEvent(evt);
}

void TabStrip::mouseReleaseEvent(QMouseEvent *evt)
{
	drag_start_pos_ = {-1, -1};
	pressed_index_ = -1;
	QTabBar::mouseReleaseEvent(evt);
}

void TabStrip::paintEvent(QPaintEvent *evt)
{
	QTabBar::paintEvent(evt);

	const DragSession &session = controller_->store()->drag();
	if (!session.active())
		return;

	QStylePainter painter(this);
	const QBrush bg = palette().brush(QPalette::Window);
	cint n = count();
	for (int i = 0; i < n; i++) {
		if (!controller_->is_dimmed(i))
			continue;
		/// Repaint the tab over a clean background at the lower opacity.
		QStyleOptionTab opt;
		initStyleOption(&opt, i);
		painter.setOpacity(1.0);
		painter.fillRect(opt.rect, bg);
		painter.setOpacity(prefs_->dimmed_tab_opacity());
		painter.drawControl(QStyle::CE_TabBarTab, opt);
	}
	painter.setOpacity(1.0);

	cint boundary = controller_->indicator_index();
	if (boundary == -1)
		return;

	cint w = prefs_->drop_indicator_width();
	cint x = std::max(0, std::min(IndicatorX(boundary) - w / 2, width() - w));
	painter.fillRect(QRect(x, 0, w, height()), palette().color(QPalette::Highlight));
}

QString TabStrip::path_at(const int index) const
{
	if (index < 0 || index >= count())
		return QString();

	return tabData(index).toString();
}

QSize TabStrip::sizeHint() const
{
	const QSize sz = QTabBar::sizeHint();
	if (count() > 0)
		return sz;

	return QSize(sz.width(), std::max(sz.height(), EmptyHeight()));
}

void TabStrip::StartDragOperation(const int index)
{
	QByteArray data;
	if (!controller_->OnDragStart(index, data))
		return;

	QMimeData *mimedata = new QMimeData();
	mimedata->setData(payload::MimeType, data);
	mimedata->setText(path_at(index));

	QDrag *drag = new QDrag(this);
	drag->setMimeData(mimedata);
	if (prefs_->show_drag_preview()) {
		drag->setPixmap(CreateDragPixmap(index));
		drag->setHotSpot(drag_start_pos_ - tabRect(index).topLeft());
	}
	update();

	/// A drop may rebuild the panes while exec() is still running.
	QPointer<TabStrip> self(this);
	Store *store = controller_->store();
	drag->exec(Qt::MoveAction | Qt::CopyAction, Qt::MoveAction);

	if (self) {
		self->controller_->OnDragEnd();
		self->drag_start_pos_ = {-1, -1};
		self->update();
	} else {
		store->Dispatch(Action::New(ActionType::EndDrag));
	}
}

void TabStrip::SyncFromModel()
{
	const Pane *p = controller_->pane();
	syncing_ = true;

	while (count() > 0)
		removeTab(count() - 1);

	if (p) {
		const auto &items = p->tabs.items();
		cint n = items.size();
		for (int i = 0; i < n; i++) {
			const TabItem &item = items[i];
			QString name = QFileInfo(item.path).fileName();
			if (name.isEmpty())
				name = item.path;
			cint index = addTab(name);
			setTabData(index, item.path);
			setTabToolTip(index, item.path);
			QWidget *close_btn = tabButton(index, QTabBar::RightSide);
			if (!close_btn)
				close_btn = tabButton(index, QTabBar::LeftSide);
			if (close_btn)
				close_btn->setVisible(!item.pinned);
			if (item.pinned)
				setTabText(index, QString::fromUtf8("\xF0\x9F\x93\x8C ") + name);
		}

		cint active = p->tabs.active_index();
		if (active != -1)
			setCurrentIndex(active);
	}

	syncing_ = false;
	update();
}

}

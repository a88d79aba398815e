#include "Workspace.hpp"

#include "PaneView.hpp"
#include "../Store.hpp"

#include <QBoxLayout>
#include <QSplitter>

namespace tabwright::gui {

/// #define TABWRIGHT_DEBUG_LAYOUT

Workspace::Workspace(Store *store, const Prefs *prefs, QWidget *parent):
QWidget(parent), store_(store), prefs_(prefs)
{
	layout_ = new QBoxLayout(QBoxLayout::TopToBottom);
	layout_->setContentsMargins(0, 0, 0, 0);
	setLayout(layout_);

	/// Queued: a drop dispatches from inside the source strip's event handler.
	connect(store_, &Store::PanesChanged, this, &Workspace::Rebuild,
		Qt::QueuedConnection);
	Rebuild();
}

Workspace::~Workspace()
{}

QWidget* Workspace::Build(const PaneId &id, QHash<PaneId, PaneView*> &old_views)
{
	const Pane *p = store_->pane(id);
	TW_CHECK_ARG(p, nullptr);

	if (p->is_leaf()) {
		PaneView *view = old_views.take(id);
		if (view == nullptr)
			view = CreateView(id);
		views_.insert(id, view);
		view->Sync();
		return view;
	}

	const auto o = (p->split == SplitOrientation::Vertical) ? Qt::Vertical : Qt::Horizontal;
	QSplitter *splitter = new QSplitter(o);
	splitter->setChildrenCollapsible(false);
	for (const PaneId &child_id: p->children) {
		QWidget *w = Build(child_id, old_views);
		if (w)
			splitter->addWidget(w);
	}

	return splitter;
}

PaneView* Workspace::CreateView(const PaneId &id)
{
	PaneView *view = new PaneView(store_, prefs_, id);
	connect(view, &PaneView::Activated, this, [=](const PaneId &pane_id) {
		store_->Dispatch(Action::NewSetActivePane(pane_id));
	});
	connect(view, &PaneView::TabChanged, this, [=](const PaneId &pane_id, const QString &path) {
		store_->Dispatch(Action::NewOpenFile(pane_id, path));
	});
	connect(view, &PaneView::TabCloseRequested, this, [=](const PaneId &pane_id, const QString &path) {
		store_->Dispatch(Action::NewCloseFile(pane_id, path));
	});

	return view;
}

QString Workspace::LayoutSignature(const PaneId &id) const
{
	const Pane *p = store_->pane(id);
	if (!p)
		return QString();

	if (p->is_leaf())
		return id;

	QString s = (p->split == SplitOrientation::Vertical) ? QLatin1String("v(")
		: QLatin1String("h(");
	for (const PaneId &child_id: p->children) {
		s.append(LayoutSignature(child_id));
		s.append(',');
	}
	s.append(')');

	return s;
}

void Workspace::Rebuild()
{
	const QString signature = LayoutSignature(store_->root_pane_id());
	if (signature == signature_ && root_widget_ != nullptr) {
		for (PaneView *view: views_)
			view->Sync();
		UpdateHighlight();
		return;
	}

#ifdef TABWRIGHT_DEBUG_LAYOUT
	tw_info("layout %s -> %s", qPrintable(signature_), qPrintable(signature));
#endif
	signature_ = signature;
	QHash<PaneId, PaneView*> old_views = views_;
	views_.clear();

	QWidget *old_root = root_widget_;
	if (old_root)
		layout_->removeWidget(old_root);

	root_widget_ = Build(store_->root_pane_id(), old_views);
	if (root_widget_) {
		layout_->addWidget(root_widget_);
		root_widget_->show();
	}

	if (old_root && qobject_cast<PaneView*>(old_root) == nullptr)
		old_root->deleteLater();

	for (PaneView *view: old_views) {
		view->hide();
		view->setParent(nullptr);
		view->deleteLater();
	}

	UpdateHighlight();
}

void Workspace::UpdateHighlight()
{
	const bool several = views_.size() > 1;
	const PaneId &active = store_->active_pane_id();
	for (auto it = views_.cbegin(); it != views_.cend(); ++it)
		it.value()->SetHighlighted(several && it.key() == active);
}

}

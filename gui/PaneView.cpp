#include "PaneView.hpp"

#include "TabStrip.hpp"
#include "../Store.hpp"
#include "../StripController.hpp"

#include <QBoxLayout>
#include <QEvent>
#include <QLabel>

namespace tabwright::gui {

PaneView::PaneView(Store *store, const Prefs *prefs, const PaneId &pane_id,
	QWidget *parent): QWidget(parent), store_(store), prefs_(prefs)
{
	controller_ = new StripController(store_, pane_id);
	CreateGui();
	connect(store_, &Store::DragChanged, strip_, QOverload<>::of(&QWidget::update));
	Sync();
}

PaneView::~PaneView()
{
	delete strip_;
	strip_ = nullptr;
	delete controller_;
	controller_ = nullptr;
}

void PaneView::CreateGui()
{
	QBoxLayout *layout = new QBoxLayout(QBoxLayout::TopToBottom);
	layout->setContentsMargins(0, 0, 0, 0);
	layout->setSpacing(0);
	setLayout(layout);

	strip_ = new TabStrip(controller_, prefs_);
	layout->addWidget(strip_);

	editor_ = new QLabel();
	editor_->setAlignment(Qt::AlignCenter);
	editor_->setTextInteractionFlags(Qt::TextSelectableByMouse);
	editor_->setAutoFillBackground(true);
	editor_->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
	layout->addWidget(editor_, 1);

	strip_->installEventFilter(this);
	editor_->installEventFilter(this);

	const PaneId id = controller_->pane_id();
	connect(strip_, &TabStrip::TabChanged, this, [=](const QString &path) {
		emit TabChanged(id, path);
	});
	connect(strip_, &TabStrip::TabCloseRequested, this, [=](const QString &path) {
		emit TabCloseRequested(id, path);
	});
}

bool PaneView::eventFilter(QObject *obj, QEvent *evt)
{
	if (evt->type() == QEvent::MouseButtonPress && !highlighted_)
		emit Activated(controller_->pane_id());

	return QWidget::eventFilter(obj, evt);
}

const PaneId& PaneView::pane_id() const { return controller_->pane_id(); }

void PaneView::SetHighlighted(const bool flag)
{
	highlighted_ = flag;
	QPalette pal = editor_->palette();
	const QPalette def = palette();
	pal.setColor(QPalette::Window, flag ? def.color(QPalette::Base)
		: def.color(QPalette::Window));
	editor_->setPalette(pal);
}

void PaneView::Sync()
{
	strip_->SyncFromModel();
	const Pane *p = controller_->pane();
	const QString path = p ? p->tabs.active_path() : QString();
	editor_->setText(path.isEmpty() ? tr("No file open") : path);
}

}

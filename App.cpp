#include "App.hpp"

#include "Prefs.hpp"
#include "Store.hpp"
#include "gui/PrefsPane.hpp"
#include "gui/Workspace.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>

namespace tabwright {

App::App(const LoadSession ls)
{
	Init(ls);
}

App::~App()
{
	SaveState();
	
	for (auto *shortcut: shortcuts_)
		delete shortcut;
	shortcuts_.clear();
	
	/// workspace_'s views hold pointers into store_ and prefs_
	delete workspace_;
	workspace_ = nullptr;
	delete store_;
	store_ = nullptr;
	delete prefs_;
	prefs_ = nullptr;
}

void App::CloseActiveTab()
{
	const PaneId &id = store_->active_pane_id();
	const Pane *p = store_->leaf(id);
	if (!p || p->tabs.active_path().isEmpty())
		return;
	
	store_->Dispatch(Action::NewCloseFile(id, p->tabs.active_path()));
}

void App::closeEvent(QCloseEvent *evt)
{
	SaveState();
	QMainWindow::closeEvent(evt);
}

void App::CreateGui()
{
	workspace_ = new gui::Workspace(store_, prefs_);
	setCentralWidget(workspace_);
	connect(store_, &Store::PanesChanged, this, &App::UpdateWindowTitle);
	UpdateWindowTitle();
}

void App::Init(const LoadSession ls)
{
	prefs_ = new Prefs();
	if (!prefs_->Load())
		tw_info("Using default prefs");
	
	store_ = new Store();
	if (ls == LoadSession::Yes && prefs_->restore_session()) {
		if (!prefs_->LoadSession(*store_))
			store_->Reset();
	}
	
	CreateGui();
	
	QSize sz(gui::DefaultWindowWidth, gui::DefaultWindowHeight);
	if (prefs_->remember_window_size()) {
		const QSize saved = prefs_->window_size();
		if (saved.width() > 5 && saved.height() > 5)
			sz = saved;
	}
	resize(sz);
	
	RegisterShortcuts();
}

void App::OpenFileDialog()
{
	const Pane *p = store_->leaf(store_->active_pane_id());
	QString dir = QDir::homePath();
	if (p && !p->tabs.active_path().isEmpty())
		dir = QFileInfo(p->tabs.active_path()).absolutePath();
	
	const QStringList paths = QFileDialog::getOpenFileNames(this, tr("Open Files"), dir);
	OpenFiles(paths);
}

void App::OpenFiles(const QStringList &paths)
{
	for (const QString &next: paths) {
		const QString full_path = QFileInfo(next).absoluteFilePath();
		if (!store_->Dispatch(Action::NewOpenFile(QString(), full_path)))
			tw_printq("Already open: ", full_path);
	}
}

QShortcut* App::Register(const QKeySequence ks)
{
	auto *sp = new QShortcut(ks, this);
	sp->setContext(Qt::ApplicationShortcut);
	shortcuts_.append(sp);
	return sp;
}

void App::RegisterShortcuts()
{
	QShortcut *sp;
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::Key_O));
		connect(sp, &QShortcut::activated, this, &App::OpenFileDialog);
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::Key_W));
		connect(sp, &QShortcut::activated, this, &App::CloseActiveTab);
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_P));
		connect(sp, &QShortcut::activated, this, &App::ToggleActivePin);
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::Key_Backslash));
		connect(sp, &QShortcut::activated, [=] {
			SplitActivePane(SplitOrientation::Horizontal);
		});
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_Backslash));
		connect(sp, &QShortcut::activated, [=] {
			SplitActivePane(SplitOrientation::Vertical);
		});
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::Key_Comma));
		connect(sp, &QShortcut::activated, this, &App::ShowPrefs);
	}
	{
		sp = Register(QKeySequence(Qt::CTRL | Qt::Key_Q));
		connect(sp, &QShortcut::activated, [=] {
			QApplication::quit();
		});
	}
}

void App::SaveState()
{
	if (state_saved_ || !prefs_ || !store_)
		return;
	state_saved_ = true;
	
	if (prefs_->remember_window_size())
		prefs_->window_size(size());
	
	if (!prefs_->Save())
		tw_warn("Failed to save prefs");
	
	if (prefs_->restore_session() && !prefs_->SaveSession(*store_))
		tw_warn("Failed to save session");
}

void App::ShowPrefs()
{
	gui::PrefsPane pane(this);
	pane.exec();
}

void App::SplitActivePane(const SplitOrientation o)
{
	store_->Dispatch(Action::NewSplitPane(store_->active_pane_id(), o));
}

void App::ToggleActivePin()
{
	const PaneId &id = store_->active_pane_id();
	const Pane *p = store_->leaf(id);
	if (!p || p->tabs.active_path().isEmpty())
		return;
	
	store_->Dispatch(Action::NewTogglePin(id, p->tabs.active_path()));
}

void App::UpdateWindowTitle()
{
	const Pane *p = store_->leaf(store_->active_pane_id());
	const QString path = p ? p->tabs.active_path() : QString();
	if (path.isEmpty())
		setWindowTitle(prefs::AppConfigName);
	else
		setWindowTitle(QFileInfo(path).fileName() + QLatin1String(" - ") + prefs::AppConfigName);
}

}

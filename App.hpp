#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "gui/decl.hxx"

#include <QMainWindow>
#include <QShortcut>
#include <QStringList>

namespace tabwright {

enum class LoadSession: i1 {
	No,
	Yes
};

class App : public QMainWindow {
	Q_OBJECT
public:
	App(const LoadSession ls = LoadSession::Yes);
	virtual ~App();
	
	void CloseActiveTab();
	void OpenFileDialog();
	void OpenFiles(const QStringList &paths);
	Prefs& prefs() { return *prefs_; }
	void SaveState();
	void ShowPrefs();
	void SplitActivePane(const SplitOrientation o);
	Store* store() const { return store_; }
	void ToggleActivePin();
	gui::Workspace* workspace() const { return workspace_; }
	
protected:
	virtual void closeEvent(QCloseEvent *evt) override;
	
private:
	NO_ASSIGN_COPY_MOVE(App);
	
	void CreateGui();
	void Init(const LoadSession ls);
	inline QShortcut* Register(const QKeySequence ks);
	void RegisterShortcuts();
	void UpdateWindowTitle();
	
	QVector<QShortcut*> shortcuts_;
	Prefs *prefs_ = nullptr;
	Store *store_ = nullptr;
	gui::Workspace *workspace_ = nullptr;
	bool state_saved_ = false;
};
}

#pragma once

#include <QCheckBox>
#include <QDialog>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QSpinBox>

#include "../decl.hxx"
#include "decl.hxx"
#include "../err.hpp"

namespace tabwright::gui {

class PrefsPane: public QDialog {
public:
	PrefsPane(App *app);
	virtual ~PrefsPane();

private:
	NO_ASSIGN_COPY_MOVE(PrefsPane);
	
	void ApplyToWidgets(const Prefs &prefs);
	void ButtonClicked(QAbstractButton *button);
	void CreateGui();
	void SavePrefs();
	
	App *app_ = nullptr;
	
	QDialogButtonBox *button_box_ = nullptr;
	
	QCheckBox *restore_session_ = nullptr;
	QCheckBox *show_drag_preview_ = nullptr;
	QCheckBox *remember_window_size_ = nullptr;
	QDoubleSpinBox *drag_preview_opacity_ = nullptr;
	QDoubleSpinBox *dimmed_tab_opacity_ = nullptr;
	QSpinBox *drop_indicator_width_ = nullptr;
};
}

#include "PrefsPane.hpp"

#include "../App.hpp"
#include "../Prefs.hpp"

#include <QBoxLayout>
#include <QFormLayout>
#include <QPushButton>

namespace tabwright::gui {

PrefsPane::PrefsPane(App *app): QDialog(app), app_(app)
{
	CreateGui();
	setWindowTitle(tr("Preferences"));
	setModal(true);
}

PrefsPane::~PrefsPane()
{
	delete button_box_;
	delete restore_session_;
	delete show_drag_preview_;
	delete remember_window_size_;
	delete drag_preview_opacity_;
	delete dimmed_tab_opacity_;
	delete drop_indicator_width_;
}

void PrefsPane::ApplyToWidgets(const Prefs &prefs)
{
	restore_session_->setCheckState(prefs.restore_session() ? Qt::Checked : Qt::Unchecked);
	show_drag_preview_->setCheckState(prefs.show_drag_preview() ? Qt::Checked : Qt::Unchecked);
	remember_window_size_->setCheckState(prefs.remember_window_size() ? Qt::Checked : Qt::Unchecked);
	drag_preview_opacity_->setValue(prefs.drag_preview_opacity());
	dimmed_tab_opacity_->setValue(prefs.dimmed_tab_opacity());
	drop_indicator_width_->setValue(prefs.drop_indicator_width());
}

void PrefsPane::ButtonClicked(QAbstractButton *btn)
{
	if (btn == button_box_->button(QDialogButtonBox::RestoreDefaults)) {
		ApplyToWidgets(app_->prefs().Defaults());
	} else if (btn == button_box_->button(QDialogButtonBox::Cancel)) {
		reject();
	} else if (btn == button_box_->button(QDialogButtonBox::Ok)) {
		SavePrefs();
		accept();
	}
}

void PrefsPane::CreateGui()
{
	QBoxLayout *vert_layout = new QBoxLayout(QBoxLayout::TopToBottom);
	setLayout(vert_layout);
	
	restore_session_ = new QCheckBox(tr("Reopen tabs and panes from the last session"));
	vert_layout->addWidget(restore_session_);
	
	show_drag_preview_ = new QCheckBox(tr("Show a preview of the tab being dragged"));
	vert_layout->addWidget(show_drag_preview_);
	
	remember_window_size_ = new QCheckBox(tr("Remember window size"));
	vert_layout->addWidget(remember_window_size_);
	
	QFormLayout *form = new QFormLayout();
	vert_layout->addLayout(form);
	
	drag_preview_opacity_ = new QDoubleSpinBox();
	drag_preview_opacity_->setRange(0.1, 1.0);
	drag_preview_opacity_->setSingleStep(0.05);
	form->addRow(tr("Drag preview opacity:"), drag_preview_opacity_);
	
	dimmed_tab_opacity_ = new QDoubleSpinBox();
	dimmed_tab_opacity_->setRange(0.1, 1.0);
	dimmed_tab_opacity_->setSingleStep(0.05);
	dimmed_tab_opacity_->setToolTip(tr("Opacity of the dragged tab and of the tab under the drop indicator"));
	form->addRow(tr("Dimmed tab opacity:"), dimmed_tab_opacity_);
	
	drop_indicator_width_ = new QSpinBox();
	drop_indicator_width_->setRange(1, 8);
	drop_indicator_width_->setSuffix(QLatin1String(" px"));
	form->addRow(tr("Drop indicator width:"), drop_indicator_width_);
	
	button_box_ = new QDialogButtonBox (QDialogButtonBox::Ok
		| QDialogButtonBox::RestoreDefaults | QDialogButtonBox::Cancel);
	connect(button_box_, &QDialogButtonBox::clicked, this, &PrefsPane::ButtonClicked);
	vert_layout->addWidget(button_box_);
	
	ApplyToWidgets(app_->prefs());
	
	resize(480, 260);
}

void PrefsPane::SavePrefs()
{
	Prefs &prefs = app_->prefs();
	prefs.restore_session(restore_session_->checkState() == Qt::Checked);
	prefs.show_drag_preview(show_drag_preview_->checkState() == Qt::Checked);
	prefs.remember_window_size(remember_window_size_->checkState() == Qt::Checked);
	prefs.drag_preview_opacity(drag_preview_opacity_->value());
	prefs.dimmed_tab_opacity(dimmed_tab_opacity_->value());
	prefs.drop_indicator_width(drop_indicator_width_->value());
	if (!prefs.Save())
		tw_warn("Failed to save prefs");
	
	app_->update();
}

}

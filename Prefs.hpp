#pragma once

#include "decl.hxx"
#include "prefs.hh"
#include "ByteArray.hpp"

#include <QSize>

#include <algorithm>

namespace tabwright {

class Prefs {
	static const u8 RestoreSession = 1u << 0;
	static const u8 ShowDragPreview = 1u << 1;
	static const u8 RememberWindowSize = 1u << 2;
public:
	/// Files go to @config_dir, or to the user's config dir when empty.
	Prefs(const QString &config_dir = QString());
	virtual ~Prefs();

	Prefs Defaults() const { return Prefs(config_dir_); }

	bool Load();
	bool Save() const;
	bool LoadSession(Store &store) const;
	bool SaveSession(const Store &store) const;

	inline void toggle_bool(const bool b, cu8 flag) {
		if (b)
			bool_ |= flag;
		else
			bool_ &= ~flag;
	}

	bool remember_window_size() const { return bool_ & RememberWindowSize; }
	void remember_window_size(bool b) { toggle_bool(b, RememberWindowSize); }

	bool restore_session() const { return bool_ & RestoreSession; }
	void restore_session(bool b) { toggle_bool(b, RestoreSession); }

	bool show_drag_preview() const { return bool_ & ShowDragPreview; }
	void show_drag_preview(bool b) { toggle_bool(b, ShowDragPreview); }

	f4 drag_preview_opacity() const { return drag_preview_opacity_; }
	void drag_preview_opacity(cf4 n) { drag_preview_opacity_ = std::clamp(n, 0.1f, 1.0f); }

	f4 dimmed_tab_opacity() const { return dimmed_tab_opacity_; }
	void dimmed_tab_opacity(cf4 n) { dimmed_tab_opacity_ = std::clamp(n, 0.1f, 1.0f); }

	i2 drop_indicator_width() const { return drop_indicator_width_; }
	void drop_indicator_width(ci2 n) { drop_indicator_width_ = std::clamp<i2>(n, 1, 8); }

	QSize window_size() const { return QSize(win_w_, win_h_); }
	void window_size(const QSize &sz) { win_w_ = sz.width(); win_h_ = sz.height(); }

private:
	QString config_path() const;

	u8 bool_ = RestoreSession | ShowDragPreview | RememberWindowSize;
	f4 drag_preview_opacity_ = 0.7f;
	f4 dimmed_tab_opacity_ = 0.4f;
	i2 drop_indicator_width_ = 2;
	i4 win_w_ = -1, win_h_ = -1;
	ByteArray left_bytes_;
	QString config_dir_;
};

}

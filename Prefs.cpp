#include "Prefs.hpp"

#include "io/io.hh"
#include "io/SaveFile.hpp"
#include "Store.hpp"

namespace tabwright {

Prefs::Prefs(const QString &config_dir): config_dir_(config_dir) {}

Prefs::~Prefs() {}

QString Prefs::config_path() const
{
	return config_dir_.isEmpty() ? prefs::QueryAppConfigPath() : config_dir_;
}

bool Prefs::Load()
{
	const QString full_path = config_path() + '/' + prefs::GetPrefsFileName();
	if (!io::FileExists(full_path))
		return false; /// first run, defaults stay
	
	io::ReadParams read_params = {};
	read_params.print_errors = PrintErrors::Yes;
	ByteArray buf;
	TW_CHECK(io::ReadFile(full_path, buf, read_params));
	TW_CHECK(buf.has_more(sizeof(u2)));
	
	cu2 version = buf.next_u2();
	TW_CHECK(version == prefs::PrefsFormatVersion);
	bool_ = buf.next_u8();
	drag_preview_opacity(buf.next_f4());
	dimmed_tab_opacity(buf.next_f4());
	drop_indicator_width(buf.next_i2());
	win_w_ = buf.next_i4();
	win_h_ = buf.next_i4();
	
	// ABI: this line must be the last one to save unknown data to @left_bytes
	// so that adding fields doesn't need a format version bump.
	left_bytes_.Clear();
	left_bytes_.add(&buf, From::CurrentPosition);
	
	return true;
}

bool Prefs::LoadSession(Store &store) const
{
	const QString full_path = config_path() + '/' + prefs::GetSessionFileName();
	if (!io::FileExists(full_path))
		return false;
	
	io::ReadParams read_params = {};
	ByteArray buf;
	TW_CHECK(io::ReadFile(full_path, buf, read_params));
	TW_CHECK(buf.has_more(sizeof(u2)));
	TW_CHECK(buf.next_u2() == prefs::SessionFormatVersion);
	
	if (!store.Deserialize(buf)) {
		tw_warn("Discarding broken session file %s", qPrintable(full_path));
		store.Reset();
		return false;
	}
	
	return true;
}

bool Prefs::Save() const
{
	const QString parent_dir = config_path();
	TW_CHECK(!parent_dir.isEmpty());
	
	io::SaveFile save_file(parent_dir, prefs::GetPrefsFileName());
	
	ByteArray buf;
	buf.add_u2(prefs::PrefsFormatVersion);
	buf.add_u8(bool_);
	buf.add_f4(drag_preview_opacity_);
	buf.add_f4(dimmed_tab_opacity_);
	buf.add_i2(drop_indicator_width_);
	buf.add_i4(win_w_);
	buf.add_i4(win_h_);
	
	// ABI: this line must be the last one to add data to @buf
	buf.add(&left_bytes_, From::Start);
	
	const int status = io::WriteToFile(save_file.GetPathToWorkWith(), buf.data(), buf.size());
	if (status != 0) {
		tw_status(status);
		save_file.CommitCancelled();
		return false;
	}
	
	return save_file.Commit();
}

bool Prefs::SaveSession(const Store &store) const
{
	const QString parent_dir = config_path();
	TW_CHECK(!parent_dir.isEmpty());
	
	io::SaveFile save_file(parent_dir, prefs::GetSessionFileName());
	ByteArray buf;
	buf.add_u2(prefs::SessionFormatVersion);
	store.Serialize(buf);
	
	const int status = io::WriteToFile(save_file.GetPathToWorkWith(), buf.data(), buf.size());
	if (status != 0) {
		tw_status(status);
		save_file.CommitCancelled();
		return false;
	}
	
	return save_file.Commit();
}

}

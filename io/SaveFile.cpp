#include "SaveFile.hpp"

#include "io.hh"

#include <fcntl.h>
#include <sys/stat.h>

namespace tabwright::io {

SaveFile::SaveFile(const QString &dir_path, const QString &filename)
{
	original_path_ = dir_path;
	if (!original_path_.endsWith('/'))
		original_path_.append('/');
	original_path_.append(filename);
}

SaveFile::SaveFile(const QString &full_path) :
original_path_(full_path)
{}

SaveFile::~SaveFile()
{
	if (!commit_cancelled_ && !committed_) {
		tw_warn("You forgot to commit(): %s", qPrintable(original_path_));
	}
}

bool SaveFile::Commit(const PrintErrors pe)
{
	committed_ = true;

	if (temp_path_.isEmpty() && !InitTempPath())
	{
		if (pe == PrintErrors::Yes)
			tw_warn("InitTempPath() failed");
		return false;
	}

	auto new_ba = original_path_.toLocal8Bit();
	auto old_ba = temp_path_.toLocal8Bit();

	if (::rename(old_ba.data(), new_ba.data()) == 0)
		return true;

	if (pe == PrintErrors::Yes)
		tw_status(errno);

	return false;
}

const QString& SaveFile::GetPathToWorkWith()
{
	if (!InitTempPath())
		temp_path_.clear();

	return temp_path_;
}

bool SaveFile::InitTempPath()
{
	mode_t mode = io::FilePermissions;
	struct statx stx;
	const auto flags = AT_SYMLINK_NOFOLLOW;
	const auto fields = STATX_MODE;
	auto source_ba = original_path_.toLocal8Bit();
	/// On the first save there's no file to take the mode from.
	if (statx(0, source_ba.data(), flags, fields, &stx) == 0)
		mode = stx.stx_mode;
	else if (errno != ENOENT)
		tw_status(errno);

	temp_path_ = original_path_ + QLatin1String(".tmp_tabwright");

	return io::EnsureRegularFile(temp_path_, &mode);
}

}

#include "io.hh"

#include "../AutoDelete.hh"
#include "../ByteArray.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace tabwright::io {

static FileType MapPosixTypeToLocal(const mode_t mode)
{
	if (S_ISREG(mode))
		return FileType::Regular;
	if (S_ISDIR(mode))
		return FileType::Dir;
	return FileType::Other;
}

bool EnsureDir(QString dir_path, const QString &subdir, QString *result)
{
	if (!dir_path.endsWith('/'))
		dir_path.append('/');

	dir_path.append(subdir);
	auto ba = dir_path.toLocal8Bit();
	FileType ft;

	if (FileExistsCstr(ba.data(), &ft))
	{
		if (ft == FileType::Dir) {
			if (result)
				*result = dir_path;
			return true;
		}

		if (remove(ba.data()) != 0)
			return false;
	}

	const int status = mkdir(ba.data(), DirPermissions);
	if (status == 0)
	{
		if (result)
			*result = dir_path;
		return true;
	}

	tw_status(errno);
	return false;
}

bool EnsureRegularFile(const QString &full_path, const mode_t *mode)
{
	const QByteArray ba = full_path.toLocal8Bit();
	FileType t;
	if (FileExistsCstr(ba.data(), &t))
	{
		if (t == FileType::Regular)
			return true;

		if (remove(ba.data()) != 0) {
			tw_status(errno);
			return false;
		}
	}

	const int output_fd = ::open(ba.data(), O_CREAT | O_LARGEFILE,
		(mode == nullptr) ? FilePermissions : *mode);
	if (output_fd == -1) {
		tw_status(errno);
		return false;
	}

	::close(output_fd);
	return true;
}

bool FileExistsCstr(const char *path, FileType *file_type)
{
	struct statx stx;
	const auto flags = AT_SYMLINK_NOFOLLOW;
	const auto fields = (file_type == nullptr) ? 0 : STATX_MODE;

	if (statx(0, path, flags, fields, &stx) != 0)
		return false;

	if (file_type != nullptr)
		*file_type = MapPosixTypeToLocal(stx.stx_mode);

	return true;
}

bool ReadFile(const QString &full_path, tabwright::ByteArray &buffer,
	const ReadParams &param)
{
	struct statx stx;
	auto path = full_path.toLocal8Bit();
	const auto flags = 0;// this function must follow symlinks
	const auto fields = STATX_MODE | STATX_SIZE;
	if (statx(0, path.data(), flags, fields, &stx) != 0)
	{
		if (param.print_errors == PrintErrors::Yes)
			tw_warn("statx(): %s: \"%s\"", strerror(errno), path.data());
		return false;
	}

	if (param.ret_mode != nullptr)
		*(param.ret_mode) = stx.stx_mode;

	buffer.MakeSure(stx.stx_size, ExactSize::Yes);
	const int fd = ::open(path.data(), O_RDONLY);

	if (fd == -1) {
		if (param.print_errors == PrintErrors::Yes)
			tw_status(errno);
		return false;
	}

	isize so_far = 0;
	const isize chunk_size = (param.read_max == -1 || param.read_max > 4096)
		? 4096 : param.read_max;
	char *buf = new char[chunk_size];
	AutoDeleteArr ad(buf);
	isize read_chunk;
	while (true)
	{
		read_chunk = read(fd, buf, chunk_size);
		if (read_chunk == -1)
		{
			if (errno == EAGAIN || errno == EINTR)
				continue;
			if (param.print_errors == PrintErrors::Yes)
				tw_warn("ReadFile: %s", strerror(errno));
			::close(fd);
			return false;
		} else if (read_chunk == 0) {
			break;
		}

		so_far += read_chunk;
		buffer.add(buf, read_chunk);

		if (param.read_max != -1 && so_far >= param.read_max)
			break;
	}

	::close(fd);
	buffer.to(0);

	return true;
}

int WriteToFile(const QString &full_path, const char *data, ci8 size,
	const PostWrite post_write, const mode_t *custom_mode)
{
	auto path = full_path.toLocal8Bit();
	const int fd = ::open(path.data(), O_LARGEFILE | O_WRONLY | O_CREAT | O_TRUNC,
		(custom_mode == nullptr) ? io::FilePermissions : *custom_mode);

	if (fd == -1)
		return errno;

	i8 written = 0;
	i8 ret;

	while (written < size) {
		ret = write(fd, data + written, size - written);

		if (ret == -1) {
			if (errno == EAGAIN || errno == EINTR)
				continue;
			const int e = errno;
			::close(fd);
			return e;
		}

		written += ret;
	}

	if (post_write == PostWrite::FSync)
		fsync(fd);

	::close(fd);

	return 0;
}

} // tabwright::io::

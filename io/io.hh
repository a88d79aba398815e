#pragma once

#include "../decl.hxx"
#include "../err.hpp"

#include <sys/types.h>
#include <sys/stat.h>

#include <QString>

namespace tabwright::io {

static const mode_t DirPermissions = S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH;
static const mode_t FilePermissions = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH;

enum class FileType: i1 {
	None,
	Regular,
	Dir,
	Other,
};

enum class PostWrite: i1 {
	DoNothing,
	FSync,
};

struct ReadParams {
	i8 read_max = -1;
	mode_t *ret_mode = nullptr;
	PrintErrors print_errors = PrintErrors::Yes;
};

bool EnsureDir(QString dir_path, const QString &subdir, QString *result = nullptr);

bool EnsureRegularFile(const QString &full_path, const mode_t *mode = nullptr);

bool FileExistsCstr(const char *path, FileType *file_type = nullptr);

inline bool FileExists(const QString &path, FileType *file_type = nullptr) {
	auto ba = path.toLocal8Bit();
	return FileExistsCstr(ba.data(), file_type);
}

bool ReadFile(const QString &full_path, tabwright::ByteArray &buffer,
	const ReadParams &params);

/// Returns 0 or the errno of the failed call.
int WriteToFile(const QString &full_path, const char *data, ci8 size,
	const PostWrite post_write = PostWrite::DoNothing,
	const mode_t *custom_mode = nullptr);

}

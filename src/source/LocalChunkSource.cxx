// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LocalChunkSource.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"

#include <fmt/core.h>

#include <algorithm>

#include <assert.h>
#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

static constexpr LLogger logger{"local"};

LocalChunkSource::LocalChunkSource(RangedStream::ChunkNotifier &_notifier,
				   std::string_view _source_id,
				   UniqueFd &&_fd, std::string_view _path)
	:ChunkSource(_notifier, _source_id),
	 path(_path), fd(std::move(_fd))
{
	assert(fd.IsDefined());

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		ThrowSourceErrno(errno,
				 fmt::format("Failed to stat '{}'", path));

	if (!S_ISREG(st.st_mode))
		throw UnsupportedSourceType(fmt::format("Not a regular file: '{}'",
							path));

	size = st.st_size;
	stop = size;
}

std::unique_ptr<LocalChunkSource>
LocalChunkSource::Open(RangedStream::ChunkNotifier &notifier,
		       std::string_view source_id,
		       const char *path)
{
	auto fd = UniqueFd::OpenReadOnly(path);
	if (!fd.IsDefined())
		ThrowSourceErrno(errno,
				 fmt::format("Failed to open '{}'", path));

	return std::make_unique<LocalChunkSource>(notifier, source_id,
						  std::move(fd), path);
}

void
LocalChunkSource::OpenAt(uint64_t _start, uint64_t _stop,
			 std::size_t _block_size)
{
	assert(_block_size > 0);

	position = _start;
	stop = std::min(_stop, size);
	block_size = _block_size;

	logger.Fmt(4, "'{}' {}-{} block_size={}",
		   path, position, stop, block_size);
}

std::span<const std::byte>
LocalChunkSource::NextBlock()
{
	if (position >= stop)
		return {};

	const std::size_t n = std::min<uint64_t>(block_size, stop - position);

	/* "finished" refers to the whole resource, not to the
	   window: the client asks for a start point, and we want to
	   see when somebody has reached the end of the file */
	NotifyBlock(position, position + n,
		    position + block_size >= size);

	if (buffer.size() < n)
		buffer.resize(n);

	const ssize_t nbytes = pread(fd.Get(), buffer.data(), n, position);
	if (nbytes < 0)
		ThrowSourceErrno(errno,
				 fmt::format("Failed to read from '{}'", path));

	if (nbytes == 0) {
		/* the file has been truncated meanwhile */
		logger(3, "premature end of file in '", path, "'");
		position = stop;
		return {};
	}

	position += nbytes;
	return {buffer.data(), std::size_t(nbytes)};
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ChunkSource.hxx"
#include "io/UniqueFd.hxx"

#include <memory>
#include <string>
#include <vector>

/**
 * A #ChunkSource reading a regular file with pread().
 */
class LocalChunkSource final : public ChunkSource {
	const std::string path;

	const UniqueFd fd;

	/**
	 * Obtained once with fstat() in the constructor.
	 */
	uint64_t size;

	uint64_t position = 0, stop = 0;

	std::size_t block_size = DEFAULT_BLOCK_SIZE;

	std::vector<std::byte> buffer;

public:
	/**
	 * Throws #SourceUnavailable if fstat() fails and
	 * #UnsupportedSourceType if this is not a regular file.
	 *
	 * @param _path the path name for log and error messages
	 */
	LocalChunkSource(RangedStream::ChunkNotifier &_notifier,
			 std::string_view _source_id,
			 UniqueFd &&_fd, std::string_view _path);

	/**
	 * Open the given file.
	 *
	 * Throws #SourceUnavailable if the file cannot be opened.
	 */
	static std::unique_ptr<LocalChunkSource> Open(RangedStream::ChunkNotifier &notifier,
						      std::string_view source_id,
						      const char *path);

	/* virtual methods from class ChunkSource */
	uint64_t GetSize() const noexcept override {
		return size;
	}

	void OpenAt(uint64_t start, uint64_t stop,
		    std::size_t block_size) override;
	std::span<const std::byte> NextBlock() override;
};

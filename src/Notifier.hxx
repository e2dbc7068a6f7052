// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Generic #ChunkNotifier implementations.
 */

#pragma once

#include <ranged-stream/ChunkEvent.hxx>

#include <vector>

/**
 * Discards all events.
 */
class NullChunkNotifier final : public RangedStream::ChunkNotifier {
public:
	void OnChunkEvent(const RangedStream::ChunkEvent &) noexcept override {}
};

/**
 * Writes all events to the log.  The "reloaded" event is logged at
 * level 3, block events at level 5.
 */
class LoggingChunkNotifier final : public RangedStream::ChunkNotifier {
public:
	void OnChunkEvent(const RangedStream::ChunkEvent &event) noexcept override;
};

/**
 * Forwards each event to all registered notifiers, in the order they
 * were added.
 */
class ChunkNotifierList final : public RangedStream::ChunkNotifier {
	std::vector<RangedStream::ChunkNotifier *> list;

public:
	/**
	 * The notifier must remain valid for the lifetime of this
	 * object.
	 */
	void Add(RangedStream::ChunkNotifier &notifier) {
		list.push_back(&notifier);
	}

	void OnChunkEvent(const RangedStream::ChunkEvent &event) noexcept override {
		for (auto *i : list)
			i->OnChunkEvent(event);
	}
};

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Notifier.hxx"
#include "io/Logger.hxx"

static constexpr LLogger logger{"event"};

void
LoggingChunkNotifier::OnChunkEvent(const RangedStream::ChunkEvent &event) noexcept
{
	if (event.reloaded)
		logger.Fmt(3, "id='{}' reloaded {}-{} range='{}'",
			   event.source_id, event.start, event.stop,
			   event.requested_range.value_or(std::string_view{}));
	else
		logger.Fmt(5, "id='{}' block {}-{}{}",
			   event.source_id, event.start, event.stop,
			   event.finished ? " finished" : "");
}

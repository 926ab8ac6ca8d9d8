// src/killtree/BestEffort.h
#pragma once

#include <exception>
#include <utility>

#include "../common/Utility.h"

namespace killtree
{
	// Run action and discard any failure it raises. Every cleanup step of a
	// sweep goes through here: a process that is already gone, a missing
	// query tool or a refused signal are all the same outcome to the caller.
	// Returns false when the action failed.
	template <typename Action>
	bool bestEffort(const char *fname, Action &&action)
	{
		try
		{
			std::forward<Action>(action)();
			return true;
		}
		catch (const std::exception &e)
		{
			LOG_DBG << fname << "ignored failure: " << e.what();
		}
		catch (...)
		{
			LOG_DBG << fname << "ignored failure: unknown exception";
		}
		return false;
	}

	// Same policy for a producer: returns its result, or fallback when it fails.
	template <typename T, typename Producer>
	T bestEffortOr(const char *fname, T fallback, Producer &&producer)
	{
		T result = std::move(fallback);
		bestEffort(fname, [&]()
				   { result = std::forward<Producer>(producer)(); });
		return result;
	}

} // namespace killtree

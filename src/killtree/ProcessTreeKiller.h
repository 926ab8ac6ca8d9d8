// src/killtree/ProcessTreeKiller.h
#pragma once

#include <future>
#include <memory>
#include <optional>

#include "ProcessReference.h"
#include "Signal.h"

namespace killtree
{
	class TerminationStrategy;

	/// <summary>
	/// Best-effort termination of a process and everything it spawned.
	///
	/// A reference with a pid is swept through the injected TerminationStrategy.
	/// A handle without a pid falls back to its own terminate capability, which
	/// reaches that single process only.
	///
	/// No entry point throws or reports success. A caller that needs
	/// confirmation polls os::running() afterwards.
	/// </summary>
	class ProcessTreeKiller
	{
	public:
		explicit ProcessTreeKiller(std::shared_ptr<TerminationStrategy> strategy);

		// Instance using TerminationStrategy::forHost()
		static ProcessTreeKiller &instance();

		// Returns after the whole tree was swept (post-order, leaves first).
		void terminateTreeBlocking(const ProcessReference &ref, int signal = DEFAULT_KILL_SIGNAL) const;

		// Resolves the reference on the calling thread, then sweeps on a detached
		// worker thread. The future becomes ready when the sweep finished and
		// never carries an exception. Dropping it neither blocks nor cancels.
		std::future<void> terminateTreeSuspending(const ProcessReference &ref, int signal = DEFAULT_KILL_SIGNAL) const;

		const std::shared_ptr<TerminationStrategy> &strategy() const;

	private:
		// The pid to sweep. Without a usable pid, runs the handle's own
		// terminate capability and returns nothing.
		static std::optional<pid_t> resolveOrFallback(const ProcessReference &ref, int signal);

		const std::shared_ptr<TerminationStrategy> m_strategy;
	};

	// Shortcuts to ProcessTreeKiller::instance()
	void terminateTreeBlocking(const ProcessReference &ref, int signal = DEFAULT_KILL_SIGNAL);
	std::future<void> terminateTreeSuspending(const ProcessReference &ref, int signal = DEFAULT_KILL_SIGNAL);

} // namespace killtree

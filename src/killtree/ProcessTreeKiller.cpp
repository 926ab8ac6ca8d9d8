#include <stdexcept>
#include <thread>

#include "../common/Utility.h"
#include "BestEffort.h"
#include "ProcessTreeKiller.h"
#include "TerminationStrategy.h"

namespace killtree
{
	ProcessTreeKiller::ProcessTreeKiller(std::shared_ptr<TerminationStrategy> strategy)
		: m_strategy(std::move(strategy))
	{
		if (m_strategy == nullptr)
		{
			throw std::invalid_argument("ProcessTreeKiller requires a termination strategy");
		}
	}

	ProcessTreeKiller &ProcessTreeKiller::instance()
	{
		static ProcessTreeKiller killer(TerminationStrategy::forHost());
		return killer;
	}

	const std::shared_ptr<TerminationStrategy> &ProcessTreeKiller::strategy() const
	{
		return m_strategy;
	}

	std::optional<pid_t> ProcessTreeKiller::resolveOrFallback(const ProcessReference &ref, int signal)
	{
		const static char fname[] = "ProcessTreeKiller::resolveOrFallback() ";

		const auto pid = resolvePid(ref);
		if (pid && *pid > 0)
		{
			return pid;
		}

		const auto handle = std::get_if<ProcessHandle>(&ref);
		if (handle != nullptr && handle->terminate)
		{
			LOG_DBG << fname << "no pid available, terminate the handle directly with " << signalName(signal);
			bestEffort(fname, [&]()
					   { handle->terminate(signal); });
		}
		else
		{
			LOG_DBG << fname << "nothing to terminate for pid <" << pid.value_or(0) << ">";
		}
		return std::nullopt;
	}

	void ProcessTreeKiller::terminateTreeBlocking(const ProcessReference &ref, int signal) const
	{
		const static char fname[] = "ProcessTreeKiller::terminateTreeBlocking() ";

		const auto pid = resolveOrFallback(ref, signal);
		if (!pid)
		{
			return;
		}

		LOG_INF << fname << "terminate process tree <" << *pid << "> with " << signalName(signal) << " by " << m_strategy->name() << " strategy";
		bestEffort(fname, [&]()
				   { m_strategy->terminateTree(*pid, signal); });
	}

	std::future<void> ProcessTreeKiller::terminateTreeSuspending(const ProcessReference &ref, int signal) const
	{
		const static char fname[] = "ProcessTreeKiller::terminateTreeSuspending() ";

		auto done = std::make_shared<std::promise<void>>();
		auto future = done->get_future();

		const auto pid = resolveOrFallback(ref, signal);
		if (!pid)
		{
			done->set_value();
			return future;
		}

		LOG_INF << fname << "terminate process tree <" << *pid << "> with " << signalName(signal) << " by " << m_strategy->name() << " strategy";
		const pid_t target = *pid;
		const auto strategy = m_strategy;
		const bool started = bestEffort(fname, [&]()
										{ std::thread([strategy, target, signal, done]()
													  {
														  bestEffort(fname, [&]()
																	 { strategy->terminateTreeFlat(target, signal); });
														  done->set_value(); })
											  .detach(); });
		if (!started)
		{
			// no worker thread available, sweep on the caller's thread
			bestEffort(fname, [&]()
					   { strategy->terminateTreeFlat(target, signal); });
			done->set_value();
		}
		return future;
	}

	void terminateTreeBlocking(const ProcessReference &ref, int signal)
	{
		ProcessTreeKiller::instance().terminateTreeBlocking(ref, signal);
	}

	std::future<void> terminateTreeSuspending(const ProcessReference &ref, int signal)
	{
		return ProcessTreeKiller::instance().terminateTreeSuspending(ref, signal);
	}

} // namespace killtree

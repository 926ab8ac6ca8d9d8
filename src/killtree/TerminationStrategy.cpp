#include <vector>

#include "../common/Utility.h"
#include "BestEffort.h"
#include "CommandRunner.h"
#include "Configuration.h"
#include "ProcessTable.h"
#include "Signal.h"
#include "SignalSender.h"
#include "TerminationStrategy.h"

namespace killtree
{
	std::shared_ptr<TerminationStrategy> TerminationStrategy::forHost()
	{
		// default settings, same choice as the configured tool
		return Configuration().buildStrategy();
	}

	////////////////////////////////////////////////////////////////////////////////
	// NativeTreeStrategy
	////////////////////////////////////////////////////////////////////////////////
	NativeTreeStrategy::NativeTreeStrategy(std::shared_ptr<CommandRunner> runner, const std::string &taskkill)
		: m_runner(std::move(runner)), m_taskkill(taskkill)
	{
	}

	void NativeTreeStrategy::terminateTree(pid_t pid, int signal)
	{
		const static char fname[] = "NativeTreeStrategy::terminateTree() ";

		LOG_DBG << fname << "terminate tree of process <" << pid << ">, " << signalName(signal) << " is implied by /f";
		bestEffort(fname, [&]()
				   {
					   const auto result = m_runner->run({m_taskkill, "/pid", std::to_string(pid), "/t", "/f"});
					   if (result.exitCode != 0)
					   {
						   LOG_DBG << fname << m_taskkill << " exited with code <" << result.exitCode << "> for process <" << pid << ">";
					   } });
	}

	void NativeTreeStrategy::terminateTreeFlat(pid_t pid, int signal)
	{
		// the native utility has no cheaper variant
		terminateTree(pid, signal);
	}

	////////////////////////////////////////////////////////////////////////////////
	// EnumerationStrategy
	////////////////////////////////////////////////////////////////////////////////
	EnumerationStrategy::EnumerationStrategy(std::shared_ptr<ProcessTable> table, std::shared_ptr<SignalSender> sender)
		: m_table(std::move(table)), m_sender(std::move(sender))
	{
	}

	void EnumerationStrategy::terminateTree(pid_t pid, int signal)
	{
		sweepBlocking(pid, signal);
	}

	void EnumerationStrategy::terminateTreeFlat(pid_t pid, int signal)
	{
		sweepFlat(pid, signal);
	}

	void EnumerationStrategy::sweepBlocking(pid_t pid, int signal)
	{
		const static char fname[] = "EnumerationStrategy::sweepBlocking() ";

		const auto children = bestEffortOr(fname, std::vector<pid_t>(), [&]()
										   { return m_table->children(pid); });
		for (const pid_t child : children)
		{
			sweepBlocking(child, signal);
		}
		signalOne(pid, signal);
	}

	void EnumerationStrategy::sweepFlat(pid_t pid, int signal)
	{
		const static char fname[] = "EnumerationStrategy::sweepFlat() ";

		const auto descendants = bestEffortOr(fname, std::vector<pid_t>(), [&]()
											  { return m_table->descendants(pid); });
		LOG_DBG << fname << "process <" << pid << "> has <" << descendants.size() << "> descendants to terminate";
		for (auto it = descendants.rbegin(); it != descendants.rend(); ++it)
		{
			// an enumerator that lists the root too must not get it signaled before the others
			if (*it != pid)
			{
				signalOne(*it, signal);
			}
		}
		signalOne(pid, signal);
	}

	void EnumerationStrategy::signalOne(pid_t pid, int signal)
	{
		const static char fname[] = "EnumerationStrategy::signalOne() ";

		bestEffort(fname, [&]()
				   { m_sender->send(pid, signal); });
	}

} // namespace killtree

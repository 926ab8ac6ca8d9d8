#include <sstream>
#include <stdexcept>

#include "../common/Utility.h"
#include "../common/os/linux.h"
#include "CommandRunner.h"
#include "ProcessTable.h"

namespace killtree
{
	// pgrep exit status when no process matched
	constexpr int PGREP_NO_MATCH = 1;

	CommandProcessTable::CommandProcessTable(std::shared_ptr<CommandRunner> runner, const std::string &pgrep, const std::string &ps)
		: m_runner(std::move(runner)), m_pgrep(pgrep), m_ps(ps)
	{
	}

	std::vector<pid_t> CommandProcessTable::children(pid_t pid)
	{
		const static char fname[] = "CommandProcessTable::children() ";

		const auto result = m_runner->run({m_pgrep, "-P", std::to_string(pid)});
		if (result.exitCode == PGREP_NO_MATCH)
		{
			return {};
		}
		if (result.exitCode != 0)
		{
			throw std::runtime_error(Utility::stringFormat("%s exited with code <%d>", m_pgrep.c_str(), result.exitCode));
		}

		std::vector<pid_t> pids;
		for (const auto &line : Utility::splitString(result.output, "\n"))
		{
			if (Utility::isNumber(line))
			{
				pids.push_back(static_cast<pid_t>(std::stol(line)));
			}
			else
			{
				LOG_DBG << fname << "skip unexpected line <" << line << ">";
			}
		}
		LOG_DBG << fname << "process <" << pid << "> has <" << pids.size() << "> children";
		return pids;
	}

	std::vector<pid_t> CommandProcessTable::descendants(pid_t pid)
	{
		const static char fname[] = "CommandProcessTable::descendants() ";

		const auto result = m_runner->run({m_ps, "-A", "-o", "pid=", "-o", "ppid="});
		if (result.exitCode != 0)
		{
			throw std::runtime_error(Utility::stringFormat("%s exited with code <%d>", m_ps.c_str(), result.exitCode));
		}

		std::list<os::Process> snapshot;
		std::istringstream stream(result.output);
		std::string line;
		while (std::getline(stream, line))
		{
			std::istringstream fields(line);
			long childPid = 0;
			long parentPid = 0;
			if (fields >> childPid >> parentPid)
			{
				snapshot.emplace_back(static_cast<pid_t>(childPid), static_cast<pid_t>(parentPid), 0, 0, std::string(), false);
			}
		}

		if (os::process(pid, snapshot) == nullptr)
		{
			throw std::runtime_error(Utility::stringFormat("no matching pid <%d> found", static_cast<int>(pid)));
		}
		auto pids = os::descendants(pid, snapshot);
		LOG_DBG << fname << "process <" << pid << "> has <" << pids.size() << "> descendants";
		return pids;
	}

	std::vector<pid_t> ProcfsProcessTable::children(pid_t pid)
	{
		return os::children(pid);
	}

	std::vector<pid_t> ProcfsProcessTable::descendants(pid_t pid)
	{
		const auto snapshot = os::processes();
		if (os::process(pid, snapshot) == nullptr)
		{
			throw std::runtime_error(Utility::stringFormat("no matching pid <%d> found", static_cast<int>(pid)));
		}
		return os::descendants(pid, snapshot);
	}

} // namespace killtree

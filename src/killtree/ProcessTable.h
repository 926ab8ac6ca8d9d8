// src/killtree/ProcessTable.h
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <ace/OS_NS_unistd.h> // for pid_t

namespace killtree
{
	class CommandRunner;

	// Read access to the live process table. Every call takes a fresh look,
	// nothing is cached between calls.
	class ProcessTable
	{
	public:
		virtual ~ProcessTable() = default;

		// Direct children of pid. An empty result means no children.
		// Throws when the table could not be queried.
		virtual std::vector<pid_t> children(pid_t pid) = 0;

		// All transitive descendants of pid, root excluded, in breadth-first
		// order (parents before their children).
		// Throws when pid is not in the table or the table could not be queried.
		virtual std::vector<pid_t> descendants(pid_t pid) = 0;
	};

	// Queries the table through the `pgrep` and `ps` utilities.
	class CommandProcessTable : public ProcessTable
	{
	public:
		CommandProcessTable(std::shared_ptr<CommandRunner> runner, const std::string &pgrep = "pgrep", const std::string &ps = "ps");

		std::vector<pid_t> children(pid_t pid) override;
		std::vector<pid_t> descendants(pid_t pid) override;

	private:
		const std::shared_ptr<CommandRunner> m_runner;
		const std::string m_pgrep;
		const std::string m_ps;
	};

	// Reads the table directly (/proc on Linux, sysctl on macOS, Toolhelp on Windows).
	class ProcfsProcessTable : public ProcessTable
	{
	public:
		std::vector<pid_t> children(pid_t pid) override;
		std::vector<pid_t> descendants(pid_t pid) override;
	};

} // namespace killtree

// src/common/os/pstree.cpp
#include <algorithm>
#include <sstream>

#include <ace/OS.h>

#include "../Utility.h"
#include "pstree.h"

namespace os
{
	std::shared_ptr<ProcessTree> ProcessTree::find(pid_t pid) const
	{
		if (process.pid == pid)
		{
			// make a copy of this
			return std::make_shared<ProcessTree>(*this);
		}

		for (const ProcessTree &tree : children)
		{
			std::shared_ptr<ProcessTree> option = tree.find(pid);
			if (option != nullptr)
			{
				return option;
			}
		}

		return nullptr;
	}

	std::list<os::Process> ProcessTree::getProcesses() const
	{
		std::list<os::Process> result;
		result.push_back(this->process);
		for (const auto &tree : children)
		{
			auto childProcesses = tree.getProcesses();
			result.splice(result.end(), childProcesses);
		}
		return result;
	}

	bool ProcessTree::contains(pid_t pid) const
	{
		return find(pid) != nullptr;
	}

	ProcessTree::operator pid_t() const
	{
		return process.pid;
	}

	ProcessTree::ProcessTree(const Process &_process, const std::list<ProcessTree> &_children)
		: process(_process), children(_children)
	{
	}

	std::ostream &operator<<(std::ostream &stream, const ProcessTree &tree)
	{
		stream << (tree.children.empty() ? "--- " : "-+- ") << tree.process.pid << " ";
		if (tree.process.zombie)
		{
			stream << "(" << tree.process.command << ")";
		}
		else
		{
			stream << tree.process.command;
		}

		size_t size = tree.children.size();
		for (const ProcessTree &child : tree.children)
		{
			std::ostringstream out;
			out << child;
			stream << "\n";
			if (--size != 0)
			{
				stream << " |" << Utility::stringReplace(out.str(), "\n", "\n |");
			}
			else
			{
				stream << " \\" << Utility::stringReplace(out.str(), "\n", "\n  ");
			}
		}
		return stream;
	}

	std::shared_ptr<ProcessTree> pstree(pid_t pid, const std::list<Process> &processes)
	{
		const static char fname[] = "os::pstree() ";

		const auto iter = std::find_if(processes.begin(), processes.end(), [&pid](const Process &p)
									   { return p.pid == pid; });
		if (iter == processes.end())
		{
			LOG_DBG << fname << "No process <" << pid << "> found from tree";
			return nullptr;
		}

		std::list<ProcessTree> children;
		for (pid_t childPid : os::children(pid, processes))
		{
			// a child may vanish from the list only if the snapshot is inconsistent
			auto tree = pstree(childPid, processes);
			if (tree != nullptr)
			{
				children.push_back(*tree);
			}
		}
		return std::shared_ptr<ProcessTree>(new ProcessTree(*iter, children));
	}

	std::shared_ptr<ProcessTree> pstree(pid_t pid)
	{
		if (pid == 0)
		{
			pid = ACE_OS::getpid();
		}
		return pstree(pid, os::processes());
	}

} // namespace os

// This file contains cross-platform process table utilities for Linux/macOS/Windows.
#include "linux.h" // Include the header first

#include <algorithm>
#include <fstream>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#if defined(_WIN32)
#include <windows.h>
// after windows.h: needs HANDLE and DWORD
#include <tlhelp32.h>
#else
#include <dirent.h> // Directory operations
#include <errno.h>	// Error codes
#include <stdlib.h>
#include <sys/types.h>
#if defined(__APPLE__)
#include <sys/proc.h>	// SZOMB
#include <sys/sysctl.h> // System control interface
#endif
#endif

#include <ace/OS.h>

#include "../Utility.h" // for last_error_msg(), LOG_*

namespace os
{

#if defined(_WIN32)
	// RAII wrapper for a Toolhelp snapshot HANDLE
	class SnapshotHandle
	{
	public:
		explicit SnapshotHandle(HANDLE handle) : m_handle(handle) {}
		~SnapshotHandle()
		{
			if (valid())
				CloseHandle(m_handle);
		}
		SnapshotHandle(const SnapshotHandle &) = delete;
		SnapshotHandle &operator=(const SnapshotHandle &) = delete;

		bool valid() const { return m_handle != INVALID_HANDLE_VALUE && m_handle != NULL; }
		HANDLE get() const { return m_handle; }

	private:
		HANDLE m_handle;
	};
#endif

#if defined(__linux__)
	namespace
	{
		// Full command line from /proc/[pid]/cmdline, arguments joined by spaces.
		std::string cmdline(pid_t pid)
		{
			std::ifstream file("/proc/" + std::to_string(pid) + "/cmdline", std::ios::in | std::ios::binary);
			if (!file.is_open())
				return std::string();

			std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
			std::replace(content.begin(), content.end(), '\0', ' ');
			return Utility::stdStringTrim(content);
		}
	}
#endif

	std::shared_ptr<Process> process(pid_t pid)
	{
		const static char fname[] = "os::process() ";

		if (pid <= 0)
		{
			return nullptr;
		}

#if defined(__linux__)
		const std::string path = "/proc/" + std::to_string(pid) + "/stat";
		std::ifstream statFile(path);
		if (!statFile.is_open())
			return nullptr;

		std::string content;
		content.reserve(512); // typical size < 512 bytes
		content.assign(std::istreambuf_iterator<char>(statFile), std::istreambuf_iterator<char>());
		if (content.empty())
		{
			LOG_DBG << fname << "Process does not exist or file is empty: " << path;
			return nullptr;
		}

		// Format: pid (command) state ppid pgrp session ...
		// The command field is enclosed in parentheses and can contain spaces
		const size_t firstParenPos = content.find('(');
		const size_t lastParenPos = content.find_last_of(')');
		if (firstParenPos == std::string::npos || lastParenPos == std::string::npos || firstParenPos >= lastParenPos)
		{
			LOG_DBG << fname << "Malformed stat file: " << path;
			return nullptr;
		}
		const std::string comm = content.substr(firstParenPos + 1, lastParenPos - firstParenPos - 1);

		char state = 0;
		pid_t ppid = 0;
		pid_t pgrp = 0;
		pid_t session = 0;
		if (sscanf(content.c_str() + lastParenPos + 1, " %c %d %d %d", &state, &ppid, &pgrp, &session) != 4)
		{
			LOG_WAR << fname << "Failed to parse stat file: " << path;
			return nullptr;
		}

		const std::string commandLine = cmdline(pid);
		return std::make_shared<Process>(pid, ppid, pgrp, session, commandLine.length() ? commandLine : comm, state == 'Z');
#else
		return process(pid, processes());
#endif
	}

	std::shared_ptr<Process> process(pid_t pid, const std::list<Process> &processes)
	{
		const auto iter = std::find_if(processes.begin(), processes.end(), [&pid](const Process &p)
									   { return p.pid == pid; });
		if (iter != processes.end())
			return std::make_shared<Process>(*iter);
		return nullptr;
	}

	std::list<Process> processes()
	{
		const static char fname[] = "os::processes() ";

		std::list<Process> result;
#if defined(__linux__)
		std::unique_ptr<DIR, void (*)(DIR *)> proc(opendir("/proc"), [](DIR *d)
												   { if(d) closedir(d); });
		if (!proc)
		{
			LOG_WAR << fname << "Failed to open /proc: " << last_error_msg();
			return result;
		}

		struct dirent *entry;
		while ((entry = readdir(proc.get())) != nullptr)
		{
			char *endptr = nullptr;
			long lpid = strtol(entry->d_name, &endptr, 10);
			if (!endptr || *endptr != '\0' || lpid <= 0)
				continue;

			auto processPtr = os::process(static_cast<pid_t>(lpid));
			// Ignore any processes that disappear between enumeration and now.
			if (processPtr != nullptr)
			{
				result.push_back(*processPtr);
			}
		}

#elif defined(__APPLE__)
		int mib[3] = {CTL_KERN, KERN_PROC, KERN_PROC_ALL};
		size_t size = 0;
		if (sysctl(mib, 3, nullptr, &size, nullptr, 0) != 0)
		{
			LOG_WAR << fname << "sysctl(KERN_PROC_ALL) size query failed: " << last_error_msg();
			return result;
		}

		// Allocate buffer with some extra space in case process list grows
		std::vector<char> buf(size + sizeof(struct kinfo_proc) * 10);
		size = buf.size();
		if (sysctl(mib, 3, buf.data(), &size, nullptr, 0) != 0)
		{
			LOG_WAR << fname << "sysctl(KERN_PROC_ALL) failed: " << last_error_msg();
			return result;
		}

		const size_t nproc = size / sizeof(struct kinfo_proc);
		const struct kinfo_proc *procs = reinterpret_cast<const struct kinfo_proc *>(buf.data());
		for (size_t i = 0; i < nproc; ++i)
		{
			const auto &kp = procs[i];
			result.emplace_back(kp.kp_proc.p_pid, kp.kp_eproc.e_ppid, kp.kp_eproc.e_pgid, 0,
								std::string(kp.kp_proc.p_comm), kp.kp_proc.p_stat == SZOMB);
		}

#elif defined(_WIN32)
		SnapshotHandle snapshot(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
		if (!snapshot.valid())
		{
			LOG_WAR << fname << "CreateToolhelp32Snapshot failed, error: " << GetLastError();
			return result;
		}

		PROCESSENTRY32 pe32;
		pe32.dwSize = sizeof(PROCESSENTRY32);
		if (Process32First(snapshot.get(), &pe32))
		{
			do
			{
				// skip idle/system pseudo-pids
				if (pe32.th32ProcessID != 0 && pe32.th32ProcessID != 4)
				{
					result.emplace_back(static_cast<pid_t>(pe32.th32ProcessID), static_cast<pid_t>(pe32.th32ParentProcessID), 0, 0,
										std::string(pe32.szExeFile), false);
				}
			} while (Process32Next(snapshot.get(), &pe32));
		}
#else
		LOG_WAR << fname << "Platform not supported";
#endif
		return result;
	}

	std::vector<pid_t> children(pid_t pid, const std::list<Process> &processes)
	{
		std::vector<pid_t> result;
		for (const Process &proc : processes)
		{
			if (proc.parent == pid && proc.pid != pid)
			{
				result.push_back(proc.pid);
			}
		}
		return result;
	}

	std::vector<pid_t> children(pid_t pid)
	{
		return children(pid, os::processes());
	}

	std::vector<pid_t> descendants(pid_t rootPid, const std::list<Process> &processes)
	{
		// Step 1: build parent -> children map
		std::unordered_map<pid_t, std::vector<pid_t>> tree;
		for (const Process &proc : processes)
		{
			if (proc.pid != proc.parent)
				tree[proc.parent].push_back(proc.pid);
		}

		// Step 2: BFS to collect descendants
		std::vector<pid_t> result;
		std::unordered_set<pid_t> visited{rootPid};
		std::queue<pid_t> q;
		q.push(rootPid);
		while (!q.empty())
		{
			const pid_t parent = q.front();
			q.pop();
			auto it = tree.find(parent);
			if (it == tree.end())
				continue;
			for (pid_t c : it->second)
			{
				if (visited.insert(c).second)
				{
					result.push_back(c);
					q.push(c);
				}
			}
		}
		return result;
	}

	std::vector<pid_t> descendants(pid_t rootPid)
	{
		return descendants(rootPid, os::processes());
	}

	bool running(pid_t pid)
	{
		auto proc = os::process(pid);
		return proc != nullptr && !proc->zombie;
	}

	bool waitExit(pid_t pid, std::chrono::milliseconds timeout)
	{
		const auto deadline = std::chrono::steady_clock::now() + timeout;
		while (running(pid))
		{
			if (std::chrono::steady_clock::now() >= deadline)
			{
				return false;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(50));
		}
		return true;
	}

} // namespace os

// src/killtree/ProcessReference.h
#pragma once

#include <functional>
#include <optional>
#include <variant>

#include <ace/OS_NS_unistd.h> // for pid_t

class ACE_Process;

namespace killtree
{
	// A process the caller holds a handle to. The identifier is optional (the
	// process may already be gone and have cleared it), the termination
	// capability delivers a signal to that single process only.
	struct ProcessHandle
	{
		std::optional<pid_t> pid;
		std::function<void(int)> terminate;
	};

	// Either a bare process identifier or a handle.
	using ProcessReference = std::variant<pid_t, ProcessHandle>;

	// Extract the identifier of a reference: a bare pid is returned unchanged,
	// a handle yields its embedded pid or nothing.
	std::optional<pid_t> resolvePid(const ProcessReference &ref);

	// Build a handle over a process spawned with ACE. The pid is only exposed
	// while the process is running. Its terminate capability refuses to signal
	// once the process exited. The handle refers to `process` and must not
	// outlive it.
	ProcessHandle makeHandle(ACE_Process &process);

} // namespace killtree

#include <stdexcept>

#include <ace/Process.h>

#include "../common/Utility.h"
#include "ProcessReference.h"

namespace killtree
{
	namespace
	{
		struct PidVisitor
		{
			std::optional<pid_t> operator()(pid_t pid) const
			{
				return pid;
			}

			std::optional<pid_t> operator()(const ProcessHandle &handle) const
			{
				return handle.pid;
			}
		};
	}

	std::optional<pid_t> resolvePid(const ProcessReference &ref)
	{
		return std::visit(PidVisitor(), ref);
	}

	ProcessHandle makeHandle(ACE_Process &process)
	{
		ProcessHandle handle;
		if (process.running())
		{
			handle.pid = process.getpid();
		}
		handle.terminate = [&process](int signal)
		{
			// a reaped child keeps its old pid, which the OS may have handed out again
			if (!process.running())
			{
				throw std::runtime_error(Utility::stringFormat("process <%d> already exited", static_cast<int>(process.getpid())));
			}
			if (process.kill(signal) == -1)
			{
				throw std::runtime_error(Utility::stringFormat("kill process <%d> with signal <%d> failed: %s",
															   static_cast<int>(process.getpid()), signal, last_error_msg()));
			}
		};
		return handle;
	}

} // namespace killtree

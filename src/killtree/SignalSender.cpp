#include <stdexcept>

#include <ace/OS_NS_signal.h>

#include "../common/Utility.h"
#include "Signal.h"
#include "SignalSender.h"

namespace killtree
{
	void OsSignalSender::send(pid_t pid, int signal)
	{
		const static char fname[] = "OsSignalSender::send() ";

		// pid 0 and negative pids address process groups, never a single process
		if (pid <= 0)
		{
			throw std::invalid_argument(Utility::stringFormat("refuse to signal pid <%d>", static_cast<int>(pid)));
		}

		if (ACE_OS::kill(pid, signal) != 0)
		{
			throw std::runtime_error(Utility::stringFormat("send %s to process <%d> failed: %s",
														   signalName(signal).c_str(), static_cast<int>(pid), last_error_msg()));
		}
		LOG_DBG << fname << "sent " << signalName(signal) << " to process <" << pid << ">";
	}

} // namespace killtree

// src/killtree/SignalSender.h
#pragma once

#include <ace/OS_NS_unistd.h> // for pid_t

namespace killtree
{
	// Delivers a signal to a single process.
	class SignalSender
	{
	public:
		virtual ~SignalSender() = default;

		// Throws std::runtime_error when delivery failed (no such process, no permission).
		virtual void send(pid_t pid, int signal) = 0;
	};

	// SignalSender over ACE_OS::kill (TerminateProcess on Windows).
	class OsSignalSender : public SignalSender
	{
	public:
		void send(pid_t pid, int signal) override;
	};

} // namespace killtree

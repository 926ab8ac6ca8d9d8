// src/killtree/TerminationStrategy.h
#pragma once

#include <memory>
#include <string>

#include <ace/OS_NS_unistd.h> // for pid_t

namespace killtree
{
	class CommandRunner;
	class ProcessTable;
	class SignalSender;

	// How a whole process tree is brought down on this host.
	// Implementations never throw: every failure is part of the best-effort contract.
	class TerminationStrategy
	{
	public:
		virtual ~TerminationStrategy() = default;

		// Terminate pid and its descendants, used by the blocking entry point.
		virtual void terminateTree(pid_t pid, int signal) = 0;

		// Terminate pid and its descendants, used by the asynchronous entry point.
		virtual void terminateTreeFlat(pid_t pid, int signal) = 0;

		virtual const char *name() const = 0;

		// Default strategy for the build platform: the native subtree kill on
		// Windows, pgrep/ps enumeration with ACE_OS::kill elsewhere.
		static std::shared_ptr<TerminationStrategy> forHost();
	};

	// One call to the operating system's subtree kill utility
	// (`taskkill /pid <pid> /t /f`). The signal is not used: the utility
	// always terminates unconditionally.
	class NativeTreeStrategy : public TerminationStrategy
	{
	public:
		NativeTreeStrategy(std::shared_ptr<CommandRunner> runner, const std::string &taskkill = "taskkill");

		void terminateTree(pid_t pid, int signal) override;
		void terminateTreeFlat(pid_t pid, int signal) override;
		const char *name() const override { return "native"; }

	private:
		const std::shared_ptr<CommandRunner> m_runner;
		const std::string m_taskkill;
	};

	// Explicit descendant enumeration followed by one signal per process.
	class EnumerationStrategy : public TerminationStrategy
	{
	public:
		EnumerationStrategy(std::shared_ptr<ProcessTable> table, std::shared_ptr<SignalSender> sender);

		void terminateTree(pid_t pid, int signal) override;
		void terminateTreeFlat(pid_t pid, int signal) override;
		const char *name() const override { return "enumeration"; }

		// Post-order recursion: discover the direct children of pid, sweep each
		// child's subtree completely, then signal pid. Leaves die first, pid last.
		void sweepBlocking(pid_t pid, int signal);

		// One flat descendant listing, signaled in reverse of the listing order,
		// then pid itself. Correct as long as the listing puts parents before
		// children, which both ProcessTable implementations guarantee.
		void sweepFlat(pid_t pid, int signal);

	private:
		void signalOne(pid_t pid, int signal);

		const std::shared_ptr<ProcessTable> m_table;
		const std::shared_ptr<SignalSender> m_sender;
	};

} // namespace killtree

#include <stdexcept>

#include <ace/OS_NS_fcntl.h>
#include <ace/OS_NS_unistd.h>
#include <ace/Pipe.h>
#include <ace/Process.h>
#include <boost/algorithm/string/join.hpp>

#include "../common/Utility.h"
#include "CommandRunner.h"

namespace killtree
{
	namespace
	{
		// Keep a pipe end out of programs other threads exec while run() is
		// active, otherwise their copy of the write end holds off EOF.
		void closeOnExec(ACE_HANDLE handle)
		{
#if !defined(_WIN32)
			if (handle != ACE_INVALID_HANDLE && ACE_OS::fcntl(handle, F_SETFD, FD_CLOEXEC) == -1)
			{
				throw std::runtime_error(Utility::stringFormat("set close-on-exec on handle <%d> failed: %s", handle, last_error_msg()));
			}
#endif
		}
	}

	CommandResult AceCommandRunner::run(const std::vector<std::string> &argv)
	{
		const static char fname[] = "AceCommandRunner::run() ";

		if (argv.empty())
		{
			throw std::invalid_argument("empty command line");
		}
		const auto commandLine = boost::algorithm::join(argv, " ");

		ACE_Pipe pipe;
		if (pipe.open() == -1)
		{
			throw std::runtime_error(Utility::stringFormat("create pipe for <%s> failed: %s", commandLine.c_str(), last_error_msg()));
		}
		try
		{
			closeOnExec(pipe.read_handle());
			closeOnExec(pipe.write_handle());
		}
		catch (const std::exception &)
		{
			pipe.close();
			throw;
		}

		std::vector<const ACE_TCHAR *> args;
		for (const auto &arg : argv)
		{
			args.push_back(arg.c_str());
		}
		args.push_back(nullptr);

		ACE_Process_Options option;
		option.command_line(args.data());

		// set_handles() dups the handles, spawn dup2()s them onto 0/1/2 in the
		// child which clears close-on-exec there
		ACE_Process process;
		option.set_handles(ACE_STDIN, pipe.write_handle(), ACE_STDERR);
		try
		{
			closeOnExec(option.get_stdin());
			closeOnExec(option.get_stdout());
			closeOnExec(option.get_stderr());
		}
		catch (const std::exception &)
		{
			option.release_handles();
			pipe.close();
			throw;
		}
		if (process.spawn(option) == ACE_INVALID_PID)
		{
			const std::string error = last_error_msg();
			option.release_handles();
			pipe.close();
			throw std::runtime_error(Utility::stringFormat("start <%s> failed: %s", commandLine.c_str(), error.c_str()));
		}
		// only the child keeps the write end open, so read() sees EOF when it exits
		option.release_handles();
		pipe.close_write();

		CommandResult result{0, std::string()};
		char buffer[4096];
		ssize_t bytes = 0;
		while ((bytes = ACE_OS::read(pipe.read_handle(), buffer, sizeof(buffer))) > 0)
		{
			result.output.append(buffer, static_cast<size_t>(bytes));
		}
		pipe.close_read();

		ACE_exitcode status = 0;
		process.wait(&status);
		result.exitCode = process.return_value();
		LOG_DBG << fname << "<" << commandLine << "> exited with code <" << result.exitCode << ">, output size <" << result.output.size() << ">";
		return result;
	}

} // namespace killtree
